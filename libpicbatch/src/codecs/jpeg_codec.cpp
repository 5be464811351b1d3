#include "../../include/jpeg_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/exif_codec.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kTag = "jpeg_codec";
constexpr unsigned int kMaxMarkerData = 0xFFFF - 2;

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    picbatch::Logger::log(picbatch::LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief libjpeg warning/trace handler routed to the logger.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    picbatch::Logger::log(picbatch::LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

void install_error_handlers(JpegErrorMgr& mgr) {
    jpeg_std_error(&mgr.pub);
    mgr.pub.error_exit = jpeg_error_exit_throw;
    mgr.pub.output_message = jpeg_output_message_log;
}

/**
 * @brief RAII wrapper for a libjpeg decompressor.
 * Ensures jpeg_destroy_decompress is called even if exceptions occur.
 */
struct JpegRead {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegRead() {
        install_error_handlers(err);
        cinfo.err = &err.pub;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegRead() { jpeg_destroy_decompress(&cinfo); }

    JpegRead(const JpegRead&) = delete;
    JpegRead& operator=(const JpegRead&) = delete;
};

/**
 * @brief RAII wrapper for a libjpeg compressor writing to memory.
 * The buffer allocated by jpeg_mem_dest is released with the struct.
 */
struct JpegWrite {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    unsigned char* buffer = nullptr;
    unsigned long size = 0;

    JpegWrite() {
        install_error_handlers(err);
        cinfo.err = &err.pub;
        jpeg_create_compress(&cinfo);
    }
    ~JpegWrite() {
        jpeg_destroy_compress(&cinfo);
        std::free(buffer);
    }

    JpegWrite(const JpegWrite&) = delete;
    JpegWrite& operator=(const JpegWrite&) = delete;
};

/**
 * @brief Finds the first APP1 segment carrying an EXIF block.
 * @return The segment payload including the "Exif\0\0" preamble, or empty.
 */
std::vector<uint8_t> find_exif_marker(const j_decompress_ptr cinfo) {
    for (jpeg_saved_marker_ptr m = cinfo->marker_list; m; m = m->next) {
        if (m->marker != JPEG_APP0 + 1 || !m->data) continue;
        const std::span<const uint8_t> data(m->data, m->data_length);
        if (picbatch::has_exif_preamble(data)) {
            return {data.begin(), data.end()};
        }
    }
    return {};
}

/**
 * @brief Converts one CMYK scanline to RGB.
 * Adobe files store inverted CMYK, which is what libjpeg hands back for them.
 */
void cmyk_row_to_rgb(const uint8_t* src, uint8_t* dst, const JDIMENSION width, const bool inverted) {
    for (JDIMENSION x = 0; x < width; ++x) {
        int c = src[0], m = src[1], y = src[2], k = src[3];
        if (!inverted) {
            c = 255 - c; m = 255 - m; y = 255 - y; k = 255 - k;
        }
        dst[0] = static_cast<uint8_t>(c * k / 255);
        dst[1] = static_cast<uint8_t>(m * k / 255);
        dst[2] = static_cast<uint8_t>(y * k / 255);
        src += 4;
        dst += 3;
    }
}

} // namespace

namespace picbatch {

bool JpegCodec::matches_signature(const std::span<const uint8_t> data) const noexcept {
    return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

DecodedImage JpegCodec::decode(const std::span<const uint8_t> data) const {
    if (data.empty()) {
        throw ImageDecodeError("Empty JPEG input");
    }

    try {
        JpegRead rd;
        jpeg_mem_src(&rd.cinfo, data.data(), static_cast<unsigned long>(data.size()));
        jpeg_save_markers(&rd.cinfo, JPEG_APP0 + 1, 0xFFFF);

        if (jpeg_read_header(&rd.cinfo, TRUE) != JPEG_HEADER_OK) {
            throw ImageDecodeError("Invalid JPEG header");
        }

        const bool cmyk = rd.cinfo.jpeg_color_space == JCS_CMYK || rd.cinfo.jpeg_color_space == JCS_YCCK;
        rd.cinfo.out_color_space = cmyk ? JCS_CMYK : JCS_RGB;

        jpeg_start_decompress(&rd.cinfo);

        const auto width = rd.cinfo.output_width;
        const auto height = rd.cinfo.output_height;
        const int components = rd.cinfo.output_components;
        Logger::log(LogLevel::Debug,
                    "JPEG " + std::to_string(width) + "x" + std::to_string(height) +
                    (rd.cinfo.progressive_mode ? " progressive" : " baseline") + (cmyk ? " CMYK" : ""),
                    kTag);

        Image image = Image::blank(static_cast<int>(width), static_cast<int>(height), 3);
        std::vector<uint8_t> row(static_cast<std::size_t>(width) * components);

        while (rd.cinfo.output_scanline < height) {
            uint8_t* dst = image.mat().ptr<uint8_t>(static_cast<int>(rd.cinfo.output_scanline));
            if (cmyk) {
                JSAMPROW row_ptr = row.data();
                jpeg_read_scanlines(&rd.cinfo, &row_ptr, 1);
                cmyk_row_to_rgb(row.data(), dst, width, rd.cinfo.saw_Adobe_marker);
            } else {
                JSAMPROW row_ptr = dst;
                jpeg_read_scanlines(&rd.cinfo, &row_ptr, 1);
            }
        }

        DecodedImage out{std::move(image), find_exif_marker(&rd.cinfo)};
        jpeg_finish_decompress(&rd.cinfo);
        return out;
    } catch (const ImageDecodeError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw ImageDecodeError(std::string("JPEG decode failed: ") + e.what());
    }
}

std::vector<uint8_t> JpegCodec::encode(const Image& image, const EncodeOptions& options) const {
    if (image.empty()) {
        throw ImageEncodeError("Cannot encode an empty image as JPEG");
    }
    if (options.exif.size() + kExifPreamble.size() > kMaxMarkerData) {
        throw ImageEncodeError("EXIF block too large for an APP1 segment");
    }

    // jpeg has no alpha channel
    const Image rgb = image.without_alpha();

    try {
        JpegWrite wr;
        jpeg_mem_dest(&wr.cinfo, &wr.buffer, &wr.size);

        wr.cinfo.image_width = static_cast<JDIMENSION>(rgb.width());
        wr.cinfo.image_height = static_cast<JDIMENSION>(rgb.height());
        wr.cinfo.input_components = 3;
        wr.cinfo.in_color_space = JCS_RGB;

        jpeg_set_defaults(&wr.cinfo);
        jpeg_set_quality(&wr.cinfo, std::clamp(options.quality, 1, 100), TRUE);
        wr.cinfo.optimize_coding = TRUE;
        jpeg_simple_progression(&wr.cinfo);

        jpeg_start_compress(&wr.cinfo, TRUE);

        if (!options.exif.empty()) {
            std::vector<JOCTET> app1(kExifPreamble.begin(), kExifPreamble.end());
            app1.insert(app1.end(), options.exif.begin(), options.exif.end());
            jpeg_write_marker(&wr.cinfo, JPEG_APP0 + 1, app1.data(), static_cast<unsigned int>(app1.size()));
        }

        while (wr.cinfo.next_scanline < wr.cinfo.image_height) {
            // libjpeg takes non-const rows but only reads them
            JSAMPROW row_ptr = const_cast<uint8_t*>(rgb.mat().ptr<uint8_t>(static_cast<int>(wr.cinfo.next_scanline)));
            jpeg_write_scanlines(&wr.cinfo, &row_ptr, 1);
        }

        jpeg_finish_compress(&wr.cinfo);

        std::vector<uint8_t> out(wr.buffer, wr.buffer + wr.size);
        Logger::log(LogLevel::Debug,
                    "Encoded JPEG " + std::to_string(rgb.width()) + "x" + std::to_string(rgb.height()) +
                    " q=" + std::to_string(options.quality) + ": " + std::to_string(out.size()) + " bytes",
                    kTag);
        return out;
    } catch (const std::runtime_error& e) {
        throw ImageEncodeError(std::string("JPEG encode failed: ") + e.what());
    }
}

} // namespace picbatch

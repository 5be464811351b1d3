#include "../../include/png_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kTag = "png_codec";

/**
 * @brief libpng error handler that throws a C++ exception.
 * @param msg The error message from libpng.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    picbatch::Logger::log(picbatch::LogLevel::Error, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

/**
 * @brief libpng warning handler.
 * @param msg The warning message from libpng.
 */
void png_warning_fn(png_structp, const png_const_charp msg) {
    picbatch::Logger::log(picbatch::LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
}

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 * Ensures png_destroy_read_struct is called even if exceptions occur.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngRead() = default;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

/**
 * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
 * Ensures png_destroy_write_struct is called even if exceptions occur.
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngWrite() = default;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

/// Cursor over the input buffer for png_set_read_fn.
struct MemoryReader {
    std::span<const uint8_t> data;
    std::size_t pos = 0;
};

void read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
    auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
    if (length > reader->data.size() - reader->pos) {
        png_error(png, "Read past end of PNG data");
    }
    std::memcpy(out, reader->data.data() + reader->pos, length);
    reader->pos += length;
}

void write_to_vector(const png_structp png, const png_bytep in, const png_size_t length) {
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), in, in + length);
}

void flush_noop(png_structp) {}

/**
 * @brief Packs RGBA color components into a single 32-bit integer.
 * @return The packed 32-bit color value.
 */
inline uint32_t pack_rgba(unsigned char r, unsigned char g, unsigned char b, unsigned char a) {
    return (static_cast<uint32_t>(r) << 24) |
           (static_cast<uint32_t>(g) << 16) |
           (static_cast<uint32_t>(b) << 8)  |
           (static_cast<uint32_t>(a));
}

/**
 * @brief Reads and decodes a PNG into an 8-bit RGBA matrix.
 * @param png The libpng read struct.
 * @param info The libpng info struct.
 * @return Pixels as CV_8UC4.
 */
cv::Mat read_to_rgba8(png_structp png, png_infop info) {
    png_uint_32 width, height;
    int bit_depth, color_type;
    png_get_IHDR(png, info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    if (bit_depth == 16) png_set_strip_16(png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
    if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
    if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
    png_set_interlace_handling(png);

    png_read_update_info(png, info);
    // now, the buffer is guaranteed to be rgba8

    const size_t rowbytes = png_get_rowbytes(png, info);
    if (rowbytes != static_cast<size_t>(width) * 4) {
        throw std::runtime_error("Rowbytes mismatch, expected RGBA8");
    }

    cv::Mat image(static_cast<int>(height), static_cast<int>(width), CV_8UC4);
    std::vector<png_bytep> row_pointers(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        row_pointers[y] = image.ptr<uint8_t>(static_cast<int>(y));
    }

    png_read_image(png, row_pointers.data());
    png_read_end(png, info);

    return image;
}

/// Output colour type chosen from the pixel analysis.
struct PngLayout {
    int color_type = PNG_COLOR_TYPE_RGBA;
    std::map<uint32_t, uint8_t> color_to_index;
    std::vector<png_color> palette;
    std::vector<png_byte> transparency;
    bool all_opaque = true;
};

PngLayout analyze(const cv::Mat& rgba) {
    PngLayout layout;
    bool all_gray = true;
    bool can_use_palette = true;

    for (int y = 0; y < rgba.rows; ++y) {
        const unsigned char* p = rgba.ptr<uint8_t>(y);
        for (int x = 0; x < rgba.cols; ++x) {
            const unsigned char r = p[0], g = p[1], b = p[2], a = p[3];

            if (r != g || g != b) all_gray = false;
            if (a != 0xFF) layout.all_opaque = false;

            if (can_use_palette) {
                const uint32_t color = pack_rgba(r, g, b, a);
                if (layout.color_to_index.find(color) == layout.color_to_index.end()) {
                    if (layout.color_to_index.size() >= 256) {
                        can_use_palette = false;
                    } else {
                        const auto index = static_cast<uint8_t>(layout.color_to_index.size());
                        layout.color_to_index[color] = index;
                        layout.palette.push_back({r, g, b});
                        layout.transparency.push_back(a);
                    }
                }
            }
            p += 4;
        }
    }

    if (can_use_palette) {
        layout.color_type = PNG_COLOR_TYPE_PALETTE;
    } else if (all_gray && layout.all_opaque) {
        layout.color_type = PNG_COLOR_TYPE_GRAY;
    } else if (all_gray) {
        layout.color_type = PNG_COLOR_TYPE_GA;
    } else if (layout.all_opaque) {
        layout.color_type = PNG_COLOR_TYPE_RGB;
    } else {
        layout.color_type = PNG_COLOR_TYPE_RGBA;
    }
    return layout;
}

} // namespace

namespace picbatch {

bool PngCodec::matches_signature(const std::span<const uint8_t> data) const noexcept {
    return data.size() >= 8 && png_sig_cmp(data.data(), 0, 8) == 0;
}

DecodedImage PngCodec::decode(const std::span<const uint8_t> data) const {
    if (!matches_signature(data)) {
        throw ImageDecodeError("Not a PNG file");
    }

    try {
        PngRead rd;
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
        png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);

        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
        if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng read error");

        MemoryReader reader{data, 0};
        png_set_read_fn(rd.png, &reader, read_from_memory);
        png_read_info(rd.png, rd.info);

        const int source_type = png_get_color_type(rd.png, rd.info);
        const bool has_alpha = (source_type & PNG_COLOR_MASK_ALPHA) ||
                               png_get_valid(rd.png, rd.info, PNG_INFO_tRNS);

        Image image(read_to_rgba8(rd.png, rd.info));
        if (!has_alpha) image = image.without_alpha();

        std::vector<uint8_t> exif;
        png_uint_32 exif_len = 0;
        png_bytep exif_data = nullptr;
        if (png_get_eXIf_1(rd.png, rd.info, &exif_len, &exif_data) != 0 && exif_data && exif_len > 0) {
            exif.assign(exif_data, exif_data + exif_len);
        }

        Logger::log(LogLevel::Debug,
                    "PNG " + std::to_string(image.width()) + "x" + std::to_string(image.height()) +
                    (has_alpha ? " with alpha" : "") + ", eXIf " + std::to_string(exif.size()) + " bytes",
                    kTag);
        return {std::move(image), std::move(exif)};
    } catch (const std::runtime_error& e) {
        throw ImageDecodeError(std::string("PNG decode failed: ") + e.what());
    }
}

std::vector<uint8_t> PngCodec::encode(const Image& image, const EncodeOptions&) const {
    if (image.empty()) {
        throw ImageEncodeError("Cannot encode an empty image as PNG");
    }

    const Image rgba = image.with_alpha();
    const PngLayout layout = analyze(rgba.mat());
    const auto width = static_cast<png_uint_32>(rgba.width());
    const auto height = static_cast<png_uint_32>(rgba.height());

    std::vector<uint8_t> out;
    try {
        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
        png_set_error_fn(wr.png, nullptr, png_error_fn, png_warning_fn);
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw std::runtime_error("png_create_info_struct failed");
        if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

        png_set_write_fn(wr.png, &out, write_to_vector, flush_noop);

        // set max compression
        png_set_compression_level(wr.png, 9);
        png_set_compression_mem_level(wr.png, 9);
        png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

        png_set_IHDR(wr.png, wr.info, width, height, 8, layout.color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

        if (layout.color_type == PNG_COLOR_TYPE_PALETTE) {
            png_set_PLTE(wr.png, wr.info, layout.palette.data(), static_cast<int>(layout.palette.size()));
            // only write tRNS if there is actual transparency
            if (!layout.all_opaque) {
                png_set_tRNS(wr.png, wr.info, layout.transparency.data(),
                             static_cast<int>(layout.transparency.size()), nullptr);
            }
        }

        png_write_info(wr.png, wr.info);

        const png_size_t out_channels = png_get_channels(wr.png, wr.info);
        std::vector<unsigned char> out_rowbuf(static_cast<size_t>(width) * out_channels);
        png_bytep out_row = out_rowbuf.data();

        for (png_uint_32 y = 0; y < height; ++y) {
            const unsigned char* src = rgba.mat().ptr<uint8_t>(static_cast<int>(y));
            unsigned char* dst = out_row;

            if (layout.color_type == PNG_COLOR_TYPE_PALETTE) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = layout.color_to_index.at(pack_rgba(src[0], src[1], src[2], src[3]));
                    src += 4;
                    dst += 1;
                }
            } else if (layout.color_type == PNG_COLOR_TYPE_GRAY) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = src[0]; // r = g = b
                    src += 4;
                    dst += 1;
                }
            } else if (layout.color_type == PNG_COLOR_TYPE_GA) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = src[0]; // r = g = b
                    dst[1] = src[3]; // alpha
                    src += 4;
                    dst += 2;
                }
            } else if (layout.color_type == PNG_COLOR_TYPE_RGB) {
                for (png_uint_32 x = 0; x < width; ++x) {
                    dst[0] = src[0];
                    dst[1] = src[1];
                    dst[2] = src[2];
                    src += 4;
                    dst += 3;
                }
            } else { // RGBA
                std::memcpy(dst, src, static_cast<size_t>(width) * 4);
            }

            png_write_rows(wr.png, &out_row, 1);
        }

        png_write_end(wr.png, wr.info);
    } catch (const std::runtime_error& e) {
        throw ImageEncodeError(std::string("PNG encode failed: ") + e.what());
    }

    Logger::log(LogLevel::Debug,
                "Encoded PNG " + std::to_string(width) + "x" + std::to_string(height) +
                " color type " + std::to_string(layout.color_type) + ": " + std::to_string(out.size()) + " bytes",
                kTag);
    return out;
}

} // namespace picbatch

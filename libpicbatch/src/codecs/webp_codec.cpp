#include "../../include/webp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kTag = "webp_codec";

struct WebPFreeDeleter {
    void operator()(uint8_t* p) const { WebPFree(p); }
};
using unique_webp_buffer = std::unique_ptr<uint8_t, WebPFreeDeleter>;

struct WebPMuxDeleter {
    void operator()(WebPMux* m) const { WebPMuxDelete(m); }
};
using unique_mux = std::unique_ptr<WebPMux, WebPMuxDeleter>;

/**
 * @brief RAII wrapper for a WebPPicture and the memory writer it feeds.
 */
struct WebpWrite {
    WebPPicture picture{};
    WebPMemoryWriter writer{};

    WebpWrite() {
        if (!WebPPictureInit(&picture)) {
            throw picbatch::ImageEncodeError("WebPPictureInit failed");
        }
        WebPMemoryWriterInit(&writer);
        picture.writer = WebPMemoryWrite;
        picture.custom_ptr = &writer;
    }
    ~WebpWrite() {
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
    }

    WebpWrite(const WebpWrite&) = delete;
    WebpWrite& operator=(const WebpWrite&) = delete;
};

std::vector<uint8_t> read_exif_chunk(const std::span<const uint8_t> data) {
    const WebPData input{data.data(), data.size()};
    const unique_mux mux(WebPMuxCreate(&input, 0));
    if (!mux) {
        picbatch::Logger::log(picbatch::LogLevel::Debug, "WebPMuxCreate failed, no EXIF read", kTag);
        return {};
    }
    WebPData chunk{};
    if (WebPMuxGetChunk(mux.get(), "EXIF", &chunk) != WEBP_MUX_OK || !chunk.bytes) {
        return {};
    }
    return {chunk.bytes, chunk.bytes + chunk.size};
}

} // namespace

namespace picbatch {

bool WebpCodec::matches_signature(const std::span<const uint8_t> data) const noexcept {
    return data.size() >= 12 &&
           std::memcmp(data.data(), "RIFF", 4) == 0 &&
           std::memcmp(data.data() + 8, "WEBP", 4) == 0;
}

DecodedImage WebpCodec::decode(const std::span<const uint8_t> data) const {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        throw ImageDecodeError("WebP feature detection failed");
    }
    if (features.has_animation) {
        throw ImageDecodeError("Animated WebP is not supported");
    }

    int width = 0, height = 0;
    const int channels = features.has_alpha ? 4 : 3;
    const unique_webp_buffer decoded(features.has_alpha
        ? WebPDecodeRGBA(data.data(), data.size(), &width, &height)
        : WebPDecodeRGB(data.data(), data.size(), &width, &height));
    if (!decoded) {
        throw ImageDecodeError("WebP decode failed");
    }

    Image image = Image::blank(width, height, channels);
    const std::size_t row_bytes = static_cast<std::size_t>(width) * channels;
    for (int y = 0; y < height; ++y) {
        std::memcpy(image.mat().ptr<uint8_t>(y), decoded.get() + static_cast<std::size_t>(y) * row_bytes, row_bytes);
    }

    std::vector<uint8_t> exif = read_exif_chunk(data);
    Logger::log(LogLevel::Debug,
                "WebP " + std::to_string(width) + "x" + std::to_string(height) +
                (features.format == 2 ? " lossless" : " lossy") + ", EXIF " + std::to_string(exif.size()) + " bytes",
                kTag);
    return {std::move(image), std::move(exif)};
}

std::vector<uint8_t> WebpCodec::encode(const Image& image, const EncodeOptions& options) const {
    if (image.empty()) {
        throw ImageEncodeError("Cannot encode an empty image as WebP");
    }

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw ImageEncodeError("WebPConfigInit failed");
    }
    config.quality = static_cast<float>(std::clamp(options.quality, 1, 100));
    config.method = 4;
    if (!WebPValidateConfig(&config)) {
        throw ImageEncodeError("Invalid WebP encoder configuration");
    }

    WebpWrite wr;
    wr.picture.width = image.width();
    wr.picture.height = image.height();

    const std::vector<uint8_t> pixels = image.packed();
    const int stride = image.width() * image.channels();
    const int imported = image.has_alpha()
        ? WebPPictureImportRGBA(&wr.picture, pixels.data(), stride)
        : WebPPictureImportRGB(&wr.picture, pixels.data(), stride);
    if (!imported) {
        throw ImageEncodeError("WebPPictureImport failed");
    }

    if (!WebPEncode(&config, &wr.picture)) {
        throw ImageEncodeError("WebPEncode failed, error code " + std::to_string(wr.picture.error_code));
    }

    std::vector<uint8_t> out(wr.writer.mem, wr.writer.mem + wr.writer.size);
    Logger::log(LogLevel::Debug,
                "Encoded WebP " + std::to_string(image.width()) + "x" + std::to_string(image.height()) +
                " q=" + std::to_string(options.quality) + ": " + std::to_string(out.size()) + " bytes",
                kTag);
    return out;
}

} // namespace picbatch

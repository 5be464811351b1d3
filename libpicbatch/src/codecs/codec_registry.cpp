#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"

namespace picbatch {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
}

IImageCodec* CodecRegistry::find_by_mime(const std::string& mime) const {
    for (const auto& codec_ptr : codecs_) {
        for (const auto supported_mime : codec_ptr->get_supported_mime_types()) {
            if (supported_mime == mime) {
                return codec_ptr.get();
            }
        }
    }
    return nullptr;
}

IImageCodec* CodecRegistry::find_by_format(const ImageFormat format) const {
    for (const auto& codec_ptr : codecs_) {
        if (codec_ptr->get_format() == format) {
            return codec_ptr.get();
        }
    }
    return nullptr;
}

IImageCodec* CodecRegistry::find_for_content(const std::span<const uint8_t> data) const {
    const std::string mime = MimeDetector::detect(data);
    if (!mime.empty()) {
        if (IImageCodec* codec = find_by_mime(mime)) {
            return codec;
        }
        Logger::log(LogLevel::Debug, "libmagic reports " + mime + ", trying signatures", "codec_registry");
    }
    for (const auto& codec_ptr : codecs_) {
        if (codec_ptr->matches_signature(data)) {
            return codec_ptr.get();
        }
    }
    return nullptr;
}

} // namespace picbatch

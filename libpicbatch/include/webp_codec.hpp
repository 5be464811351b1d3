/**
 * @file webp_codec.hpp
 * @brief Defines the IImageCodec implementation for WebP files using libwebp.
 */

#ifndef PICBATCH_WEBP_CODEC_HPP
#define PICBATCH_WEBP_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace picbatch {

    /**
     * @brief Implements IImageCodec for WebP files using libwebp and libwebpmux.
     *
     * @details Decoding yields RGB or RGBA depending on the bitstream's
     * alpha flag; the EXIF payload comes from the RIFF "EXIF" chunk.
     * Encoding is lossy at options.quality. EXIF is never written.
     */
    class WebpCodec final : public IImageCodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Webp; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/webp", "image/x-webp" };
            return {kMimes.data(), kMimes.size()};
        }

        // --- capabilities ---
        [[nodiscard]] bool can_embed_exif() const noexcept override { return false; }
        [[nodiscard]] bool matches_signature(std::span<const uint8_t> data) const noexcept override;

        // --- operations ---
        [[nodiscard]] DecodedImage decode(std::span<const uint8_t> data) const override;
        [[nodiscard]] std::vector<uint8_t> encode(const Image& image, const EncodeOptions& options) const override;
    };

} // namespace picbatch

#endif // PICBATCH_WEBP_CODEC_HPP

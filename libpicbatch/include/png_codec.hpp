/**
 * @file png_codec.hpp
 * @brief Defines the IImageCodec implementation for PNG files using libpng.
 */

#ifndef PICBATCH_PNG_CODEC_HPP
#define PICBATCH_PNG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace picbatch {

    /**
     * @brief Implements IImageCodec for PNG files using libpng.
     *
     * @details Decoding expands every PNG flavour to 8-bit RGB, or RGBA
     * when the source carries alpha or tRNS, and returns the eXIf chunk.
     * Encoding analyses the pixels and picks the smallest lossless colour
     * type (palette, gray, gray+alpha, RGB, RGBA) at compression level 9.
     * EXIF is never written.
     */
    class PngCodec final : public IImageCodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Png; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/x-png" };
            return {kMimes.data(), kMimes.size()};
        }

        // --- capabilities ---
        [[nodiscard]] bool can_embed_exif() const noexcept override { return false; }
        [[nodiscard]] bool matches_signature(std::span<const uint8_t> data) const noexcept override;

        // --- operations ---
        [[nodiscard]] DecodedImage decode(std::span<const uint8_t> data) const override;

        /**
         * @brief Losslessly encodes @p image; options are ignored.
         * @throws ImageEncodeError on libpng failure.
         */
        [[nodiscard]] std::vector<uint8_t> encode(const Image& image, const EncodeOptions& options) const override;
    };

} // namespace picbatch

#endif // PICBATCH_PNG_CODEC_HPP

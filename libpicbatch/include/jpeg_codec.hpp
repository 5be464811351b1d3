/**
 * @file jpeg_codec.hpp
 * @brief Defines the IImageCodec implementation for JPEG files.
 */

#ifndef PICBATCH_JPEG_CODEC_HPP
#define PICBATCH_JPEG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace picbatch {

    /**
     * @brief Implements IImageCodec for JPEG files using libjpeg.
     *
     * @details Decoding yields RGB pixels (grayscale and CMYK sources are
     * converted) and the payload of the first APP1 "Exif" segment.
     * Encoding writes a progressive JPEG with optimized Huffman tables;
     * an alpha channel is dropped.
     */
    class JpegCodec final : public IImageCodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override { return ImageFormat::Jpeg; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        // --- capabilities ---
        [[nodiscard]] bool can_embed_exif() const noexcept override { return true; }
        [[nodiscard]] bool matches_signature(std::span<const uint8_t> data) const noexcept override;

        // --- operations ---

        /**
         * @brief Decodes a JPEG held in memory.
         * @throws ImageDecodeError if libjpeg encounters a fatal error.
         */
        [[nodiscard]] DecodedImage decode(std::span<const uint8_t> data) const override;

        /**
         * @brief Encodes a progressive JPEG at options.quality.
         *
         * When options.exif is non-empty it is written as an APP1 segment
         * right after SOI/JFIF, prefixed with "Exif\0\0".
         *
         * @throws ImageEncodeError if libjpeg fails or the EXIF block does
         * not fit a single APP1 segment.
         */
        [[nodiscard]] std::vector<uint8_t> encode(const Image& image, const EncodeOptions& options) const override;
    };

} // namespace picbatch

#endif // PICBATCH_JPEG_CODEC_HPP

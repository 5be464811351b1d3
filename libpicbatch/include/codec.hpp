/**
 * @file codec.hpp
 * @brief Interface implemented by every image format backend.
 */

#ifndef PICBATCH_CODEC_HPP
#define PICBATCH_CODEC_HPP

#include "image.hpp"
#include "image_format.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace picbatch {

/// Settings for one encode call.
struct EncodeOptions {
    int quality = 85;                  ///< 1..100, ignored by lossless formats
    std::span<const uint8_t> exif;     ///< TIFF block to embed (no preamble); empty for none
};

/**
 * @brief Interface for an image format backend in picbatch.
 *
 * Each implementation wraps one C library and works entirely in memory:
 * decode() turns file bytes into pixels plus the raw EXIF payload of the
 * container, encode() turns pixels into file bytes.
 *
 * Implementations are stateless; the CodecRegistry owns one instance of
 * each and hands out non-owning pointers.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "JpegCodec").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    [[nodiscard]] virtual ImageFormat get_format() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_mime_types() const noexcept = 0;

    // --- capabilities ---

    /// @return True if encode() writes EncodeOptions::exif into the output.
    [[nodiscard]] virtual bool can_embed_exif() const noexcept = 0;

    /// @return True if @p data starts with this format's file signature.
    [[nodiscard]] virtual bool matches_signature(std::span<const uint8_t> data) const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decodes a complete file held in memory.
     * @throws ImageDecodeError if the data is not a decodable image.
     */
    [[nodiscard]] virtual DecodedImage decode(std::span<const uint8_t> data) const = 0;

    /**
     * @brief Encodes @p image into a complete file.
     * @throws ImageEncodeError if the library rejects the pixels or settings.
     */
    [[nodiscard]] virtual std::vector<uint8_t> encode(const Image& image, const EncodeOptions& options) const = 0;
};

} // namespace picbatch

#endif // PICBATCH_CODEC_HPP

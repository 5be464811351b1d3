/**
 * @file exif_codec.hpp
 * @brief Reads and writes the TIFF structured EXIF block through Exiv2.
 *
 * Two flavours per direction:
 * - try_decode_exif() / encode_exif() throw MetadataDecodeError /
 *   MetadataEncodeError with the reason.
 * - decode_exif() / try_encode_exif() never throw: metadata is auxiliary
 *   and must not stop an image from being processed, so a failure logs a
 *   warning and yields an empty document / std::nullopt.
 */

#ifndef PICBATCH_EXIF_CODEC_HPP
#define PICBATCH_EXIF_CODEC_HPP

#include "exif_document.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace picbatch {

/// "Exif\0\0", the identifier that precedes the TIFF header in a JPEG APP1 segment.
inline constexpr std::array<uint8_t, 6> kExifPreamble = {'E', 'x', 'i', 'f', 0, 0};

/// Largest TIFF block that still fits a JPEG APP1 segment next to the preamble.
inline constexpr std::size_t kMaxExifPayload = 0xFFFF - 2 - kExifPreamble.size();

/**
 * @brief Parses an EXIF block.
 * @param payload TIFF bytes, with or without the "Exif\0\0" preamble.
 * @return The decoded document. Entries outside the five sections
 * (maker note directories, sub-images) and field types outside TIFF 6.0
 * are not kept.
 * @throws MetadataDecodeError when the block is too short, has no valid
 * TIFF header, or Exiv2 reports a damaged directory (offsets or values
 * outside the block, a truncated IFD, an IFD cycle).
 */
[[nodiscard]] ExifDocument try_decode_exif(std::span<const uint8_t> payload);

/**
 * @brief Parses an EXIF block, falling back to an empty document.
 * @param payload TIFF bytes, with or without the preamble. Empty input
 * yields an empty document without a warning.
 */
[[nodiscard]] ExifDocument decode_exif(std::span<const uint8_t> payload) noexcept;

/**
 * @brief Serializes a document into TIFF bytes (no preamble).
 *
 * Sub-IFDs without tags are omitted together with their pointer. Values
 * are written in the document's byte order. A thumbnail is described in
 * IFD1 as JPEG (Compression 6).
 *
 * @throws MetadataEncodeError if a value's payload does not match its
 * type, an integer or rational component is out of range for the type,
 * the type code is unknown, Exiv2 would have to drop an oversized tag,
 * or the block exceeds kMaxExifPayload.
 */
[[nodiscard]] std::vector<uint8_t> encode_exif(const ExifDocument& doc);

/**
 * @brief Serializes a document, returning std::nullopt on failure.
 */
[[nodiscard]] std::optional<std::vector<uint8_t>> try_encode_exif(const ExifDocument& doc) noexcept;

/// @return True when @p payload starts with "Exif\0\0".
[[nodiscard]] bool has_exif_preamble(std::span<const uint8_t> payload) noexcept;

} // namespace picbatch

#endif // PICBATCH_EXIF_CODEC_HPP

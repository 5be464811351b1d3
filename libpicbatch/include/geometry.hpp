/**
 * @file geometry.hpp
 * @brief Output dimension rules, resampling and EXIF orientation handling.
 */

#ifndef PICBATCH_GEOMETRY_HPP
#define PICBATCH_GEOMETRY_HPP

#include "exif_document.hpp"
#include "image.hpp"
#include <optional>
#include <string_view>

namespace picbatch {

/// Which dimension the resize value drives.
enum class ResizeMode {
    Percent, ///< both axes scaled by value/100
    Width,   ///< width = value, height follows the aspect ratio
    Height   ///< height = value, width follows the aspect ratio
};

inline constexpr int kMinResizeValue = 1;
inline constexpr int kMaxResizeValue = 10000;

struct ResizeSpec {
    ResizeMode mode = ResizeMode::Percent;
    int value = 50;
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size&) const = default;
};

/// @return "percent", "width" or "height".
std::string_view resize_mode_name(ResizeMode mode) noexcept;

/// Parses "percent", "width" or "height" (case-insensitive).
std::optional<ResizeMode> parse_resize_mode(std::string_view name);

/**
 * @brief Output dimensions for @p original under @p spec.
 *
 * The derived axis is rounded down and never drops below one pixel.
 * Percent values below 1 are clamped to 1.
 *
 * @throws std::invalid_argument if @p original is not positive, or a
 * Width/Height value lies outside [kMinResizeValue, kMaxResizeValue].
 */
[[nodiscard]] Size compute_target_size(Size original, const ResizeSpec& spec);

/**
 * @brief Resamples @p image to compute_target_size().
 *
 * Area averaging when shrinking, Lanczos when enlarging. Returns a new
 * image; the input pixels are untouched.
 */
[[nodiscard]] Image resize(const Image& image, const ResizeSpec& spec);

/**
 * @return The Primary Orientation tag when it holds a value in 1..8.
 */
[[nodiscard]] std::optional<int> orientation_of(const ExifDocument& doc);

/**
 * @brief Physically applies the document's orientation to @p image.
 *
 * For orientations 2..8 the pixels are flipped/rotated into upright
 * position and the Orientation tag is removed from @p doc, so viewers do
 * not rotate the output a second time. Orientation 1, or a missing or
 * invalid tag, leaves both unchanged.
 *
 * @return The upright image.
 */
[[nodiscard]] Image apply_orientation(const Image& image, ExifDocument& doc);

} // namespace picbatch

#endif // PICBATCH_GEOMETRY_HPP

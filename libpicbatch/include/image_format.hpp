/**
 * @file image_format.hpp
 * @brief The image formats picbatch reads and writes, and conversions
 * between the enum, extensions and display names.
 */

#ifndef PICBATCH_IMAGE_FORMAT_HPP
#define PICBATCH_IMAGE_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace picbatch {

/**
 * @brief Enumerates the raster formats handled by the codecs.
 */
enum class ImageFormat {
    Jpeg,
    Png,
    Webp,
    Unknown
};

/**
 * @brief Extension written after the generated base name.
 * @param fmt The ImageFormat enum value.
 * @return "jpg", "png", "webp" or "bin" for Unknown.
 */
inline std::string image_format_extension(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Png:  return "png";
        case ImageFormat::Webp: return "webp";
        default:                return "bin";
    }
}

/**
 * @brief Upper-case name shown in the report's format column.
 * @param fmt The ImageFormat enum value.
 * @return "JPEG", "PNG", "WEBP" or "UNKNOWN".
 */
inline std::string image_format_to_string(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Png:  return "PNG";
        case ImageFormat::Webp: return "WEBP";
        default:                return "UNKNOWN";
    }
}

/**
 * @brief Parses a user supplied format name or file extension.
 *
 * Case-insensitive, a leading dot is ignored: "jpg", ".JPEG", "Png" and
 * "webp" all parse.
 *
 * @param str The string to parse.
 * @return The format, or std::nullopt if the name is not recognised.
 */
inline std::optional<ImageFormat> parse_image_format(std::string_view str) {
    std::string s(str);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (!s.empty() && s.front() == '.') s.erase(0, 1);

    if (s == "jpg" || s == "jpeg" || s == "jpe") return ImageFormat::Jpeg;
    if (s == "png")  return ImageFormat::Png;
    if (s == "webp") return ImageFormat::Webp;
    return std::nullopt;
}

} // namespace picbatch

#endif // PICBATCH_IMAGE_FORMAT_HPP

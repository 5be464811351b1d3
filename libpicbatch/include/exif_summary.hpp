/**
 * @file exif_summary.hpp
 * @brief Human readable projection of an ExifDocument for previews and reports.
 */

#ifndef PICBATCH_EXIF_SUMMARY_HPP
#define PICBATCH_EXIF_SUMMARY_HPP

#include "exif_document.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace picbatch {

/**
 * @brief Camera, software, timestamp and lens fields of a document.
 *
 * Each optional field is set only when the underlying tag exists.
 */
struct MetadataSummary {
    std::optional<std::string> camera_make;
    std::optional<std::string> camera_model;
    std::optional<std::string> software;
    std::optional<std::string> date_time;  ///< raw EXIF timestamp, e.g. "2023:09:10 14:23:11"
    std::optional<std::string> lens;
    bool gps_present = false;

    /// @return Make and model joined by a space, either may be missing; empty if both are.
    [[nodiscard]] std::string camera() const;

    /// @return "Yes" or "No".
    [[nodiscard]] std::string_view gps_label() const noexcept { return gps_present ? "Yes" : "No"; }
};

/**
 * @brief Projects @p doc into a MetadataSummary.
 *
 * The date is the Primary DateTime tag, else the Capture DateTimeOriginal
 * tag. Never throws on odd contents: text is decoded leniently.
 */
[[nodiscard]] MetadataSummary summarize(const ExifDocument& doc);

/**
 * @brief Turns raw tag bytes into valid UTF-8.
 *
 * Trailing NULs are dropped and every byte that does not start a valid
 * UTF-8 sequence becomes U+FFFD.
 */
[[nodiscard]] std::string decode_text_lenient(std::string_view raw);

/**
 * @brief Display text of a tag value.
 * @return The decoded text for Ascii and byte values, the decimal
 * numbers separated by spaces for integers, "n/d" pairs for rationals.
 */
[[nodiscard]] std::string value_to_text(const ExifValue& value);

} // namespace picbatch

#endif // PICBATCH_EXIF_SUMMARY_HPP

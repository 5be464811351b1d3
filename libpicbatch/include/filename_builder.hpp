/**
 * @file filename_builder.hpp
 * @brief Renders output base names from a user supplied template.
 *
 * Supported placeholders:
 * - `{index}`: 1-based position in the batch; `{index:03}` zero-pads to
 *   three digits, `{index:3}` pads with spaces.
 * - `{name}`: original base name without extension, every run of
 *   non-word characters collapsed to one underscore. Word characters are
 *   ASCII letters, digits and '_' plus non-ASCII letters and digits;
 *   Unicode punctuation, symbols, spaces and invalid UTF-8 are not.
 * - `{date}`: capture date as YYYYMMDD, empty when unknown.
 *
 * `{{` and `}}` produce literal braces.
 */

#ifndef PICBATCH_FILENAME_BUILDER_HPP
#define PICBATCH_FILENAME_BUILDER_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace picbatch {

/**
 * @brief Checks a template without rendering it.
 * @throws UnsupportedTokenError for an unknown placeholder.
 * @throws FormatError for unbalanced braces or a malformed format spec.
 */
void validate_pattern(std::string_view pattern);

/**
 * @brief Renders @p pattern for one batch item.
 * @param pattern Naming template.
 * @param index 1-based item index.
 * @param original_name Input file name, used by `{name}`.
 * @param date_time Raw EXIF timestamp, used by `{date}`.
 * @return The base name, without extension.
 * @throws UnsupportedTokenError, FormatError as validate_pattern().
 */
[[nodiscard]] std::string build_name(std::string_view pattern,
                                     std::size_t index,
                                     std::string_view original_name,
                                     const std::optional<std::string>& date_time);

/**
 * @brief Parses an EXIF timestamp.
 *
 * Accepts "YYYY:MM:DD HH:MM:SS" and "YYYY-MM-DD HH:MM:SS". The date must
 * exist in the calendar with a year from 0001 on, and the time must be
 * in range.
 *
 * @return The calendar date, or std::nullopt when the text does not parse.
 */
[[nodiscard]] std::optional<std::chrono::year_month_day> parse_capture_date(std::string_view text);

/// @return @p name's stem with each run of non-word characters replaced by '_'.
[[nodiscard]] std::string normalize_stem(std::string_view name);

} // namespace picbatch

#endif // PICBATCH_FILENAME_BUILDER_HPP

/**
 * @file exif_sanitizer.hpp
 * @brief Policy driven removal of location and identifying tags.
 */

#ifndef PICBATCH_EXIF_SANITIZER_HPP
#define PICBATCH_EXIF_SANITIZER_HPP

#include "exif_document.hpp"

namespace picbatch {

/**
 * @brief Returns a redacted copy of @p doc.
 *
 * - @p strip_gps empties the Location section.
 * - @p strip_serials removes BodySerialNumber and LensSerialNumber from
 *   the Capture section and CameraOwnerName from the Primary section.
 *
 * Every other tag, the thumbnail and the byte order are kept. The input
 * is never modified and applying the same flags twice changes nothing.
 */
[[nodiscard]] ExifDocument sanitize(const ExifDocument& doc, bool strip_gps, bool strip_serials);

} // namespace picbatch

#endif // PICBATCH_EXIF_SANITIZER_HPP

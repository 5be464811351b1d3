/**
 * @file exif_tags.hpp
 * @brief Numeric EXIF tag identifiers used by the pipeline.
 */

#ifndef PICBATCH_EXIF_TAGS_HPP
#define PICBATCH_EXIF_TAGS_HPP

#include <cstdint>

namespace picbatch::tags {

// primary (0th) IFD, also used by IFD1
inline constexpr uint16_t kCompression     = 0x0103;
inline constexpr uint16_t kMake            = 0x010F;
inline constexpr uint16_t kModel           = 0x0110;
inline constexpr uint16_t kOrientation     = 0x0112;
inline constexpr uint16_t kXResolution     = 0x011A;
inline constexpr uint16_t kSoftware        = 0x0131;
inline constexpr uint16_t kDateTime        = 0x0132;
inline constexpr uint16_t kArtist          = 0x013B;

// capture (Exif) IFD
inline constexpr uint16_t kExposureTime     = 0x829A;
inline constexpr uint16_t kIsoSpeed         = 0x8827;
inline constexpr uint16_t kDateTimeOriginal = 0x9003;
inline constexpr uint16_t kMakerNote        = 0x927C;
inline constexpr uint16_t kCameraOwnerName  = 0xA430;
inline constexpr uint16_t kBodySerialNumber = 0xA431;
inline constexpr uint16_t kLensModel        = 0xA434;
inline constexpr uint16_t kLensSerialNumber = 0xA435;

// location (GPS) IFD
inline constexpr uint16_t kGpsVersionId   = 0x0000;
inline constexpr uint16_t kGpsLatitudeRef = 0x0001;
inline constexpr uint16_t kGpsLatitude    = 0x0002;
inline constexpr uint16_t kGpsLongitudeRef = 0x0003;
inline constexpr uint16_t kGpsLongitude   = 0x0004;

// structural pointers, owned by the codec and never stored in a section
inline constexpr uint16_t kExifIfdPointer    = 0x8769;
inline constexpr uint16_t kGpsIfdPointer     = 0x8825;
inline constexpr uint16_t kInteropIfdPointer = 0xA005;
inline constexpr uint16_t kThumbnailOffset   = 0x0201;
inline constexpr uint16_t kThumbnailLength   = 0x0202;

/// @return True for tags the codec writes itself (IFD pointers, thumbnail location).
constexpr bool is_structural(const uint16_t tag) noexcept {
    return tag == kExifIfdPointer || tag == kGpsIfdPointer || tag == kInteropIfdPointer ||
           tag == kThumbnailOffset || tag == kThumbnailLength;
}

} // namespace picbatch::tags

#endif // PICBATCH_EXIF_TAGS_HPP

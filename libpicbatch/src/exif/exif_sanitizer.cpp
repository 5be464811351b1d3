#include "../../include/exif_sanitizer.hpp"
#include "../../include/exif_tags.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <string>
#include <utility>

namespace picbatch {

namespace {

constexpr std::array<std::pair<ExifSection, uint16_t>, 3> kSerialTags = {{
    {ExifSection::Capture, tags::kBodySerialNumber},
    {ExifSection::Capture, tags::kLensSerialNumber},
    {ExifSection::Primary, tags::kCameraOwnerName},
}};

} // namespace

ExifDocument sanitize(const ExifDocument& doc, const bool strip_gps, const bool strip_serials) {
    ExifDocument out = doc;
    std::size_t removed = 0;

    if (strip_gps) {
        removed += out.section(ExifSection::Location).size();
        out.clear_section(ExifSection::Location);
    }
    if (strip_serials) {
        for (const auto& [section, tag] : kSerialTags) {
            if (out.erase(section, tag)) ++removed;
        }
    }

    if (removed > 0) {
        Logger::log(LogLevel::Debug, "Removed " + std::to_string(removed) + " identifying tags", "exif_sanitizer");
    }
    return out;
}

} // namespace picbatch

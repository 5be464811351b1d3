#include "../../include/exif_document.hpp"

namespace picbatch {

std::string_view exif_section_name(const ExifSection section) noexcept {
    switch (section) {
        case ExifSection::Primary:   return "0th";
        case ExifSection::Capture:   return "Exif";
        case ExifSection::Location:  return "GPS";
        case ExifSection::Interop:   return "Interop";
        case ExifSection::Thumbnail: return "1st";
    }
    return "";
}

std::size_t exif_type_size(const ExifType type) noexcept {
    switch (type) {
        case ExifType::Byte:
        case ExifType::Ascii:
        case ExifType::SByte:
        case ExifType::Undefined:
            return 1;
        case ExifType::Short:
        case ExifType::SShort:
            return 2;
        case ExifType::Long:
        case ExifType::SLong:
        case ExifType::Float:
            return 4;
        case ExifType::Rational:
        case ExifType::SRational:
        case ExifType::Double:
            return 8;
    }
    return 0;
}

ExifValue ExifValue::text(std::string value) {
    return {ExifType::Ascii, std::move(value)};
}

ExifValue ExifValue::integers(const ExifType type, std::vector<int64_t> values) {
    return {type, std::move(values)};
}

ExifValue ExifValue::short_value(const uint16_t value) {
    return {ExifType::Short, std::vector<int64_t>{value}};
}

ExifValue ExifValue::long_value(const uint32_t value) {
    return {ExifType::Long, std::vector<int64_t>{value}};
}

ExifValue ExifValue::rationals(std::vector<Rational> values, const bool is_signed) {
    return {is_signed ? ExifType::SRational : ExifType::Rational, std::move(values)};
}

ExifValue ExifValue::bytes(std::vector<uint8_t> values, const ExifType type) {
    return {type, std::move(values)};
}

std::size_t ExifValue::count() const noexcept {
    if (const auto* s = as_text()) {
        return s->size() + 1;
    }
    if (const auto* v = as_integers()) {
        return v->size();
    }
    if (const auto* r = as_rationals()) {
        return r->size();
    }
    const auto* b = as_bytes();
    const std::size_t unit = exif_type_size(type_);
    if (!b || unit == 0) return 0;
    return b->size() / unit;
}

const ExifValue* ExifDocument::find(const ExifSection s, const uint16_t tag) const {
    const auto& map = section(s);
    const auto it = map.find(tag);
    return it == map.end() ? nullptr : &it->second;
}

void ExifDocument::set(const ExifSection s, const uint16_t tag, ExifValue value) {
    section(s).insert_or_assign(tag, std::move(value));
}

bool ExifDocument::erase(const ExifSection s, const uint16_t tag) {
    return section(s).erase(tag) > 0;
}

bool ExifDocument::empty() const noexcept {
    return tag_count() == 0 && thumbnail_.empty();
}

std::size_t ExifDocument::tag_count() const noexcept {
    std::size_t n = 0;
    for (const auto& map : sections_) {
        n += map.size();
    }
    return n;
}

} // namespace picbatch

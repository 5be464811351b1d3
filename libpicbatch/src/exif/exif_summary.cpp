#include "../../include/exif_summary.hpp"
#include "../../include/exif_tags.hpp"
#include <string>

namespace picbatch {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// length of the valid UTF-8 sequence at s[i], 0 if invalid
std::size_t utf8_sequence_length(const std::string_view s, const std::size_t i) {
    const auto byte = [&](const std::size_t k) { return static_cast<unsigned char>(s[k]); };
    const unsigned char c = byte(i);
    if (c < 0x80) return 1;

    std::size_t len;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;

    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (std::size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

std::optional<std::string> text_of(const ExifDocument& doc, const ExifSection section, const uint16_t tag) {
    const ExifValue* v = doc.find(section, tag);
    if (!v) return std::nullopt;
    return value_to_text(*v);
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

std::string decode_text_lenient(std::string_view raw) {
    while (!raw.empty() && raw.back() == '\0') raw.remove_suffix(1);

    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        const std::size_t len = utf8_sequence_length(raw, i);
        if (len == 0) {
            out.append(kReplacement);
            ++i;
        } else {
            out.append(raw.substr(i, len));
            i += len;
        }
    }
    return out;
}

std::string value_to_text(const ExifValue& value) {
    if (const auto* s = value.as_text()) {
        return decode_text_lenient(*s);
    }
    if (const auto* b = value.as_bytes()) {
        return decode_text_lenient({reinterpret_cast<const char*>(b->data()), b->size()});
    }
    std::string out;
    if (const auto* ints = value.as_integers()) {
        for (const auto v : *ints) {
            if (!out.empty()) out += ' ';
            out += std::to_string(v);
        }
    } else if (const auto* rs = value.as_rationals()) {
        for (const auto& r : *rs) {
            if (!out.empty()) out += ' ';
            out += std::to_string(r.numerator) + "/" + std::to_string(r.denominator);
        }
    }
    return out;
}

std::string MetadataSummary::camera() const {
    const std::string make = camera_make ? trim(*camera_make) : std::string{};
    const std::string model = camera_model ? trim(*camera_model) : std::string{};
    if (make.empty()) return model;
    if (model.empty()) return make;
    return make + " " + model;
}

MetadataSummary summarize(const ExifDocument& doc) {
    MetadataSummary s;
    s.camera_make = text_of(doc, ExifSection::Primary, tags::kMake);
    s.camera_model = text_of(doc, ExifSection::Primary, tags::kModel);
    s.software = text_of(doc, ExifSection::Primary, tags::kSoftware);
    s.date_time = text_of(doc, ExifSection::Primary, tags::kDateTime);
    if (!s.date_time) {
        s.date_time = text_of(doc, ExifSection::Capture, tags::kDateTimeOriginal);
    }
    s.lens = text_of(doc, ExifSection::Capture, tags::kLensModel);
    s.gps_present = !doc.section(ExifSection::Location).empty();
    return s;
}

} // namespace picbatch

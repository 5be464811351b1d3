#include "../../include/exif_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/exif_tags.hpp"
#include "../../include/logger.hpp"
#include <exiv2/exiv2.hpp>
#include <algorithm>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

namespace picbatch {

namespace {

constexpr const char* kTag = "exif_codec";
constexpr std::size_t kTiffHeaderSize = 8;

// errors Exiv2 reports while the current thread decodes a block
thread_local std::vector<std::string>* t_decode_errors = nullptr;

/**
 * @brief Exiv2 log handler routed to the logger.
 *
 * Exiv2 reports damaged directories (out of bounds offsets, truncated
 * IFDs, circular references) as errors and carries on. During a decode
 * those errors are collected so the block can be rejected as a whole.
 */
void exiv2_log_handler(const int level, const char* msg) {
    std::string text = msg ? msg : "";
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    const bool is_error = level >= Exiv2::LogMsg::error;
    if (is_error && t_decode_errors) {
        t_decode_errors->push_back(text);
        Logger::log(LogLevel::Debug, "exiv2: " + text, "exiv2");
        return;
    }
    Logger::log(is_error ? LogLevel::Warning : LogLevel::Debug, "exiv2: " + text, "exiv2");
}

/**
 * @brief Collects Exiv2 errors for the lifetime of one decode.
 */
class DecodeErrorCapture {
public:
    DecodeErrorCapture() { t_decode_errors = &errors_; }
    ~DecodeErrorCapture() { t_decode_errors = nullptr; }

    DecodeErrorCapture(const DecodeErrorCapture&) = delete;
    DecodeErrorCapture& operator=(const DecodeErrorCapture&) = delete;

    [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }

private:
    std::vector<std::string> errors_;
};

void install_exiv2_logging() {
    static std::once_flag once;
    std::call_once(once, [] {
        Exiv2::LogMsg::setLevel(Exiv2::LogMsg::warn);
        Exiv2::LogMsg::setHandler(exiv2_log_handler);
    });
}

// --- sections <-> Exiv2 groups ---

std::optional<ExifSection> section_of(const Exiv2::IfdId ifd) noexcept {
    switch (ifd) {
        case Exiv2::IfdId::ifd0Id: return ExifSection::Primary;
        case Exiv2::IfdId::exifId: return ExifSection::Capture;
        case Exiv2::IfdId::gpsId:  return ExifSection::Location;
        case Exiv2::IfdId::iopId:  return ExifSection::Interop;
        case Exiv2::IfdId::ifd1Id: return ExifSection::Thumbnail;
        default:                   return std::nullopt;
    }
}

const char* group_of(const ExifSection section) noexcept {
    switch (section) {
        case ExifSection::Primary:   return "Image";
        case ExifSection::Capture:   return "Photo";
        case ExifSection::Location:  return "GPSInfo";
        case ExifSection::Interop:   return "Iop";
        case ExifSection::Thumbnail: return "Thumbnail";
    }
    return "Image";
}

Exiv2::ByteOrder to_exiv2(const ByteOrder order) noexcept {
    return order == ByteOrder::LittleEndian ? Exiv2::littleEndian : Exiv2::bigEndian;
}

// --- reading ---

std::vector<uint8_t> raw_bytes(const Exiv2::Exifdatum& datum, const Exiv2::ByteOrder order) {
    std::vector<uint8_t> out(datum.size());
    if (!out.empty()) {
        datum.copy(out.data(), order);
    }
    return out;
}

template <typename RationalValue>
std::vector<Rational> read_rationals(const Exiv2::Exifdatum& datum) {
    std::vector<Rational> values;
    if (const auto* typed = dynamic_cast<const RationalValue*>(&datum.value())) {
        for (const auto& [num, den] : typed->value_) values.push_back({num, den});
        return values;
    }
    for (std::size_t i = 0; i < datum.count(); ++i) {
        const Exiv2::Rational r = datum.toRational(i);
        values.push_back({r.first, r.second});
    }
    return values;
}

/**
 * @brief Converts one Exiv2 datum into a tagged value.
 * @return std::nullopt for field types outside the TIFF 6.0 range.
 */
std::optional<ExifValue> to_value(const Exiv2::Exifdatum& datum, const Exiv2::ByteOrder order) {
    const auto code = static_cast<long>(datum.typeId());
    if (code < 1 || code > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    const auto type = static_cast<ExifType>(code);
    if (exif_type_size(type) == 0) {
        return std::nullopt;
    }

    switch (type) {
        case ExifType::Ascii: {
            const auto raw = raw_bytes(datum, order);
            std::string s(raw.begin(), raw.end());
            while (!s.empty() && s.back() == '\0') s.pop_back();
            return ExifValue::text(std::move(s));
        }
        case ExifType::Byte:
        case ExifType::SByte:
        case ExifType::Short:
        case ExifType::SShort:
        case ExifType::Long:
        case ExifType::SLong: {
            std::vector<int64_t> values;
            values.reserve(datum.count());
            for (std::size_t i = 0; i < datum.count(); ++i) {
                const int64_t v = datum.toInt64(i);
                // Exiv2 keeps SBYTE components as raw octets
                values.push_back(type == ExifType::SByte ? static_cast<int8_t>(v & 0xFF) : v);
            }
            return ExifValue::integers(type, std::move(values));
        }
        case ExifType::Rational:
            return ExifValue::rationals(read_rationals<Exiv2::URationalValue>(datum));
        case ExifType::SRational:
            return ExifValue::rationals(read_rationals<Exiv2::RationalValue>(datum), true);
        case ExifType::Undefined:
        case ExifType::Float:
        case ExifType::Double:
            return ExifValue::bytes(raw_bytes(datum, order), type);
    }
    return std::nullopt;
}

// --- writing ---

void check_range(const int64_t v, const int64_t lo, const int64_t hi, const uint16_t tag) {
    if (v < lo || v > hi) {
        throw MetadataEncodeError("Value " + std::to_string(v) + " of tag " + std::to_string(tag) +
                                  " does not fit its field type");
    }
}

template <typename T>
Exiv2::Value::UniquePtr integer_value(const std::vector<int64_t>& ints, const uint16_t tag) {
    auto value = std::make_unique<Exiv2::ValueType<T>>();
    for (const int64_t v : ints) {
        check_range(v, std::numeric_limits<T>::min(), std::numeric_limits<T>::max(), tag);
        value->value_.push_back(static_cast<T>(v));
    }
    return value;
}

/**
 * @brief Builds the Exiv2 value for one tag, checking payload and ranges.
 */
Exiv2::Value::UniquePtr to_exiv2_value(const uint16_t tag, const ExifValue& value, const Exiv2::ByteOrder order) {
    const ExifType type = value.type();
    const std::size_t unit = exif_type_size(type);
    if (unit == 0) {
        throw MetadataEncodeError("Tag " + std::to_string(tag) + " has unknown field type " +
                                  std::to_string(static_cast<unsigned>(type)));
    }

    auto mismatch = [&] {
        return MetadataEncodeError("Tag " + std::to_string(tag) + " payload does not match field type " +
                                   std::to_string(static_cast<unsigned>(type)));
    };

    switch (type) {
        case ExifType::Ascii: {
            const auto* s = value.as_text();
            if (!s) throw mismatch();
            // AsciiValue appends the terminating NUL
            return std::make_unique<Exiv2::AsciiValue>(*s);
        }
        case ExifType::Byte:
        case ExifType::SByte: {
            const auto* ints = value.as_integers();
            if (!ints) throw mismatch();
            const bool is_signed = type == ExifType::SByte;
            std::vector<Exiv2::byte> octets;
            for (const int64_t v : *ints) {
                check_range(v, is_signed ? -128 : 0, is_signed ? 127 : 0xFF, tag);
                octets.push_back(static_cast<Exiv2::byte>(v));
            }
            auto data = std::make_unique<Exiv2::DataValue>(is_signed ? Exiv2::signedByte : Exiv2::unsignedByte);
            if (!octets.empty() && data->read(octets.data(), octets.size()) != 0) {
                throw MetadataEncodeError("Tag " + std::to_string(tag) + " byte values rejected");
            }
            return data;
        }
        case ExifType::Short:
        case ExifType::SShort:
        case ExifType::Long:
        case ExifType::SLong: {
            const auto* ints = value.as_integers();
            if (!ints) throw mismatch();
            if (type == ExifType::Short) return integer_value<uint16_t>(*ints, tag);
            if (type == ExifType::SShort) return integer_value<int16_t>(*ints, tag);
            if (type == ExifType::Long) return integer_value<uint32_t>(*ints, tag);
            return integer_value<int32_t>(*ints, tag);
        }
        case ExifType::Rational: {
            const auto* rs = value.as_rationals();
            if (!rs) throw mismatch();
            auto out = std::make_unique<Exiv2::URationalValue>();
            for (const auto& r : *rs) {
                check_range(r.numerator, 0, std::numeric_limits<uint32_t>::max(), tag);
                check_range(r.denominator, 0, std::numeric_limits<uint32_t>::max(), tag);
                out->value_.emplace_back(static_cast<uint32_t>(r.numerator), static_cast<uint32_t>(r.denominator));
            }
            return out;
        }
        case ExifType::SRational: {
            const auto* rs = value.as_rationals();
            if (!rs) throw mismatch();
            auto out = std::make_unique<Exiv2::RationalValue>();
            for (const auto& r : *rs) {
                check_range(r.numerator, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max(), tag);
                check_range(r.denominator, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max(), tag);
                out->value_.emplace_back(static_cast<int32_t>(r.numerator), static_cast<int32_t>(r.denominator));
            }
            return out;
        }
        case ExifType::Undefined:
        case ExifType::Float:
        case ExifType::Double: {
            const auto* raw = value.as_bytes();
            if (!raw) throw mismatch();
            if (raw->size() % unit != 0) {
                throw MetadataEncodeError("Tag " + std::to_string(tag) + " raw payload is not a whole number of components");
            }
            auto out = Exiv2::Value::create(static_cast<Exiv2::TypeId>(type));
            if (!raw->empty() && out->read(raw->data(), raw->size(), order) != 0) {
                throw MetadataEncodeError("Tag " + std::to_string(tag) + " raw payload rejected");
            }
            return out;
        }
    }
    throw mismatch();
}

/// Sum of the value payloads; a lower bound for the encoded block.
std::size_t payload_size(const ExifDocument& doc) {
    std::size_t total = doc.thumbnail().size();
    for (const ExifSection section : kAllExifSections) {
        for (const auto& [tag, value] : doc.section(section)) {
            total += value.count() * exif_type_size(value.type());
        }
    }
    return total;
}

} // namespace

bool has_exif_preamble(const std::span<const uint8_t> payload) noexcept {
    return payload.size() >= kExifPreamble.size() &&
           std::equal(kExifPreamble.begin(), kExifPreamble.end(), payload.begin());
}

ExifDocument try_decode_exif(std::span<const uint8_t> payload) {
    if (has_exif_preamble(payload)) {
        payload = payload.subspan(kExifPreamble.size());
    }
    if (payload.size() < kTiffHeaderSize) {
        throw MetadataDecodeError("EXIF block too short for a TIFF header");
    }
    install_exiv2_logging();

    Exiv2::ExifData data;
    Exiv2::ByteOrder order = Exiv2::invalidByteOrder;
    {
        const DecodeErrorCapture capture;
        try {
            order = Exiv2::ExifParser::decode(data, payload.data(), payload.size());
        } catch (const Exiv2::Error& e) {
            throw MetadataDecodeError(std::string("EXIF block rejected: ") + e.what());
        }
        if (!capture.errors().empty()) {
            throw MetadataDecodeError("EXIF block is damaged: " + capture.errors().front());
        }
    }
    if (order == Exiv2::invalidByteOrder) {
        throw MetadataDecodeError("EXIF block has no TIFF byte order mark");
    }

    ExifDocument doc;
    doc.set_byte_order(order == Exiv2::littleEndian ? ByteOrder::LittleEndian : ByteOrder::BigEndian);

    std::size_t skipped = 0;
    for (const auto& datum : data) {
        const auto section = section_of(datum.ifdId());
        if (!section || tags::is_structural(datum.tag())) {
            ++skipped;
            continue;
        }
        auto value = to_value(datum, order);
        if (!value) {
            Logger::log(LogLevel::Debug,
                        "Skipping " + datum.key() + " with unknown field type " +
                        std::to_string(static_cast<unsigned>(datum.typeId())),
                        kTag);
            ++skipped;
            continue;
        }
        doc.set(*section, datum.tag(), std::move(*value));
    }

    const Exiv2::ExifThumbC thumb(data);
    const Exiv2::DataBuf jpeg = thumb.copy();
    if (!jpeg.empty()) {
        doc.set_thumbnail({jpeg.c_data(), jpeg.c_data() + jpeg.size()});
    }

    Logger::log(LogLevel::Debug,
                "Decoded EXIF block: " + std::to_string(doc.tag_count()) + " tags, " +
                std::to_string(doc.thumbnail().size()) + " thumbnail bytes, " +
                std::to_string(skipped) + " entries not kept",
                kTag);
    return doc;
}

ExifDocument decode_exif(const std::span<const uint8_t> payload) noexcept {
    if (payload.empty()) return {};
    try {
        return try_decode_exif(payload);
    } catch (const MetadataDecodeError& e) {
        Logger::log(LogLevel::Warning, std::string("Ignoring malformed EXIF: ") + e.what(), kTag);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("EXIF decode failed: ") + e.what(), kTag);
    }
    return {};
}

std::vector<uint8_t> encode_exif(const ExifDocument& doc) {
    const std::size_t lower_bound = payload_size(doc);
    if (lower_bound > kMaxExifPayload) {
        throw MetadataEncodeError("EXIF values of " + std::to_string(lower_bound) +
                                  " bytes exceed the " + std::to_string(kMaxExifPayload) + " byte limit");
    }
    install_exiv2_logging();

    const Exiv2::ByteOrder order = to_exiv2(doc.byte_order());
    Exiv2::ExifData data;
    for (const ExifSection section : kAllExifSections) {
        for (const auto& [tag, value] : doc.section(section)) {
            if (tags::is_structural(tag)) continue;
            const auto converted = to_exiv2_value(tag, value, order);
            try {
                data.add(Exiv2::ExifKey(tag, group_of(section)), converted.get());
            } catch (const Exiv2::Error& e) {
                throw MetadataEncodeError("Tag " + std::to_string(tag) + " rejected: " + e.what());
            }
        }
    }

    Exiv2::Blob blob;
    try {
        if (!doc.thumbnail().empty()) {
            // a thumbnail is always described as JPEG (Compression 6)
            Exiv2::ExifThumb(data).setJpegThumbnail(doc.thumbnail().data(), doc.thumbnail().size());
        }
        const std::size_t before = data.count();
        Exiv2::ExifParser::encode(blob, nullptr, 0, order, data);
        if (data.count() != before) {
            throw MetadataEncodeError(std::to_string(before - data.count()) +
                                      " oversized tags would be dropped from the EXIF block");
        }
    } catch (const Exiv2::Error& e) {
        throw MetadataEncodeError(std::string("EXIF encoding failed: ") + e.what());
    }

    if (blob.size() > kMaxExifPayload) {
        throw MetadataEncodeError("EXIF block of " + std::to_string(blob.size()) +
                                  " bytes exceeds the " + std::to_string(kMaxExifPayload) + " byte limit");
    }

    Logger::log(LogLevel::Debug, "Encoded EXIF block of " + std::to_string(blob.size()) + " bytes", kTag);
    return {blob.begin(), blob.end()};
}

std::optional<std::vector<uint8_t>> try_encode_exif(const ExifDocument& doc) noexcept {
    try {
        return encode_exif(doc);
    } catch (const MetadataEncodeError& e) {
        Logger::log(LogLevel::Warning, std::string("Metadata will not be embedded: ") + e.what(), kTag);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("EXIF encode failed: ") + e.what(), kTag);
    }
    return std::nullopt;
}

} // namespace picbatch

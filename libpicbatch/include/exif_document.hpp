/**
 * @file exif_document.hpp
 * @brief In-memory model of an EXIF block: sections of typed tag values.
 */

#ifndef PICBATCH_EXIF_DOCUMENT_HPP
#define PICBATCH_EXIF_DOCUMENT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace picbatch {

/**
 * @brief The image file directories an EXIF block is made of.
 */
enum class ExifSection : std::size_t {
    Primary = 0, ///< IFD0 ("0th"): make, model, software, timestamp, orientation
    Capture,     ///< Exif sub-IFD: exposure, lens, serial numbers
    Location,    ///< GPS sub-IFD
    Interop,     ///< Interoperability sub-IFD
    Thumbnail    ///< IFD1 ("1st"): describes the embedded thumbnail
};

inline constexpr std::size_t kExifSectionCount = 5;

inline constexpr std::array<ExifSection, kExifSectionCount> kAllExifSections = {
    ExifSection::Primary, ExifSection::Capture, ExifSection::Location,
    ExifSection::Interop, ExifSection::Thumbnail
};

/// @return Conventional short name of a section ("0th", "Exif", "GPS", "Interop", "1st").
std::string_view exif_section_name(ExifSection section) noexcept;

/**
 * @brief TIFF field types.
 */
enum class ExifType : uint16_t {
    Byte      = 1,
    Ascii     = 2,
    Short     = 3,
    Long      = 4,
    Rational  = 5,
    SByte     = 6,
    Undefined = 7,
    SShort    = 8,
    SLong     = 9,
    SRational = 10,
    Float     = 11,
    Double    = 12
};

/// @return Size in bytes of one component of @p type, or 0 for codes outside 1..12.
std::size_t exif_type_size(ExifType type) noexcept;

/// Numerator/denominator pair of a RATIONAL or SRATIONAL component.
struct Rational {
    int64_t numerator = 0;
    int64_t denominator = 1;

    bool operator==(const Rational&) const = default;
};

/**
 * @brief One tag value, tagged with the TIFF type it is stored as.
 *
 * The payload alternative follows from the type:
 * - Ascii                         -> std::string (raw bytes, no terminating NUL)
 * - Byte, Short, Long and signed  -> std::vector<int64_t>
 * - Rational, SRational           -> std::vector<Rational>
 * - Undefined, Float, Double      -> std::vector<uint8_t> (raw, file byte order)
 *
 * Text is kept as bytes; decoding it for display is the summarizer's job.
 */
class ExifValue {
public:
    using Payload = std::variant<std::string,
                                 std::vector<int64_t>,
                                 std::vector<Rational>,
                                 std::vector<uint8_t>>;

    ExifValue() = default;
    ExifValue(ExifType type, Payload payload)
        : type_(type), payload_(std::move(payload)) {}

    static ExifValue text(std::string value);
    static ExifValue integers(ExifType type, std::vector<int64_t> values);
    static ExifValue short_value(uint16_t value);
    static ExifValue long_value(uint32_t value);
    static ExifValue rationals(std::vector<Rational> values, bool is_signed = false);
    static ExifValue bytes(std::vector<uint8_t> values, ExifType type = ExifType::Undefined);

    [[nodiscard]] ExifType type() const noexcept { return type_; }
    [[nodiscard]] const Payload& payload() const noexcept { return payload_; }

    [[nodiscard]] const std::string* as_text() const noexcept { return std::get_if<std::string>(&payload_); }
    [[nodiscard]] const std::vector<int64_t>* as_integers() const noexcept {
        return std::get_if<std::vector<int64_t>>(&payload_);
    }
    [[nodiscard]] const std::vector<Rational>* as_rationals() const noexcept {
        return std::get_if<std::vector<Rational>>(&payload_);
    }
    [[nodiscard]] const std::vector<uint8_t>* as_bytes() const noexcept {
        return std::get_if<std::vector<uint8_t>>(&payload_);
    }

    /**
     * @brief Number of TIFF components this value encodes to.
     *
     * Text counts its terminating NUL; raw Float/Double payloads count
     * one component per 4/8 bytes.
     */
    [[nodiscard]] std::size_t count() const noexcept;

    bool operator==(const ExifValue&) const = default;

private:
    ExifType type_ = ExifType::Undefined;
    Payload payload_ = std::vector<uint8_t>{};
};

enum class ByteOrder {
    LittleEndian, ///< "II"
    BigEndian     ///< "MM"
};

/**
 * @brief A decoded EXIF block.
 *
 * Holds one tag map per ExifSection plus the raw thumbnail. An absent
 * section and an empty one are the same thing. IFD pointer and
 * thumbnail location tags never live in the maps: the codec drops them
 * on decode and regenerates them on encode.
 */
class ExifDocument {
public:
    using TagMap = std::map<uint16_t, ExifValue>;

    [[nodiscard]] const TagMap& section(ExifSection s) const { return sections_[index_of(s)]; }
    [[nodiscard]] TagMap& section(ExifSection s) { return sections_[index_of(s)]; }

    /// @return The value, or nullptr when the tag is not present.
    [[nodiscard]] const ExifValue* find(ExifSection s, uint16_t tag) const;
    [[nodiscard]] bool contains(ExifSection s, uint16_t tag) const { return find(s, tag) != nullptr; }

    void set(ExifSection s, uint16_t tag, ExifValue value);

    /// @return True if the tag was present.
    bool erase(ExifSection s, uint16_t tag);

    void clear_section(ExifSection s) { section(s).clear(); }

    [[nodiscard]] const std::vector<uint8_t>& thumbnail() const noexcept { return thumbnail_; }
    void set_thumbnail(std::vector<uint8_t> jpeg) { thumbnail_ = std::move(jpeg); }

    [[nodiscard]] ByteOrder byte_order() const noexcept { return byte_order_; }
    void set_byte_order(const ByteOrder order) noexcept { byte_order_ = order; }

    /// @return True when no section holds a tag and there is no thumbnail.
    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] std::size_t tag_count() const noexcept;

    /// Field equality: sections and thumbnail. Byte order is an encoding detail.
    bool operator==(const ExifDocument& other) const {
        return sections_ == other.sections_ && thumbnail_ == other.thumbnail_;
    }

private:
    static constexpr std::size_t index_of(ExifSection s) noexcept { return static_cast<std::size_t>(s); }

    std::array<TagMap, kExifSectionCount> sections_{};
    std::vector<uint8_t> thumbnail_;
    ByteOrder byte_order_ = ByteOrder::BigEndian;
};

} // namespace picbatch

#endif // PICBATCH_EXIF_DOCUMENT_HPP

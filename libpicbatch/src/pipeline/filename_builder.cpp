#include "../../include/filename_builder.hpp"
#include "../../include/errors.hpp"
#include <cctype>
#include <charconv>
#include <filesystem>
#include <utility>
#include <vector>

namespace picbatch {

namespace {

enum class Field { Literal, Index, Name, Date };

struct Segment {
    Field field = Field::Literal;
    std::string text;      ///< literal text
    std::size_t width = 0; ///< minimum width of {index}
    bool zero_pad = false;
};

bool is_digit(const char c) {
    return c >= '0' && c <= '9';
}

std::size_t parse_index_spec(const std::string_view spec) {
    std::string_view digits = spec;
    if (!digits.empty() && digits.front() == '0') digits.remove_prefix(1);
    std::size_t width = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), width);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size() || width > 64) {
        throw FormatError("Invalid format spec ':" + std::string(spec) + "' for {index}");
    }
    return width;
}

Segment parse_field(const std::string_view body) {
    const auto colon = body.find(':');
    const std::string_view name = body.substr(0, colon);
    const bool has_spec = colon != std::string_view::npos;
    const std::string_view spec = has_spec ? body.substr(colon + 1) : std::string_view{};

    Segment seg;
    if (name == "index") {
        seg.field = Field::Index;
        if (has_spec) {
            seg.zero_pad = !spec.empty() && spec.front() == '0';
            seg.width = parse_index_spec(spec);
        }
        return seg;
    }
    if (name == "name") seg.field = Field::Name;
    else if (name == "date") seg.field = Field::Date;
    else throw UnsupportedTokenError(std::string(name));

    if (has_spec) {
        throw FormatError("Placeholder {" + std::string(name) + "} takes no format spec");
    }
    return seg;
}

std::vector<Segment> parse_pattern(const std::string_view pattern) {
    std::vector<Segment> segments;
    std::string literal;

    auto flush = [&] {
        if (!literal.empty()) {
            segments.push_back({Field::Literal, std::move(literal)});
            literal.clear();
        }
    };

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '{') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
                literal += '{';
                ++i;
                continue;
            }
            const auto close = pattern.find('}', i + 1);
            if (close == std::string_view::npos) {
                throw FormatError("Unbalanced '{' in name pattern");
            }
            const std::string_view body = pattern.substr(i + 1, close - i - 1);
            if (body.find('{') != std::string_view::npos) {
                throw FormatError("Nested '{' in name pattern");
            }
            flush();
            segments.push_back(parse_field(body));
            i = close;
        } else if (c == '}') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
                literal += '}';
                ++i;
                continue;
            }
            throw FormatError("Single '}' in name pattern");
        } else {
            literal += c;
        }
    }
    flush();
    return segments;
}

/// Inclusive code point range.
struct Range {
    char32_t first;
    char32_t last;
};

// non-ASCII punctuation, symbols and separators; everything else outside
// ASCII is taken for a letter or digit
constexpr Range kNonWordRanges[] = {
    {0x0080, 0x00A9}, {0x00AB, 0x00B1}, {0x00B4, 0x00B4}, {0x00B6, 0x00B8},
    {0x00BB, 0x00BB}, {0x00BF, 0x00BF}, {0x00D7, 0x00D7}, {0x00F7, 0x00F7},
    {0x2000, 0x206F}, // general punctuation
    {0x20A0, 0x20CF}, // currency
    {0x2190, 0x245F}, // arrows, math operators, technical
    {0x2500, 0x2775}, // box drawing, shapes, dingbats
    {0x2794, 0x2BFF},
    {0x2E00, 0x2E7F}, // supplemental punctuation
    {0x3000, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030}, {0x303D, 0x303F},
    {0xE000, 0xF8FF}, // private use
    {0xFE30, 0xFE6F}, // CJK compatibility and small forms
    {0xFF00, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40}, {0xFF5B, 0xFF65},
    {0xFFF0, 0xFFFF},
    {0x1F000, 0x1FAFF}, // emoji and pictographs
};

bool is_word_char(const char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<unsigned char>(cp)) || cp == '_';
    }
    for (const auto& r : kNonWordRanges) {
        if (cp >= r.first && cp <= r.last) return false;
    }
    return true;
}

/**
 * @brief Decodes the UTF-8 sequence starting at @p pos.
 * @return The code point and its length, or std::nullopt (length 1) for
 * an invalid or truncated sequence.
 */
std::pair<std::optional<char32_t>, std::size_t> next_code_point(const std::string_view s, const std::size_t pos) {
    const auto lead = static_cast<unsigned char>(s[pos]);
    std::size_t len;
    char32_t cp;
    if (lead < 0x80) return {lead, 1};
    if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }
    else return {std::nullopt, 1};

    if (pos + len > s.size()) return {std::nullopt, 1};
    for (std::size_t k = 1; k < len; ++k) {
        const auto c = static_cast<unsigned char>(s[pos + k]);
        if ((c & 0xC0) != 0x80) return {std::nullopt, 1};
        cp = (cp << 6) | (c & 0x3F);
    }
    constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return {std::nullopt, 1};
    }
    return {cp, len};
}

bool read_number(const std::string_view text, const std::size_t pos, const std::size_t len, int& out) {
    for (std::size_t k = pos; k < pos + len; ++k) {
        if (!is_digit(text[k])) return false;
    }
    const auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, out);
    return ec == std::errc() && ptr == text.data() + pos + len;
}

std::optional<std::chrono::year_month_day> parse_with_separator(const std::string_view text, const char sep) {
    // YYYY?MM?DD HH:MM:SS
    if (text.size() != 19 || text[4] != sep || text[7] != sep || text[10] != ' ' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    int y, mo, d, h, mi, s;
    if (!read_number(text, 0, 4, y) || !read_number(text, 5, 2, mo) || !read_number(text, 8, 2, d) ||
        !read_number(text, 11, 2, h) || !read_number(text, 14, 2, mi) || !read_number(text, 17, 2, s)) {
        return std::nullopt;
    }
    if (y < 1 || h > 23 || mi > 59 || s > 59) {
        return std::nullopt;
    }
    const std::chrono::year_month_day date{std::chrono::year{y},
                                           std::chrono::month{static_cast<unsigned>(mo)},
                                           std::chrono::day{static_cast<unsigned>(d)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string format_date(const std::chrono::year_month_day& date) {
    const auto pad = [](const unsigned v, const std::size_t width) {
        std::string s = std::to_string(v);
        return std::string(width > s.size() ? width - s.size() : 0, '0') + s;
    };
    return pad(static_cast<unsigned>(static_cast<int>(date.year())), 4) +
           pad(static_cast<unsigned>(date.month()), 2) +
           pad(static_cast<unsigned>(date.day()), 2);
}

std::string format_index(const std::size_t index, const Segment& seg) {
    std::string digits = std::to_string(index);
    if (digits.size() >= seg.width) return digits;
    return std::string(seg.width - digits.size(), seg.zero_pad ? '0' : ' ') + digits;
}

} // namespace

void validate_pattern(const std::string_view pattern) {
    static_cast<void>(parse_pattern(pattern));
}

std::string normalize_stem(const std::string_view name) {
    const std::string stem = std::filesystem::path(std::string(name)).stem().string();
    std::string out;
    bool in_run = false;
    for (std::size_t pos = 0; pos < stem.size();) {
        const auto [cp, len] = next_code_point(stem, pos);
        if (cp && is_word_char(*cp)) {
            out.append(stem, pos, len);
            in_run = false;
        } else if (!in_run) {
            out += '_';
            in_run = true;
        }
        pos += len;
    }
    return out;
}

std::optional<std::chrono::year_month_day> parse_capture_date(const std::string_view text) {
    if (auto date = parse_with_separator(text, ':')) return date;
    return parse_with_separator(text, '-');
}

std::string build_name(const std::string_view pattern,
                       const std::size_t index,
                       const std::string_view original_name,
                       const std::optional<std::string>& date_time) {
    std::string out;
    for (const auto& seg : parse_pattern(pattern)) {
        switch (seg.field) {
            case Field::Literal:
                out += seg.text;
                break;
            case Field::Index:
                out += format_index(index, seg);
                break;
            case Field::Name:
                out += normalize_stem(original_name);
                break;
            case Field::Date:
                if (date_time) {
                    if (const auto date = parse_capture_date(*date_time)) {
                        out += format_date(*date);
                    }
                }
                break;
        }
    }
    return out;
}

} // namespace picbatch

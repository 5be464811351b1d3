#include <gtest/gtest.h>
#include "errors.hpp"
#include "filename_builder.hpp"

using namespace picbatch;
using namespace std::chrono;

TEST(FilenameBuilder, IndexAndDate) {
    EXPECT_EQ(build_name("img_{index}_{date}", 3, "Vacation Photo.jpg", "2023:09:10 14:23:11"), "img_3_20230910");
}

TEST(FilenameBuilder, MissingDateRendersEmpty) {
    EXPECT_EQ(build_name("img_{index}_{date}", 3, "Vacation Photo.jpg", std::nullopt), "img_3_");
    EXPECT_EQ(build_name("img_{index}_{date}", 3, "Vacation Photo.jpg", "not a date"), "img_3_");
}

TEST(FilenameBuilder, NamePlaceholder) {
    EXPECT_EQ(build_name("{name}", 1, "Vacation Photo.jpg", std::nullopt), "Vacation_Photo");
    EXPECT_EQ(build_name("{name}-{index}", 12, "a  b--c.final.png", std::nullopt), "a_b_c_final-12");
    EXPECT_EQ(build_name("{name}", 1, "Ünïcode.webp", std::nullopt), "Ünïcode");
}

TEST(FilenameBuilder, PaddedIndex) {
    EXPECT_EQ(build_name("{index:03}", 7, "x.jpg", std::nullopt), "007");
    EXPECT_EQ(build_name("{index:3}", 7, "x.jpg", std::nullopt), "  7");
    EXPECT_EQ(build_name("{index:02}", 1234, "x.jpg", std::nullopt), "1234");
}

TEST(FilenameBuilder, LiteralBraces) {
    EXPECT_EQ(build_name("{{{index}}}", 5, "x.jpg", std::nullopt), "{5}");
    EXPECT_EQ(build_name("plain", 5, "x.jpg", std::nullopt), "plain");
}

TEST(FilenameBuilder, UnknownTokenIsReported) {
    try {
        validate_pattern("img_{camera}");
        FAIL() << "expected UnsupportedTokenError";
    } catch (const UnsupportedTokenError& e) {
        EXPECT_EQ(e.token(), "camera");
    }
    EXPECT_THROW(static_cast<void>(build_name("{foo}", 1, "x.jpg", std::nullopt)), UnsupportedTokenError);
}

TEST(FilenameBuilder, MalformedPatterns) {
    EXPECT_THROW(validate_pattern("img_{index"), FormatError);
    EXPECT_THROW(validate_pattern("img_index}"), FormatError);
    EXPECT_THROW(validate_pattern("{in{dex}"), FormatError);
    EXPECT_THROW(validate_pattern("{index:abc}"), FormatError);
    EXPECT_THROW(validate_pattern("{index:}"), FormatError);
    EXPECT_THROW(validate_pattern("{date:08}"), FormatError);
    EXPECT_NO_THROW(validate_pattern("img_{index:03}_{name}_{date}"));
}

TEST(FilenameBuilder, ParseCaptureDate) {
    EXPECT_EQ(parse_capture_date("2023:09:10 14:23:11"), year_month_day(year{2023}, month{9}, day{10}));
    EXPECT_EQ(parse_capture_date("2023-09-10 14:23:11"), year_month_day(year{2023}, month{9}, day{10}));
    EXPECT_EQ(parse_capture_date("2024:02:29 00:00:00"), year_month_day(year{2024}, month{2}, day{29}));

    EXPECT_FALSE(parse_capture_date("2023:02:29 10:00:00"));
    EXPECT_FALSE(parse_capture_date("2023:13:01 10:00:00"));
    EXPECT_FALSE(parse_capture_date("2023:09:10 24:00:00"));
    EXPECT_FALSE(parse_capture_date("2023:09:10"));
    EXPECT_FALSE(parse_capture_date("0000:00:00 00:00:00"));
    EXPECT_FALSE(parse_capture_date("0000:01:01 00:00:00"));
    EXPECT_EQ(parse_capture_date("0001:01:01 00:00:00"), year_month_day(year{1}, month{1}, day{1}));
    EXPECT_FALSE(parse_capture_date("2023:09-10 14:23:11"));
    EXPECT_FALSE(parse_capture_date(""));
}

TEST(FilenameBuilder, NormalizeStem) {
    EXPECT_EQ(normalize_stem("IMG 0001 (copy).JPG"), "IMG_0001_copy_");
    EXPECT_EQ(normalize_stem("already_fine.png"), "already_fine");
}

TEST(FilenameBuilder, NormalizeStemUnicode) {
    EXPECT_EQ(normalize_stem("caf\u00e9 \u2014 trip.jpg"), "caf\u00e9_trip");
    EXPECT_EQ(normalize_stem("\u65e5\u672c \u5199\u771f.png"), "\u65e5\u672c_\u5199\u771f");
    EXPECT_EQ(normalize_stem("\u00abbest\u00bb \U0001F600.jpg"), "_best_");
    EXPECT_EQ(normalize_stem("a\xff\xfe" "b.jpg"), "a_b");
    EXPECT_EQ(normalize_stem("x\xc3.jpg"), "x_");

    EXPECT_EQ(build_name("{name}", 1, "caf\u00e9 \u2014 trip.jpg", std::nullopt), "caf\u00e9_trip");
}

TEST(FilenameBuilder, YearZeroLeavesDateEmpty) {
    EXPECT_EQ(build_name("img_{index}_{date}", 3, "a.jpg", "0000:01:01 00:00:00"), "img_3_");
}

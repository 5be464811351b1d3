#include <gtest/gtest.h>
#include "exif_sanitizer.hpp"
#include "exif_tags.hpp"
#include "test_helpers.hpp"

using namespace picbatch;

TEST(ExifSanitizer, StripGpsEmptiesLocation) {
    const ExifDocument doc = test::camera_document();
    const ExifDocument out = sanitize(doc, true, false);

    EXPECT_TRUE(out.section(ExifSection::Location).empty());
    EXPECT_EQ(out.section(ExifSection::Primary), doc.section(ExifSection::Primary));
    EXPECT_EQ(out.section(ExifSection::Capture), doc.section(ExifSection::Capture));
}

TEST(ExifSanitizer, StripSerialsRemovesExactlyThreeTags) {
    const ExifDocument doc = test::camera_document();
    const ExifDocument out = sanitize(doc, false, true);

    EXPECT_FALSE(out.contains(ExifSection::Capture, tags::kBodySerialNumber));
    EXPECT_FALSE(out.contains(ExifSection::Capture, tags::kLensSerialNumber));
    EXPECT_FALSE(out.contains(ExifSection::Primary, tags::kCameraOwnerName));
    EXPECT_EQ(out.tag_count(), doc.tag_count() - 3);

    ExifDocument expected = doc;
    expected.erase(ExifSection::Capture, tags::kBodySerialNumber);
    expected.erase(ExifSection::Capture, tags::kLensSerialNumber);
    expected.erase(ExifSection::Primary, tags::kCameraOwnerName);
    EXPECT_EQ(out, expected);
}

TEST(ExifSanitizer, NoFlagsKeepsEverything) {
    const ExifDocument doc = test::camera_document();
    EXPECT_EQ(sanitize(doc, false, false), doc);
}

TEST(ExifSanitizer, Idempotent) {
    const ExifDocument doc = test::camera_document();
    for (const bool gps : {false, true}) {
        for (const bool serials : {false, true}) {
            const ExifDocument once = sanitize(doc, gps, serials);
            EXPECT_EQ(sanitize(once, gps, serials), once);
        }
    }
}

TEST(ExifSanitizer, InputIsNotModified) {
    const ExifDocument doc = test::camera_document();
    const ExifDocument copy = doc;
    static_cast<void>(sanitize(doc, true, true));
    EXPECT_EQ(doc, copy);
}

TEST(ExifSanitizer, KeepsThumbnailAndByteOrder) {
    ExifDocument doc = test::camera_document();
    doc.set_thumbnail({0xFF, 0xD8, 0xFF, 0xD9});
    doc.set_byte_order(ByteOrder::LittleEndian);

    const ExifDocument out = sanitize(doc, true, true);
    EXPECT_EQ(out.thumbnail(), doc.thumbnail());
    EXPECT_EQ(out.byte_order(), ByteOrder::LittleEndian);
}

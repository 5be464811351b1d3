#include <gtest/gtest.h>
#include "errors.hpp"
#include "exif_codec.hpp"
#include "exif_tags.hpp"
#include "logger.hpp"
#include "test_helpers.hpp"

using namespace picbatch;

namespace {

std::vector<uint8_t> with_preamble(const std::vector<uint8_t>& tiff) {
    std::vector<uint8_t> out(kExifPreamble.begin(), kExifPreamble.end());
    out.insert(out.end(), tiff.begin(), tiff.end());
    return out;
}

} // namespace

TEST(ExifCodec, RoundTripBigEndian) {
    const ExifDocument doc = test::camera_document();
    const auto bytes = encode_exif(doc);

    ASSERT_GE(bytes.size(), 8u);
    EXPECT_EQ(bytes[0], 'M');
    EXPECT_EQ(bytes[1], 'M');

    const ExifDocument back = try_decode_exif(bytes);
    EXPECT_EQ(back, doc);
    EXPECT_EQ(back.byte_order(), ByteOrder::BigEndian);
}

TEST(ExifCodec, RoundTripLittleEndian) {
    ExifDocument doc = test::camera_document();
    doc.set_byte_order(ByteOrder::LittleEndian);
    const auto bytes = encode_exif(doc);

    EXPECT_EQ(bytes[0], 'I');
    EXPECT_EQ(bytes[1], 'I');

    const ExifDocument back = try_decode_exif(bytes);
    EXPECT_EQ(back, doc);
    EXPECT_EQ(back.byte_order(), ByteOrder::LittleEndian);
}

TEST(ExifCodec, AcceptsExifPreamble) {
    const ExifDocument doc = test::camera_document();
    const auto framed = with_preamble(encode_exif(doc));
    EXPECT_TRUE(has_exif_preamble(framed));
    EXPECT_EQ(try_decode_exif(framed), doc);
}

TEST(ExifCodec, SignedValuesAndThumbnail) {
    ExifDocument doc;
    doc.set(ExifSection::Capture, 0x9204, ExifValue::rationals({{-1, 3}}, true));
    doc.set(ExifSection::Capture, 0x8830, ExifValue::integers(ExifType::SShort, {-5, 7}));
    doc.set(ExifSection::Capture, 0x8831, ExifValue::integers(ExifType::SLong, {-100000}));
    doc.set(ExifSection::Capture, tags::kMakerNote, ExifValue::bytes({1, 2, 3, 4, 5, 6, 7}));
    doc.set(ExifSection::Thumbnail, tags::kXResolution, ExifValue::rationals({{180, 1}}));
    doc.set(ExifSection::Thumbnail, tags::kCompression, ExifValue::short_value(6));
    doc.set_thumbnail({0xFF, 0xD8, 0xFF, 0xD9, 0x00});

    const ExifDocument back = try_decode_exif(encode_exif(doc));
    EXPECT_EQ(back, doc);
    EXPECT_EQ(back.thumbnail().size(), 5u);
}

TEST(ExifCodec, ThumbnailIsDescribedAsJpeg) {
    ExifDocument doc;
    doc.set(ExifSection::Primary, tags::kMake, ExifValue::text("Nikon"));
    doc.set_thumbnail({0xFF, 0xD8, 0x01, 0x02, 0xFF, 0xD9});

    const ExifDocument back = try_decode_exif(encode_exif(doc));
    EXPECT_EQ(back.thumbnail(), doc.thumbnail());
    const ExifValue* compression = back.find(ExifSection::Thumbnail, tags::kCompression);
    ASSERT_NE(compression, nullptr);
    ASSERT_NE(compression->as_integers(), nullptr);
    EXPECT_EQ(*compression->as_integers(), std::vector<int64_t>{6});
    EXPECT_FALSE(back.contains(ExifSection::Thumbnail, tags::kThumbnailOffset));
    EXPECT_FALSE(back.contains(ExifSection::Thumbnail, tags::kThumbnailLength));
}

TEST(ExifCodec, InteropWithoutCaptureTags) {
    ExifDocument doc;
    doc.set(ExifSection::Interop, 0x0001, ExifValue::text("R98"));

    const ExifDocument back = try_decode_exif(encode_exif(doc));
    EXPECT_TRUE(back.section(ExifSection::Capture).empty());
    ASSERT_TRUE(back.contains(ExifSection::Interop, 0x0001));
    EXPECT_EQ(*back.find(ExifSection::Interop, 0x0001)->as_text(), "R98");
}

TEST(ExifCodec, StructuralTagsAreRegenerated) {
    ExifDocument plain;
    plain.set(ExifSection::Primary, tags::kMake, ExifValue::text("Nikon"));

    ExifDocument with_pointer = plain;
    with_pointer.set(ExifSection::Primary, tags::kExifIfdPointer, ExifValue::long_value(1234));

    EXPECT_EQ(encode_exif(with_pointer), encode_exif(plain));
    EXPECT_FALSE(try_decode_exif(encode_exif(with_pointer)).contains(ExifSection::Primary, tags::kExifIfdPointer));
}

TEST(ExifCodec, DecodesHandWrittenBigEndianBlock) {
    const std::vector<uint8_t> tiff = {
        'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08,
        0x00, 0x01,                                     // one entry
        0x01, 0x12, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, // Orientation, SHORT, 1
        0x00, 0x06, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00                          // no IFD1
    };
    const ExifDocument doc = try_decode_exif(tiff);
    const ExifValue* v = doc.find(ExifSection::Primary, tags::kOrientation);
    ASSERT_NE(v, nullptr);
    ASSERT_NE(v->as_integers(), nullptr);
    EXPECT_EQ(*v->as_integers(), std::vector<int64_t>{6});
}

TEST(ExifCodec, SkipsUnknownFieldTypes) {
    const std::vector<uint8_t> tiff = {
        'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,
        0x02, 0x00,
        0x31, 0x01, 0x20, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // type 32
        0x12, 0x01, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00, // Orientation 3
        0x00, 0x00, 0x00, 0x00
    };
    const ExifDocument doc = try_decode_exif(tiff);
    EXPECT_FALSE(doc.contains(ExifSection::Primary, tags::kSoftware));
    EXPECT_TRUE(doc.contains(ExifSection::Primary, tags::kOrientation));
}

TEST(ExifCodec, RejectsMalformedBlocks) {
    EXPECT_THROW(static_cast<void>(try_decode_exif(std::vector<uint8_t>{'I', 'I', 0x2A})), MetadataDecodeError);

    const std::vector<uint8_t> bad_mark = {'X', 'X', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00};
    EXPECT_THROW(static_cast<void>(try_decode_exif(bad_mark)), MetadataDecodeError);

    const std::vector<uint8_t> bad_magic = {'I', 'I', 0x2B, 0x00, 0x08, 0x00, 0x00, 0x00};
    EXPECT_THROW(static_cast<void>(try_decode_exif(bad_magic)), MetadataDecodeError);

    const std::vector<uint8_t> ifd_out_of_range = {'I', 'I', 0x2A, 0x00, 0x64, 0x00, 0x00, 0x00};
    EXPECT_THROW(static_cast<void>(try_decode_exif(ifd_out_of_range)), MetadataDecodeError);
}

TEST(ExifCodec, TruncatedBlockIsRejectedWhole) {
    auto truncated = encode_exif(test::camera_document());
    truncated.resize(truncated.size() / 2);

    EXPECT_THROW(static_cast<void>(try_decode_exif(truncated)), MetadataDecodeError);
    EXPECT_TRUE(decode_exif(truncated).empty());
}

TEST(ExifCodec, RejectsIfdCycles) {
    const std::vector<uint8_t> tiff = {
        'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,
        0x01, 0x00,
        0x69, 0x87, 0x04, 0x00, 0x01, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, // Exif IFD -> IFD0
        0x00, 0x00, 0x00, 0x00
    };
    EXPECT_THROW(static_cast<void>(try_decode_exif(tiff)), MetadataDecodeError);
    EXPECT_TRUE(decode_exif(tiff).empty());
}

TEST(ExifCodec, SoftDecodeFallsBackToEmptyDocument) {
    auto sink = std::make_unique<test::CaptureSink>();
    const auto* capture = sink.get();
    Logger::clear_sinks();
    Logger::add_sink(std::move(sink));

    EXPECT_TRUE(decode_exif({}).empty());
    EXPECT_TRUE(capture->entries.empty());

    const std::vector<uint8_t> garbage = {'E', 'x', 'i', 'f', 0, 0, 1, 2, 3};
    EXPECT_TRUE(decode_exif(garbage).empty());
    ASSERT_EQ(capture->entries.size(), 1u);
    EXPECT_EQ(capture->entries[0].level, LogLevel::Warning);
    EXPECT_EQ(capture->entries[0].tag, "exif_codec");

    Logger::clear_sinks();
}

TEST(ExifCodec, EncodeRejectsInvalidValues) {
    ExifDocument mismatch;
    mismatch.set(ExifSection::Primary, tags::kOrientation, ExifValue(ExifType::Short, std::string("6")));
    EXPECT_THROW(static_cast<void>(encode_exif(mismatch)), MetadataEncodeError);

    ExifDocument out_of_range;
    out_of_range.set(ExifSection::Primary, 0x9999, ExifValue::integers(ExifType::Byte, {300}));
    EXPECT_THROW(static_cast<void>(encode_exif(out_of_range)), MetadataEncodeError);

    ExifDocument negative_rational;
    negative_rational.set(ExifSection::Capture, tags::kExposureTime, ExifValue::rationals({{-1, 250}}));
    EXPECT_THROW(static_cast<void>(encode_exif(negative_rational)), MetadataEncodeError);

    ExifDocument too_large;
    too_large.set(ExifSection::Capture, tags::kMakerNote, ExifValue::bytes(std::vector<uint8_t>(70000, 0xAB)));
    EXPECT_THROW(static_cast<void>(encode_exif(too_large)), MetadataEncodeError);
    EXPECT_FALSE(try_encode_exif(too_large).has_value());

    ExifDocument huge_thumbnail;
    huge_thumbnail.set(ExifSection::Primary, tags::kMake, ExifValue::text("Canon"));
    huge_thumbnail.set_thumbnail(std::vector<uint8_t>(70000, 0x55));
    EXPECT_THROW(static_cast<void>(encode_exif(huge_thumbnail)), MetadataEncodeError);
}

TEST(ExifCodec, EmptyTextEncodesAsSingleNul) {
    ExifDocument doc;
    doc.set(ExifSection::Primary, tags::kArtist, ExifValue::text(""));
    const ExifDocument back = try_decode_exif(encode_exif(doc));
    ASSERT_TRUE(back.contains(ExifSection::Primary, tags::kArtist));
    EXPECT_EQ(*back.find(ExifSection::Primary, tags::kArtist)->as_text(), "");
}

#include <gtest/gtest.h>
#include "codec_registry.hpp"
#include "errors.hpp"
#include "exif_codec.hpp"
#include "jpeg_codec.hpp"
#include "mime_detector.hpp"
#include "png_codec.hpp"
#include "test_helpers.hpp"
#include "webp_codec.hpp"

using namespace picbatch;

namespace {

double max_difference(const Image& a, const Image& b) {
    return cv::norm(a.mat(), b.mat(), cv::NORM_INF);
}

double mean_difference(const Image& a, const Image& b) {
    cv::Mat diff;
    cv::absdiff(a.mat(), b.mat(), diff);
    const cv::Scalar m = cv::mean(diff);
    return (m[0] + m[1] + m[2]) / 3.0;
}

} // namespace

TEST(JpegCodec, EncodeDecode) {
    const JpegCodec codec;
    const Image src = test::gradient_image(40, 30);

    const auto bytes = codec.encode(src, {90, {}});
    EXPECT_TRUE(codec.matches_signature(bytes));

    const DecodedImage decoded = codec.decode(bytes);
    EXPECT_EQ(decoded.image.width(), 40);
    EXPECT_EQ(decoded.image.height(), 30);
    EXPECT_EQ(decoded.image.channels(), 3);
    EXPECT_TRUE(decoded.exif.empty());
    EXPECT_LT(mean_difference(decoded.image, src), 8.0);
}

TEST(JpegCodec, EmbedsExifInApp1) {
    const JpegCodec codec;
    ASSERT_TRUE(codec.can_embed_exif());

    const ExifDocument doc = test::camera_document();
    const auto exif = encode_exif(doc);
    EncodeOptions options;
    options.exif = exif;
    const auto bytes = codec.encode(test::gradient_image(16, 16), options);

    const DecodedImage decoded = codec.decode(bytes);
    EXPECT_TRUE(has_exif_preamble(decoded.exif));
    EXPECT_EQ(try_decode_exif(decoded.exif), doc);
}

TEST(JpegCodec, DropsAlpha) {
    const JpegCodec codec;
    const auto bytes = codec.encode(test::gradient_image(8, 8, 4), {});
    EXPECT_EQ(codec.decode(bytes).image.channels(), 3);
}

TEST(JpegCodec, LowerQualityIsSmaller) {
    const JpegCodec codec;
    const Image src = test::gradient_image(128, 128);
    EXPECT_LT(codec.encode(src, {10, {}}).size(), codec.encode(src, {95, {}}).size());
}

TEST(JpegCodec, RejectsBadInput) {
    const JpegCodec codec;
    EXPECT_THROW(static_cast<void>(codec.decode({})), ImageDecodeError);
    const std::vector<uint8_t> junk = {0xFF, 0xD8, 0xFF, 0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_THROW(static_cast<void>(codec.decode(junk)), ImageDecodeError);
    EXPECT_THROW(static_cast<void>(codec.encode(Image{}, {})), ImageEncodeError);

    const std::vector<uint8_t> huge(kMaxExifPayload + 1, 0);
    EncodeOptions options;
    options.exif = huge;
    EXPECT_THROW(static_cast<void>(codec.encode(test::gradient_image(4, 4), options)), ImageEncodeError);
}

TEST(PngCodec, LosslessRoundTrip) {
    const PngCodec codec;
    EXPECT_FALSE(codec.can_embed_exif());

    const Image src = test::gradient_image(33, 17);
    const auto bytes = codec.encode(src, {});
    EXPECT_TRUE(codec.matches_signature(bytes));

    const DecodedImage decoded = codec.decode(bytes);
    ASSERT_EQ(decoded.image.channels(), 3);
    EXPECT_EQ(max_difference(decoded.image, src), 0.0);
}

TEST(PngCodec, KeepsAlpha) {
    const PngCodec codec;
    const Image src = test::gradient_image(9, 9, 4);
    const DecodedImage decoded = codec.decode(codec.encode(src, {}));
    ASSERT_TRUE(decoded.image.has_alpha());
    EXPECT_EQ(max_difference(decoded.image, src), 0.0);
}

TEST(PngCodec, FewColorsStillDecodeToRgb) {
    const PngCodec codec;
    Image src = Image::blank(10, 10, 3);
    src.mat().setTo(cv::Scalar(200, 10, 10));
    const DecodedImage decoded = codec.decode(codec.encode(src, {}));
    EXPECT_EQ(decoded.image.channels(), 3);
    EXPECT_EQ(max_difference(decoded.image, src), 0.0);
}

TEST(PngCodec, RejectsBadInput) {
    const PngCodec codec;
    const std::vector<uint8_t> not_png = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    EXPECT_THROW(static_cast<void>(codec.decode(not_png)), ImageDecodeError);

    const auto bytes = codec.encode(test::gradient_image(16, 16), {});
    const std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + 40);
    EXPECT_THROW(static_cast<void>(codec.decode(truncated)), ImageDecodeError);
}

TEST(WebpCodec, EncodeDecode) {
    const WebpCodec codec;
    EXPECT_FALSE(codec.can_embed_exif());

    const Image src = test::gradient_image(24, 20);
    const auto bytes = codec.encode(src, {90, {}});
    EXPECT_TRUE(codec.matches_signature(bytes));

    const DecodedImage decoded = codec.decode(bytes);
    EXPECT_EQ(decoded.image.width(), 24);
    EXPECT_EQ(decoded.image.height(), 20);
    EXPECT_FALSE(decoded.image.has_alpha());
    EXPECT_LT(mean_difference(decoded.image, src), 10.0);
}

TEST(WebpCodec, RejectsBadInput) {
    const WebpCodec codec;
    const std::vector<uint8_t> junk = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P', 0, 0};
    EXPECT_THROW(static_cast<void>(codec.decode(junk)), ImageDecodeError);
}

TEST(CodecRegistry, Lookups) {
    const CodecRegistry registry;
    ASSERT_EQ(registry.all().size(), 3u);

    EXPECT_EQ(registry.find_by_format(ImageFormat::Jpeg)->get_format(), ImageFormat::Jpeg);
    EXPECT_EQ(registry.find_by_format(ImageFormat::Unknown), nullptr);

    EXPECT_EQ(registry.find_by_mime("image/png")->get_format(), ImageFormat::Png);
    EXPECT_EQ(registry.find_by_mime("image/gif"), nullptr);
}

TEST(CodecRegistry, DetectsContent) {
    const CodecRegistry registry;
    const Image src = test::gradient_image(8, 8);

    for (const auto format : {ImageFormat::Jpeg, ImageFormat::Png, ImageFormat::Webp}) {
        SCOPED_TRACE(image_format_to_string(format));
        const auto bytes = registry.find_by_format(format)->encode(src, {});
        const IImageCodec* found = registry.find_for_content(bytes);
        ASSERT_NE(found, nullptr);
        EXPECT_EQ(found->get_format(), format);
    }

    const std::vector<uint8_t> text = {'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd', '\n'};
    EXPECT_EQ(registry.find_for_content(text), nullptr);
}

TEST(MimeDetector, EmptyBufferHasNoType) {
    EXPECT_EQ(MimeDetector::detect(std::span<const uint8_t>{}), "");
}

TEST(ImageFormat, Names) {
    EXPECT_EQ(image_format_extension(ImageFormat::Jpeg), "jpg");
    EXPECT_EQ(image_format_to_string(ImageFormat::Webp), "WEBP");
    EXPECT_EQ(parse_image_format(".JPEG"), ImageFormat::Jpeg);
    EXPECT_EQ(parse_image_format("png"), ImageFormat::Png);
    EXPECT_FALSE(parse_image_format("gif"));
}

TEST(Image, ChannelHandling) {
    const Image rgb = test::gradient_image(5, 4);
    EXPECT_FALSE(rgb.has_alpha());
    const Image rgba = rgb.with_alpha();
    EXPECT_TRUE(rgba.has_alpha());
    EXPECT_EQ(rgba.mat().at<cv::Vec4b>(0, 0)[3], 255);
    EXPECT_EQ(max_difference(rgba.without_alpha(), rgb), 0.0);
    EXPECT_EQ(rgb.packed().size(), 5u * 4u * 3u);

    EXPECT_THROW(static_cast<void>(Image(cv::Mat(2, 2, CV_8UC1))), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(Image::blank(0, 2, 3)), std::invalid_argument);
}

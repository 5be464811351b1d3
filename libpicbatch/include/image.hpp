/**
 * @file image.hpp
 * @brief Decoded pixel buffer shared by the codecs and the geometry module.
 */

#ifndef PICBATCH_IMAGE_HPP
#define PICBATCH_IMAGE_HPP

#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace picbatch {

/**
 * @brief 8-bit interleaved RGB or RGBA pixels.
 *
 * The channel order is always R, G, B (, A): codecs convert on the way in
 * and out. The underlying cv::Mat is reference counted, so copies of an
 * Image share pixels; operations that change pixels return a new Image.
 */
class Image {
public:
    Image() = default;

    /**
     * @brief Wraps a matrix.
     * @throws std::invalid_argument unless @p pixels is CV_8UC3 or CV_8UC4.
     */
    explicit Image(cv::Mat pixels);

    /// Allocates a zeroed image with 3 or 4 channels.
    static Image blank(int width, int height, int channels);

    [[nodiscard]] int width() const noexcept { return pixels_.cols; }
    [[nodiscard]] int height() const noexcept { return pixels_.rows; }
    [[nodiscard]] int channels() const noexcept { return pixels_.channels(); }
    [[nodiscard]] bool has_alpha() const noexcept { return pixels_.channels() == 4; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

    [[nodiscard]] const cv::Mat& mat() const noexcept { return pixels_; }
    [[nodiscard]] cv::Mat& mat() noexcept { return pixels_; }

    /// @return The image with the alpha channel removed (shares pixels when there is none).
    [[nodiscard]] Image without_alpha() const;

    /// @return The image with an opaque alpha channel added when missing.
    [[nodiscard]] Image with_alpha() const;

    /// @return Rows copied into one tightly packed buffer.
    [[nodiscard]] std::vector<uint8_t> packed() const;

private:
    cv::Mat pixels_;
};

/// Result of decoding one input file.
struct DecodedImage {
    Image image;
    std::vector<uint8_t> exif; ///< raw EXIF block as found in the container, empty if none
};

} // namespace picbatch

#endif // PICBATCH_IMAGE_HPP

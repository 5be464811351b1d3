#include "../../include/image.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>

namespace picbatch {

Image::Image(cv::Mat pixels) : pixels_(std::move(pixels)) {
    if (pixels_.type() != CV_8UC3 && pixels_.type() != CV_8UC4) {
        throw std::invalid_argument("Image needs 8-bit RGB or RGBA pixels");
    }
}

Image Image::blank(const int width, const int height, const int channels) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    if (channels != 3 && channels != 4) {
        throw std::invalid_argument("Image needs 3 or 4 channels");
    }
    return Image(cv::Mat::zeros(height, width, CV_8UC(channels)));
}

Image Image::without_alpha() const {
    if (!has_alpha()) return *this;
    cv::Mat rgb;
    cv::cvtColor(pixels_, rgb, cv::COLOR_RGBA2RGB);
    return Image(std::move(rgb));
}

Image Image::with_alpha() const {
    if (has_alpha()) return *this;
    cv::Mat rgba;
    cv::cvtColor(pixels_, rgba, cv::COLOR_RGB2RGBA);
    return Image(std::move(rgba));
}

std::vector<uint8_t> Image::packed() const {
    const std::size_t row_bytes = static_cast<std::size_t>(width()) * channels();
    std::vector<uint8_t> out(row_bytes * height());
    for (int y = 0; y < height(); ++y) {
        const uint8_t* src = pixels_.ptr<uint8_t>(y);
        std::copy(src, src + row_bytes, out.data() + static_cast<std::size_t>(y) * row_bytes);
    }
    return out;
}

} // namespace picbatch

#include "../../include/geometry.hpp"
#include "../../include/exif_tags.hpp"
#include "../../include/logger.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace picbatch {

namespace {

constexpr const char* kTag = "geometry";

int scaled(const int dim, const int64_t num, const int64_t den) {
    return static_cast<int>(std::max<int64_t>(1, static_cast<int64_t>(dim) * num / den));
}

void check_axis_value(const int value) {
    if (value < kMinResizeValue || value > kMaxResizeValue) {
        throw std::invalid_argument("Resize value " + std::to_string(value) + " outside " +
                                    std::to_string(kMinResizeValue) + ".." + std::to_string(kMaxResizeValue));
    }
}

} // namespace

std::string_view resize_mode_name(const ResizeMode mode) noexcept {
    switch (mode) {
        case ResizeMode::Percent: return "percent";
        case ResizeMode::Width:   return "width";
        case ResizeMode::Height:  return "height";
    }
    return "";
}

std::optional<ResizeMode> parse_resize_mode(const std::string_view name) {
    std::string s(name);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "percent") return ResizeMode::Percent;
    if (s == "width")   return ResizeMode::Width;
    if (s == "height")  return ResizeMode::Height;
    return std::nullopt;
}

Size compute_target_size(const Size original, const ResizeSpec& spec) {
    if (original.width <= 0 || original.height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }

    switch (spec.mode) {
        case ResizeMode::Width:
            check_axis_value(spec.value);
            return {spec.value, scaled(original.height, spec.value, original.width)};
        case ResizeMode::Height:
            check_axis_value(spec.value);
            return {scaled(original.width, spec.value, original.height), spec.value};
        case ResizeMode::Percent: {
            const int percent = std::max(1, spec.value);
            return {scaled(original.width, percent, 100), scaled(original.height, percent, 100)};
        }
    }
    throw std::invalid_argument("Unknown resize mode");
}

Image resize(const Image& image, const ResizeSpec& spec) {
    const Size from{image.width(), image.height()};
    const Size to = compute_target_size(from, spec);
    if (to == from) {
        return Image(image.mat().clone());
    }

    const bool shrinking = static_cast<int64_t>(to.width) * to.height <
                           static_cast<int64_t>(from.width) * from.height;
    cv::Mat out;
    cv::resize(image.mat(), out, cv::Size(to.width, to.height), 0, 0,
               shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4);

    Logger::log(LogLevel::Debug,
                "Resized " + std::to_string(from.width) + "x" + std::to_string(from.height) + " -> " +
                std::to_string(to.width) + "x" + std::to_string(to.height),
                kTag);
    return Image(std::move(out));
}

std::optional<int> orientation_of(const ExifDocument& doc) {
    const ExifValue* value = doc.find(ExifSection::Primary, tags::kOrientation);
    if (!value) return std::nullopt;
    const auto* ints = value->as_integers();
    if (!ints || ints->empty()) return std::nullopt;
    const int64_t o = ints->front();
    if (o < 1 || o > 8) return std::nullopt;
    return static_cast<int>(o);
}

Image apply_orientation(const Image& image, ExifDocument& doc) {
    const auto orientation = orientation_of(doc);
    if (!orientation || *orientation == 1) {
        return image;
    }

    const cv::Mat& src = image.mat();
    cv::Mat out;
    switch (*orientation) {
        case 2: cv::flip(src, out, 1); break;
        case 3: cv::rotate(src, out, cv::ROTATE_180); break;
        case 4: cv::flip(src, out, 0); break;
        case 5: cv::transpose(src, out); break;
        case 6: cv::rotate(src, out, cv::ROTATE_90_CLOCKWISE); break;
        case 7: {
            cv::Mat t;
            cv::transpose(src, t);
            cv::flip(t, out, -1);
            break;
        }
        case 8: cv::rotate(src, out, cv::ROTATE_90_COUNTERCLOCKWISE); break;
        default: return image;
    }

    doc.erase(ExifSection::Primary, tags::kOrientation);
    Logger::log(LogLevel::Debug, "Applied EXIF orientation " + std::to_string(*orientation), kTag);
    return Image(std::move(out));
}

} // namespace picbatch

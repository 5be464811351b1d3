#include "test_helpers.hpp"
#include "exif_tags.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace picbatch::test {

Image gradient_image(const int width, const int height, const int channels) {
    Image image = Image::blank(width, height, channels);
    cv::Mat& m = image.mat();
    for (int y = 0; y < height; ++y) {
        auto* row = m.ptr<uint8_t>(y);
        for (int x = 0; x < width; ++x) {
            uint8_t* px = row + static_cast<std::size_t>(x) * channels;
            px[0] = static_cast<uint8_t>(x * 255 / std::max(1, width - 1));
            px[1] = static_cast<uint8_t>(y * 255 / std::max(1, height - 1));
            px[2] = static_cast<uint8_t>((x + y) * 127 / std::max(1, width + height - 2));
            if (channels == 4) px[3] = static_cast<uint8_t>(128 + (x % 2) * 127);
        }
    }
    return image;
}

ExifDocument camera_document() {
    ExifDocument doc;
    doc.set(ExifSection::Primary, tags::kMake, ExifValue::text("Canon"));
    doc.set(ExifSection::Primary, tags::kModel, ExifValue::text("EOS R6"));
    doc.set(ExifSection::Primary, tags::kSoftware, ExifValue::text("Firmware 1.8.1"));
    doc.set(ExifSection::Primary, tags::kDateTime, ExifValue::text("2023:09:10 14:23:11"));
    doc.set(ExifSection::Primary, tags::kXResolution, ExifValue::rationals({{72, 1}}));
    doc.set(ExifSection::Primary, tags::kCameraOwnerName, ExifValue::text("Jane Doe"));

    doc.set(ExifSection::Capture, tags::kExposureTime, ExifValue::rationals({{1, 250}}));
    doc.set(ExifSection::Capture, tags::kIsoSpeed, ExifValue::short_value(400));
    doc.set(ExifSection::Capture, tags::kDateTimeOriginal, ExifValue::text("2023:09:10 14:23:11"));
    doc.set(ExifSection::Capture, tags::kLensModel, ExifValue::text("RF24-105mm F4 L IS USM"));
    doc.set(ExifSection::Capture, tags::kBodySerialNumber, ExifValue::text("083021001234"));
    doc.set(ExifSection::Capture, tags::kLensSerialNumber, ExifValue::text("9400001234"));

    doc.set(ExifSection::Location, tags::kGpsVersionId, ExifValue::integers(ExifType::Byte, {2, 3, 0, 0}));
    doc.set(ExifSection::Location, tags::kGpsLatitudeRef, ExifValue::text("N"));
    doc.set(ExifSection::Location, tags::kGpsLatitude, ExifValue::rationals({{45, 1}, {27, 1}, {3012, 100}}));
    doc.set(ExifSection::Location, tags::kGpsLongitudeRef, ExifValue::text("E"));
    doc.set(ExifSection::Location, tags::kGpsLongitude, ExifValue::rationals({{9, 1}, {11, 1}, {1500, 100}}));
    return doc;
}

std::vector<std::pair<std::string, std::vector<uint8_t>>> read_zip(const std::vector<uint8_t>& archive_bytes) {
    struct ReadDeleter {
        void operator()(archive* a) const { archive_read_free(a); }
    };
    const std::unique_ptr<archive, ReadDeleter> a(archive_read_new());
    archive_read_support_format_zip(a.get());
    if (archive_read_open_memory(a.get(), archive_bytes.data(), archive_bytes.size()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(a.get()));
    }

    std::vector<std::pair<std::string, std::vector<uint8_t>>> entries;
    archive_entry* entry = nullptr;
    while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
        std::vector<uint8_t> data;
        uint8_t buf[8192];
        la_ssize_t n;
        while ((n = archive_read_data(a.get(), buf, sizeof(buf))) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (n < 0) {
            throw std::runtime_error(archive_error_string(a.get()));
        }
        entries.emplace_back(archive_entry_pathname(entry), std::move(data));
    }
    return entries;
}

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("picbatch_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::write(const std::string& name, const std::string& content) const {
    const auto p = path_ / name;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
}

} // namespace picbatch::test

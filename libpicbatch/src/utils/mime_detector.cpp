#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>
#include <string>

namespace {

struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

/// Opens a MIME type cookie with the system database, or nullptr.
unique_magic open_magic() {
    unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        picbatch::Logger::log(picbatch::LogLevel::Warning, "magic_open failed", "libmagic");
        return nullptr;
    }
    if (magic_load(magic.get(), nullptr) != 0) {
        const char* err = magic_error(magic.get());
        picbatch::Logger::log(picbatch::LogLevel::Warning,
                              std::string("magic_load failed: ") + (err ? err : "unknown error"),
                              "libmagic");
        return nullptr;
    }
    return magic;
}

} // namespace

std::string picbatch::MimeDetector::detect(const std::span<const uint8_t> data)
{
    if (data.empty()) return {};
    const auto magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
}


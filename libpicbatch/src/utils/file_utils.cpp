#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace picbatch {

    namespace {
        /**
         * @brief RAII wrapper for FILE pointers to ensure they are closed.
         */
        struct FileCloser {
            void operator()(FILE *f) const { if (f) std::fclose(f); }
        };
        using unique_FILE = std::unique_ptr<FILE, FileCloser>;
    } // namespace

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);
        return _wfopen(path.wstring().c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<uint8_t> read_file_bytes(const std::filesystem::path& path) {
        const unique_FILE in(open_file(path, "rb"));
        if (!in) {
            throw std::runtime_error("Cannot open input: " + path.string());
        }

        std::vector<uint8_t> data;
        uint8_t chunk[64 * 1024];
        size_t n;
        while ((n = std::fread(chunk, 1, sizeof(chunk), in.get())) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        if (std::ferror(in.get())) {
            throw std::runtime_error("Read error: " + path.string());
        }
        Logger::log(LogLevel::Debug, "Read " + std::to_string(data.size()) + " bytes from " + path.string(), "file_utils");
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const std::span<const uint8_t> data) {
        const unique_FILE out(open_file(path, "wb"));
        if (!out) {
            throw std::runtime_error("Cannot open output: " + path.string());
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), out.get()) != data.size()) {
            throw std::runtime_error("Write error: " + path.string());
        }
        // explicitly flush stdio buffer to disk before returning
        if (std::fflush(out.get()) != 0) {
            throw std::runtime_error("fflush failed for " + path.string());
        }
    }

} // namespace picbatch

#include "../../include/zip_writer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <ctime>
#include <memory>

namespace picbatch {

namespace {

constexpr const char* kTag = "zip_writer";

la_ssize_t append_to_buffer(struct archive*, void* client_data, const void* buff, const size_t length) {
    auto* out = static_cast<std::vector<uint8_t>*>(client_data);
    const auto* bytes = static_cast<const uint8_t*>(buff);
    out->insert(out->end(), bytes, bytes + length);
    return static_cast<la_ssize_t>(length);
}

struct EntryDeleter {
    void operator()(archive_entry* e) const { archive_entry_free(e); }
};

std::string error_of(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

/**
 * @brief Applies one zip format option.
 *
 * An option this libarchive does not know (ARCHIVE_WARN) or rejects
 * (ARCHIVE_FAILED) leaves its default in place and is logged.
 * @return ARCHIVE_FATAL when the archive handle is unusable, else ARCHIVE_OK.
 */
int set_zip_option(struct archive* a, const char* key, const char* value) {
    const int r = archive_write_set_format_option(a, "zip", key, value);
    if (r == ARCHIVE_WARN || r == ARCHIVE_FAILED) {
        Logger::log(LogLevel::Warning,
                    std::string("LIBARCHIVE WARN: zip option ") + key + "=" + value + " not applied: " + error_of(a),
                    kTag);
        return ARCHIVE_OK;
    }
    return r;
}

} // namespace

ZipWriter::ZipWriter() {
    archive_ = archive_write_new();
    if (!archive_) {
        throw ArchiveError("archive_write_new failed");
    }

    int r = archive_write_set_format_zip(archive_);
    if (r == ARCHIVE_OK) {
        r = set_zip_option(archive_, "compression", "deflate");
    }
    if (r == ARCHIVE_OK) {
        r = set_zip_option(archive_, "compression-level", "9");
    }
    if (r == ARCHIVE_OK) {
        // no block padding after the central directory
        r = archive_write_set_bytes_in_last_block(archive_, 1);
    }
    if (r == ARCHIVE_OK) {
        r = archive_write_open(archive_, &buffer_, nullptr, append_to_buffer, nullptr);
    }
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(archive_), kTag);
    } else if (r != ARCHIVE_OK) {
        const std::string msg = "Setting up ZIP output failed: " + error_of(archive_);
        archive_write_free(archive_);
        archive_ = nullptr;
        throw ArchiveError(msg);
    }
}

ZipWriter::~ZipWriter() {
    if (archive_) {
        // archive_write_free closes an unfinished archive first
        archive_write_free(archive_);
    }
}

void ZipWriter::add_entry(const std::string& name, const std::span<const uint8_t> data) {
    if (finished_) {
        throw ArchiveError("ZIP archive already finished");
    }
    if (name.empty()) {
        throw ArchiveError("ZIP entry name is empty");
    }
    if (names_.contains(name)) {
        throw ArchiveError("Duplicate ZIP entry: " + name);
    }

    const std::unique_ptr<archive_entry, EntryDeleter> entry(archive_entry_new());
    if (!entry) {
        throw ArchiveError("archive_entry_new failed");
    }
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

    const int rh = archive_write_header(archive_, entry.get());
    if (rh == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(archive_), kTag);
    } else if (rh != ARCHIVE_OK) {
        throw ArchiveError("archive_write_header (" + name + "): " + error_of(archive_));
    }

    if (!data.empty()) {
        const la_ssize_t wrote = archive_write_data(archive_, data.data(), data.size());
        if (wrote < 0 || static_cast<size_t>(wrote) != data.size()) {
            throw ArchiveError("archive_write_data (" + name + "): " + error_of(archive_));
        }
    }
    if (archive_write_finish_entry(archive_) < ARCHIVE_WARN) {
        throw ArchiveError("archive_write_finish_entry (" + name + "): " + error_of(archive_));
    }

    names_.insert(name);
    Logger::log(LogLevel::Debug, "Added " + name + " (" + std::to_string(data.size()) + " bytes)", kTag);
}

std::vector<uint8_t> ZipWriter::finish() {
    if (finished_) {
        throw ArchiveError("ZIP archive already finished");
    }
    finished_ = true;

    if (archive_write_close(archive_) != ARCHIVE_OK) {
        throw ArchiveError("archive_write_close: " + error_of(archive_));
    }
    archive_write_free(archive_);
    archive_ = nullptr;

    Logger::log(LogLevel::Debug,
                "ZIP archive finished: " + std::to_string(names_.size()) + " entries, " +
                std::to_string(buffer_.size()) + " bytes",
                kTag);
    return std::move(buffer_);
}

} // namespace picbatch

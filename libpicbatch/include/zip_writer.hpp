/**
 * @file zip_writer.hpp
 * @brief In-memory ZIP assembly on top of libarchive.
 */

#ifndef PICBATCH_ZIP_WRITER_HPP
#define PICBATCH_ZIP_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <vector>

struct archive;

namespace picbatch {

/**
 * @brief Builds a ZIP archive in memory, one deflate-compressed entry at a time.
 *
 * Entries are written in call order. finish() closes the archive and hands
 * the bytes over; the writer cannot be reused afterwards.
 */
class ZipWriter {
public:
    /// @throws ArchiveError if libarchive cannot be set up for ZIP output.
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief Appends a regular file entry.
     * @throws ArchiveError on a duplicate name, a finished writer or a libarchive failure.
     */
    void add_entry(const std::string& name, std::span<const uint8_t> data);

    /**
     * @brief Writes the central directory and returns the archive.
     * @throws ArchiveError if closing fails or finish() was already called.
     */
    [[nodiscard]] std::vector<uint8_t> finish();

    [[nodiscard]] std::size_t entry_count() const noexcept { return names_.size(); }
    [[nodiscard]] bool contains(const std::string& name) const { return names_.contains(name); }

private:
    ::archive* archive_ = nullptr;
    std::vector<uint8_t> buffer_;
    std::set<std::string> names_;
    bool finished_ = false;
};

} // namespace picbatch

#endif // PICBATCH_ZIP_WRITER_HPP

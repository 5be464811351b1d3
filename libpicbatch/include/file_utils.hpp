#ifndef PICBATCH_FILE_UTILS_HPP
#define PICBATCH_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace picbatch {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<uint8_t> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Creates or truncates @p path and writes @p data to it.
     * @throws std::runtime_error if the file cannot be written completely.
     */
    void write_file_bytes(const std::filesystem::path &path, std::span<const uint8_t> data);

} // namespace picbatch

#endif // PICBATCH_FILE_UTILS_HPP

#ifndef PICBATCH_FILE_SCANNER_HPP
#define PICBATCH_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

/**
 * @brief Expands the command line inputs into image files.
 *
 * Files given explicitly are kept whatever their extension; directories
 * contribute their .jpg, .jpeg, .jpe, .png and .webp files (recursively when
 * @p recursive is set), sorted by path.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs, bool recursive);

/// @return True for the extensions picked up from directories (case-insensitive).
bool has_image_extension(const std::filesystem::path& path);

#endif //PICBATCH_FILE_SCANNER_HPP

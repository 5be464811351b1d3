#ifndef PICBATCH_REPORT_GENERATOR_HPP
#define PICBATCH_REPORT_GENERATOR_HPP

#include "../../../libpicbatch/include/batch_processor.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Prints the processing report table, failures and totals to stderr.
 */
void print_console_report(const std::vector<picbatch::ReportRow>& rows,
                          const std::vector<picbatch::ItemFailure>& failures,
                          std::size_t archive_size,
                          double total_seconds);

/**
 * @brief Prints the metadata preview table to stdout.
 */
void print_preview(const std::vector<picbatch::PreviewRow>& rows);

/**
 * @brief Writes the report as CSV, one line per row, then the failures.
 * @return False if the file could not be written.
 */
bool export_csv_report(const std::vector<picbatch::ReportRow>& rows,
                       const std::vector<picbatch::ItemFailure>& failures,
                       const std::filesystem::path& output_path);

/// Quotes a CSV field when it contains a separator, quote or newline.
std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

#endif //PICBATCH_REPORT_GENERATOR_HPP

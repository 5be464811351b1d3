#include "report_generator.hpp"
#include "../../../libpicbatch/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string yes_no(const bool v) {
    return v ? "Yes" : "No";
}

static std::string truncate(const std::string& s, const size_t max_len) {
    if (max_len < 4) return s.substr(0, max_len);
    return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
}

void print_console_report(const std::vector<picbatch::ReportRow>& rows,
                          const std::vector<picbatch::ItemFailure>& failures,
                          const std::size_t archive_size,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_size = 12;
    size_t max_format = 8;
    constexpr size_t max_removed = 18;
    constexpr size_t max_gps = 12;
    for (const auto& r : rows) {
        const std::string size = std::to_string(r.width) + "x" + std::to_string(r.height);
        max_size = std::max(max_size, size.size() + 2);
        max_format = std::max(max_format, r.format.size() + 2);
    }

    const unsigned fixed_cols_width = static_cast<unsigned>(max_size + max_format + max_removed + max_gps);
    const unsigned name_cols = term_width > fixed_cols_width + 20 ? term_width - fixed_cols_width : 20;
    const size_t orig_col = std::max<size_t>(10, name_cols / 2);
    const size_t new_col = std::max<size_t>(10, name_cols - orig_col);

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(orig_col)) << "Original"
              << std::setw(static_cast<int>(new_col)) << "New name"
              << std::setw(static_cast<int>(max_size)) << "Size"
              << std::setw(static_cast<int>(max_format)) << "Format"
              << std::setw(static_cast<int>(max_removed)) << "Metadata removed"
              << std::setw(static_cast<int>(max_gps)) << "GPS before"
              << "\n";

    for (const auto& r : rows) {
        const std::string size = std::to_string(r.width) + "x" + std::to_string(r.height);
        std::cerr << std::left << std::setw(static_cast<int>(orig_col)) << truncate(r.original_name, orig_col - 1)
                  << std::setw(static_cast<int>(new_col)) << truncate(r.new_name, new_col - 1)
                  << std::setw(static_cast<int>(max_size)) << size
                  << std::setw(static_cast<int>(max_format)) << r.format
                  << std::setw(static_cast<int>(max_removed)) << yes_no(r.metadata_removed)
                  << std::setw(static_cast<int>(max_gps)) << yes_no(r.gps_present_before)
                  << "\n";
    }

    if (!failures.empty()) {
        std::cerr << "\n=== Failed images ===\n";
        for (const auto& f : failures) {
            std::cerr << (use_colors ? "\033[1;31m" : "")
                      << "#" << f.index << " " << f.original_name << ": " << f.message
                      << (use_colors ? "\033[0m" : "") << "\n";
        }
    }

    std::cerr << "\nImages written: " << rows.size();
    if (!failures.empty()) {
        std::cerr << " (" << failures.size() << " failed)";
    }
    std::cerr << "\nArchive size: " << (archive_size / 1024) << " KB\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

void print_preview(const std::vector<picbatch::PreviewRow>& rows) {
    size_t max_name = 10;
    size_t max_camera = 8;
    for (const auto& r : rows) {
        max_name = std::max(max_name, r.file_name.size() + 2);
        max_camera = std::max(max_camera, r.camera.size() + 2);
    }

    std::cout << std::left << std::setw(static_cast<int>(max_name)) << "File"
              << std::setw(12) << "Size"
              << std::setw(static_cast<int>(max_camera)) << "Camera"
              << std::setw(21) << "Date"
              << "GPS\n";

    for (const auto& r : rows) {
        std::cout << std::left << std::setw(static_cast<int>(max_name)) << r.file_name;
        if (r.error) {
            std::cout << "error: " << *r.error << "\n";
            continue;
        }
        std::ostringstream size;
        size << r.width << "x" << r.height;
        std::cout << std::setw(12) << size.str()
                  << std::setw(static_cast<int>(max_camera)) << r.camera
                  << std::setw(21) << r.date
                  << r.gps << "\n";
    }
}

bool export_csv_report(const std::vector<picbatch::ReportRow>& rows,
                       const std::vector<picbatch::ItemFailure>& failures,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) {
        picbatch::Logger::log(picbatch::LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }

    out << "Original,New name,Width,Height,Format,Metadata removed,GPS before\n";
    for (const auto& r : rows) {
        out << csv_escape(r.original_name) << ","
            << csv_escape(r.new_name) << ","
            << r.width << ","
            << r.height << ","
            << csv_escape(r.format) << ","
            << yes_no(r.metadata_removed) << ","
            << yes_no(r.gps_present_before) << "\n";
    }

    if (!failures.empty()) {
        out << "\n\nIndex,Original,Error\n";
        for (const auto& f : failures) {
            out << f.index << ","
                << csv_escape(f.original_name) << ","
                << csv_escape(f.message) << "\n";
        }
    }

    out.flush();
    return static_cast<bool>(out);
}

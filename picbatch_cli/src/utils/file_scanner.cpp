#include "file_scanner.hpp"
#include "../../../libpicbatch/include/image_format.hpp"
#include "../../../libpicbatch/include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

using picbatch::Logger;
using picbatch::LogLevel;
namespace fs = std::filesystem;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini";
}

bool has_image_extension(const fs::path& path) {
    const std::string ext = path.extension().string();
    return !ext.empty() && picbatch::parse_image_format(ext).has_value();
}

namespace {
template <typename Iterator>
void collect_from(Iterator it, std::vector<fs::path>& out) {
    std::vector<fs::path> found;
    for (const auto& e : it) {
        std::error_code ec;
        if (e.is_regular_file(ec) && !is_junk(e.path()) && has_image_extension(e.path())) {
            found.push_back(e.path());
        }
    }
    std::ranges::sort(found);
    out.insert(out.end(), found.begin(), found.end());
}
} // namespace

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs, const bool recursive) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            if (recursive) {
                collect_from(fs::recursive_directory_iterator(in, fs::directory_options::skip_permission_denied), result);
            } else {
                collect_from(fs::directory_iterator(in), result);
            }
        } else if (fs::is_regular_file(in, ec) && !is_junk(in)) {
            result.push_back(in);
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}

#include "cli_parser.hpp"
#include "../../../libpicbatch/include/errors.hpp"
#include "../../../libpicbatch/include/filename_builder.hpp"
#include "../../../libpicbatch/include/image_format.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string_view>

namespace {
// helper for validating naming templates before any image is read
struct PatternValidator : CLI::Validator {
    PatternValidator() {
        name_ = "PATTERN";
        func_ = [](const std::string& str) {
            try {
                picbatch::validate_pattern(str);
            } catch (const picbatch::FormatError& e) {
                return std::string(e.what()) + ". Placeholders: {index}, {index:03}, {name}, {date}.";
            }
            return std::string(); // ok
        };
    }
};

// maps a name onto an enum through the library's parser; CLI11 then
// converts the integral string into the option's enum
template <typename Enum>
CLI::Validator enum_transformer(std::optional<Enum> (*parse)(std::string_view), const std::string& choices) {
    return CLI::Validator(
        [parse, choices](std::string& input) {
            const auto parsed = parse(input);
            if (!parsed) {
                return "'" + input + "' is not one of " + choices;
            }
            input = std::to_string(static_cast<int>(*parsed));
            return std::string(); // ok
        },
        "{" + choices + "}");
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress, report table).");

    app.add_flag("--peek", settings.peek,
                 "Print the metadata preview of the inputs and exit.");

    app.add_flag("--keep-gps", settings.keep_gps,
                 "Keep GPS location tags (stripped by default).");

    app.add_flag("--keep-serials", settings.keep_serials,
                 "Keep camera/lens serial numbers and owner name (stripped by default).");

    // --- Output ---
    app.add_option("-o,--output", settings.output_path,
                   "ZIP archive to write.")
                   ->capture_default_str();

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Processing ---
    app.add_option("--resize-mode", settings.resize_mode,
                   "Resize by 'percent' (default), fixed 'width' or fixed 'height'.")
        ->transform(enum_transformer(picbatch::parse_resize_mode, "percent,width,height"));

    app.add_option("--resize-value", settings.resize_value,
                   "Percentage or pixel size (default: 50 for percent, 1200 for width/height).")
        ->check(CLI::Range(picbatch::kMinResizeValue, picbatch::kMaxResizeValue));

    app.add_option("--format", settings.format,
                   "Output format: jpg (default), png or webp.")
        ->transform(enum_transformer(picbatch::parse_image_format, "jpg,png,webp"));

    app.add_option("--quality", settings.quality,
                   "JPEG/WebP quality.")
        ->capture_default_str()
        ->check(CLI::Range(picbatch::kMinQuality, picbatch::kMaxQuality));

    app.add_option("--pattern", settings.pattern,
                   "Output name template: {index}, {index:03}, {name}, {date}; {{ and }} for braces.")
        ->capture_default_str()
        ->check(PatternValidator());

    app.add_option("--on-error", settings.on_error,
                   "What to do when an image fails: 'fail-fast' (default) or 'isolate'.")
        ->transform(enum_transformer(picbatch::parse_failure_policy, "fail-fast,isolate"));

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more image files or directories")
        ->required()
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.peek && !settings.report_path.empty()) {
            throw CLI::ValidationError("--peek and --report cannot be used together.");
        }
        if (!settings.peek && std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a file, not a directory.");
        }
    });
}

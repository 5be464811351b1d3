#include <chrono>
#include <clocale>
#include <filesystem>
#include <iostream>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libpicbatch/include/action_log.hpp"
#include "../../libpicbatch/include/batch_processor.hpp"
#include "../../libpicbatch/include/codec_registry.hpp"
#include "../../libpicbatch/include/event_bus.hpp"
#include "../../libpicbatch/include/events.hpp"
#include "../../libpicbatch/include/file_utils.hpp"
#include "../../libpicbatch/include/image_format.hpp"
#include "../../libpicbatch/include/logger.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"

using namespace picbatch;
namespace fs = std::filesystem;

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// install the console and file sinks requested on the command line
static bool setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file.string(), false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return false;
        }
        Logger::add_sink(std::move(fileSink));
    }

    const auto level = Logger::string_to_level(settings.log_level);
    if (level) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        // -q keeps errors only
        consoleSink->log_level = settings.quiet ? LogLevel::Error : *level;
        Logger::add_sink(std::move(consoleSink));
    }
    return true;
}

static std::vector<ImageAsset> load_assets(const std::vector<fs::path>& files) {
    std::vector<ImageAsset> assets;
    assets.reserve(files.size());
    for (const auto& file : files) {
        ImageAsset asset;
        asset.bytes = read_file_bytes(file);
        asset.file_name = file.filename().string();
        Logger::log(LogLevel::Debug,
                    "Loaded " + file.string() + " (" + std::to_string(asset.bytes.size()) + " bytes)", "main");
        assets.push_back(std::move(asset));
    }
    return assets;
}

int main(int argc, char* argv[]) {

    CLI::App app{"picbatch: resize, strip and rename images into a ZIP archive."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    if (!setup_logging(settings)) {
        return 1;
    }
    init_utf8_locale();

    // collect input files
    const auto files = collect_input_files(settings.inputs, settings.recursive);
    if (files.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        std::cerr << RED << "No valid input files." << RESET << std::endl;
        return 1;
    }

    std::vector<ImageAsset> assets;
    try {
        assets = load_assets(files);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }

    // registry of codecs and event bus
    const CodecRegistry registry;
    EventBus bus;
    ActionLog action_log;
    action_log.attach(bus);

    const BatchProcessor processor(registry, bus);

    if (settings.peek) {
        print_preview(processor.peek(assets));
        return 0;
    }

    bus.subscribe<ItemCompleteEvent>([&](const ItemCompleteEvent& e) {
        if (!settings.quiet) {
            std::cerr << GREEN
                      << "[DONE] " << e.original_name << " -> " << e.new_name
                      << " (" << e.input_size << " -> " << e.output_size << " bytes)"
                      << RESET << std::endl;
        }
    });

    bus.subscribe<ItemErrorEvent>([&](const ItemErrorEvent& e) {
        std::cerr << RED
                  << "[FAIL] " << e.original_name << ": " << e.error_message
                  << RESET << std::endl;
    });

    const auto start_total = std::chrono::steady_clock::now();

    BatchResult result;
    try {
        result = processor.process(assets, settings.resize_spec(), settings.output_policy());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << "\nNo archive was written." << RESET << std::endl;
        return 1;
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    try {
        write_file_bytes(settings.output_path, result.archive);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
    Logger::log(LogLevel::Info, "Archive written to " + settings.output_path.string(), "main");

    // export CSV if requested
    bool report_ok = true;
    if (!settings.report_path.empty()) {
        report_ok = export_csv_report(result.rows, result.failures, settings.report_path);
        if (!report_ok) {
            std::cerr << RED << "Error: cannot write report to " << settings.report_path.string()
                      << RESET << std::endl;
        }
    }

    if (!settings.quiet) {
        print_console_report(result.rows, result.failures, result.archive.size(), total_seconds);
        for (const auto& entry : action_log.entries()) {
            std::cerr << CYAN << entry << RESET << std::endl;
        }
        std::cerr << "Saved " << image_format_to_string(settings.format) << " archive: "
                  << settings.output_path.string() << std::endl;
    }

    if (!report_ok) {
        return 1;
    }
    // some images were skipped under --on-error isolate
    return result.failures.empty() ? 0 : 2;
}

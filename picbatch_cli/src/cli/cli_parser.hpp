#ifndef PICBATCH_CLI_PARSER_HPP
#define PICBATCH_CLI_PARSER_HPP

#include "../../../libpicbatch/include/batch_processor.hpp"
#include "../../../libpicbatch/include/geometry.hpp"
#include "../../../libpicbatch/include/image_format.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;
    bool peek = false;
    bool keep_gps = false;
    bool keep_serials = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path = "processed_images.zip";
    std::filesystem::path report_path;

    picbatch::ResizeMode resize_mode = picbatch::ResizeMode::Percent;
    std::optional<int> resize_value;
    picbatch::ImageFormat format = picbatch::ImageFormat::Jpeg;
    int quality = 85;
    std::string pattern = "img_{index}_{date}";
    picbatch::FailurePolicy on_error = picbatch::FailurePolicy::FailFast;

    std::vector<std::filesystem::path> inputs;

    /// @return The resize spec, defaulting the value to 50 (percent) or 1200 (pixels).
    [[nodiscard]] picbatch::ResizeSpec resize_spec() const {
        const int fallback = resize_mode == picbatch::ResizeMode::Percent ? 50 : 1200;
        return {resize_mode, resize_value.value_or(fallback)};
    }

    [[nodiscard]] picbatch::OutputPolicy output_policy() const {
        picbatch::OutputPolicy policy;
        policy.format = format;
        policy.quality = quality;
        policy.strip_gps = !keep_gps;
        policy.strip_serials = !keep_serials;
        policy.name_pattern = pattern;
        policy.on_error = on_error;
        return policy;
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //PICBATCH_CLI_PARSER_HPP

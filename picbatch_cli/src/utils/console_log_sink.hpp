#ifndef PICBATCH_CONSOLE_LOG_SINK_HPP
#define PICBATCH_CONSOLE_LOG_SINK_HPP

#include "../../../libpicbatch/include/log_sink.hpp"
#include <iostream>

/**
 * @brief Prints messages at or above log_level; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public picbatch::ILogSink {
public:
    picbatch::LogLevel log_level = picbatch::LogLevel::Error;

    void log(const picbatch::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using picbatch::LogLevel;
        if (level < log_level) return;
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // PICBATCH_CONSOLE_LOG_SINK_HPP

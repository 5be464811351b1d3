/**
 * @file logger.hpp
 * @brief Static logging facade shared by the library and the CLI.
 */

#ifndef PICBATCH_LOGGER_HPP
#define PICBATCH_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace picbatch {

/**
 * @brief Static logging facade for picbatch.
 *
 * Every component logs through Logger::log() with its own tag. With no
 * sink installed messages are dropped, which is what the tests rely on.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "picbatch").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "picbatch");

    /// @return Number of installed sinks.
    [[nodiscard]] static std::size_t sink_count();

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a --log-level value.
     * @param level "DEBUG", "INFO", "WARNING" or "ERROR" (case-insensitive).
     * @return The matching level, or std::nullopt for anything else
     * (including "NONE", which the CLI treats as "no console sink").
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace picbatch

#endif // PICBATCH_LOGGER_HPP

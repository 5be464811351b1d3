/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef PICBATCH_LOG_SINK_HPP
#define PICBATCH_LOG_SINK_HPP

#include <string_view>

namespace picbatch {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-tag decisions of the pipeline (metadata fallbacks, chosen codecs)
    Info,    ///< Batch and item progress
    Warning, ///< Recovered problems (malformed EXIF, metadata not embedded)
    Error    ///< Failures that abort an item or the batch
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, memory).
 * Logger fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "exif_codec").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace picbatch

#endif // PICBATCH_LOG_SINK_HPP

#ifndef PICBATCH_EVENTS_HPP
#define PICBATCH_EVENTS_HPP

#include "image_format.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace picbatch {

/**
 * @brief Events published by BatchProcessor while a batch runs.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (e.g. CLI, action log, tests) about progress, errors, and results.
 * They are simple data carriers without behavior.
 */

/**
 * @brief Emitted once the batch settings are validated, before the first item.
 */
struct BatchStartEvent {
    std::size_t input_count = 0; ///< Number of input images
    ImageFormat format = ImageFormat::Jpeg; ///< Output format
};

/**
 * @brief Emitted when processing of an item begins.
 */
struct ItemStartEvent {
    std::size_t index = 0;     ///< 1-based position in the batch
    std::string original_name; ///< Input file name
};

/**
 * @brief Emitted when an item has been added to the archive.
 */
struct ItemCompleteEvent {
    std::size_t index = 0;
    std::string original_name;
    std::string new_name;                  ///< Archive entry name
    std::size_t input_size = 0;            ///< Input size in bytes
    std::size_t output_size = 0;           ///< Encoded size in bytes
    std::chrono::milliseconds duration{0}; ///< Processing duration
};

/**
 * @brief Emitted when an item fails.
 */
struct ItemErrorEvent {
    std::size_t index = 0;
    std::string original_name;
    std::string error_message; ///< Error description
};

/**
 * @brief Emitted after the archive has been finished.
 */
struct BatchCompleteEvent {
    std::size_t input_count = 0;  ///< Number of input images
    std::size_t output_count = 0; ///< Number of archive entries
    std::size_t failed_count = 0; ///< Items skipped under FailurePolicy::Isolate
    ImageFormat format = ImageFormat::Jpeg;
};

} // namespace picbatch

#endif // PICBATCH_EVENTS_HPP

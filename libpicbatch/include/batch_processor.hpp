/**
 * @file batch_processor.hpp
 * @brief Defines the orchestrator that turns a list of images into an
 * archive plus a report.
 *
 * Per image: decode, orientation transpose, metadata summary, metadata
 * sanitization, resize, naming, re-encode, archive entry, report row.
 */

#ifndef PICBATCH_BATCH_PROCESSOR_HPP
#define PICBATCH_BATCH_PROCESSOR_HPP

#include "codec_registry.hpp"
#include "event_bus.hpp"
#include "geometry.hpp"
#include "image_format.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace picbatch {

/// One input image as uploaded.
struct ImageAsset {
    std::vector<uint8_t> bytes;
    std::string file_name;
};

/**
 * @brief What happens when one image of the batch fails.
 */
enum class FailurePolicy {
    FailFast, ///< rethrow the first error; no archive is produced
    Isolate   ///< record an ItemFailure, skip the image and continue
};

/// @return "fail-fast" or "isolate".
std::string_view failure_policy_name(FailurePolicy policy) noexcept;

/// Parses "fail-fast" or "isolate", ignoring case.
std::optional<FailurePolicy> parse_failure_policy(std::string_view name);

inline constexpr int kMinQuality = 1;
inline constexpr int kMaxQuality = 100;

struct OutputPolicy {
    ImageFormat format = ImageFormat::Jpeg;
    int quality = 85; ///< JPEG and WebP only
    bool strip_gps = true;
    bool strip_serials = true;
    std::string name_pattern = "img_{index}_{date}";
    FailurePolicy on_error = FailurePolicy::FailFast;
};

/// One processed image, in input order.
struct ReportRow {
    std::string original_name;
    std::string new_name;           ///< archive entry name, extension included
    int width = 0;                  ///< output width
    int height = 0;                 ///< output height
    std::string format;             ///< "JPEG", "PNG" or "WEBP"
    bool metadata_removed = false;  ///< source had metadata the output does not carry unchanged
    bool gps_present_before = false;
};

struct ItemFailure {
    std::size_t index = 0; ///< 1-based
    std::string original_name;
    std::string message;
};

struct BatchResult {
    std::vector<uint8_t> archive; ///< ZIP file, one entry per report row
    std::vector<ReportRow> rows;
    std::vector<ItemFailure> failures; ///< only filled under FailurePolicy::Isolate
};

/// Metadata preview of one input, or the reason it could not be read.
struct PreviewRow {
    std::string file_name;
    int width = 0;
    int height = 0;
    std::string camera;
    std::string date;
    std::string gps;                  ///< "Yes" or "No"
    std::optional<std::string> error; ///< set when the image could not be decoded
};

/**
 * @brief Runs batches of images through the processing pipeline.
 *
 * @details Stateless between calls: every process() owns its archive and
 * report. Progress is published on the EventBus given at construction
 * (BatchStartEvent, ItemStartEvent, ItemCompleteEvent, ItemErrorEvent,
 * BatchCompleteEvent).
 */
class BatchProcessor {
public:
    /**
     * @param registry Codecs used for decoding and encoding. Must outlive the processor.
     * @param bus EventBus used to publish progress. Must outlive the processor.
     */
    BatchProcessor(const CodecRegistry& registry, EventBus& bus);

    /**
     * @brief Processes @p assets into a ZIP archive and a report.
     *
     * The name pattern, quality and resize value are validated before any
     * image is touched.
     *
     * @throws FormatError / UnsupportedTokenError for a bad name pattern.
     * @throws std::invalid_argument for an out of range quality or resize value.
     * @throws ArchiveError if the archive cannot be written.
     * @throws ImageDecodeError, ImageEncodeError (or any per-image error)
     * under FailurePolicy::FailFast.
     */
    [[nodiscard]] BatchResult process(const std::vector<ImageAsset>& assets,
                                      const ResizeSpec& resize_spec,
                                      const OutputPolicy& policy) const;

    /**
     * @brief Decodes each asset and summarizes its metadata.
     *
     * Never throws for a bad image: the row carries the error instead.
     */
    [[nodiscard]] std::vector<PreviewRow> peek(const std::vector<ImageAsset>& assets) const;

private:
    const CodecRegistry& registry_;
    EventBus& event_bus_;
};

} // namespace picbatch

#endif // PICBATCH_BATCH_PROCESSOR_HPP

#include "../../include/batch_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/exif_codec.hpp"
#include "../../include/exif_sanitizer.hpp"
#include "../../include/exif_summary.hpp"
#include "../../include/filename_builder.hpp"
#include "../../include/logger.hpp"
#include "../../include/zip_writer.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>

namespace picbatch {

namespace {

constexpr const char* kTag = "batch_processor";

/// Decoded image with its metadata, orientation already applied.
struct Prepared {
    Image image;
    ExifDocument exif;
};

void validate(const ResizeSpec& spec, const OutputPolicy& policy, const CodecRegistry& registry) {
    validate_pattern(policy.name_pattern);

    if (policy.quality < kMinQuality || policy.quality > kMaxQuality) {
        throw std::invalid_argument("Quality " + std::to_string(policy.quality) + " outside " +
                                    std::to_string(kMinQuality) + ".." + std::to_string(kMaxQuality));
    }
    if (spec.value > kMaxResizeValue ||
        (spec.mode != ResizeMode::Percent && spec.value < kMinResizeValue)) {
        throw std::invalid_argument("Resize value " + std::to_string(spec.value) + " outside " +
                                    std::to_string(kMinResizeValue) + ".." + std::to_string(kMaxResizeValue));
    }
    if (!registry.find_by_format(policy.format)) {
        throw std::invalid_argument("No encoder for output format " + image_format_to_string(policy.format));
    }
}

/// Path separators become '_', an empty name becomes image_<index>.
std::string safe_base_name(std::string base, const std::size_t index) {
    for (char& c : base) {
        if (c == '/' || c == '\\') c = '_';
    }
    if (base.empty()) {
        base = "image_" + std::to_string(index);
    }
    return base;
}

/// Appends _2, _3, ... before the extension until the name is unused.
std::string unique_entry_name(const std::string& base, const std::string& ext, const ZipWriter& zip) {
    std::string name = base + "." + ext;
    for (std::size_t n = 2; zip.contains(name); ++n) {
        name = base + "_" + std::to_string(n) + "." + ext;
    }
    return name;
}

Prepared prepare(const CodecRegistry& registry, const ImageAsset& asset) {
    const IImageCodec* codec = registry.find_for_content(asset.bytes);
    if (!codec) {
        throw ImageDecodeError("Unsupported image format: " + asset.file_name);
    }
    DecodedImage decoded = codec->decode(asset.bytes);
    ExifDocument exif = decode_exif(decoded.exif);
    Image upright = apply_orientation(decoded.image, exif);
    return {std::move(upright), std::move(exif)};
}

} // namespace

std::string_view failure_policy_name(const FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::FailFast: return "fail-fast";
        case FailurePolicy::Isolate:  return "isolate";
    }
    return "";
}

std::optional<FailurePolicy> parse_failure_policy(const std::string_view name) {
    std::string s(name);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "fail-fast") return FailurePolicy::FailFast;
    if (s == "isolate") return FailurePolicy::Isolate;
    return std::nullopt;
}

BatchProcessor::BatchProcessor(const CodecRegistry& registry, EventBus& bus)
    : registry_(registry), event_bus_(bus) {}

BatchResult BatchProcessor::process(const std::vector<ImageAsset>& assets,
                                    const ResizeSpec& resize_spec,
                                    const OutputPolicy& policy) const {
    validate(resize_spec, policy, registry_);

    const IImageCodec* encoder = registry_.find_by_format(policy.format);
    const std::string ext = image_format_extension(policy.format);

    Logger::log(LogLevel::Info,
                "Starting batch: " + std::to_string(assets.size()) + " images -> " +
                image_format_to_string(policy.format) + ", resize " + std::string(resize_mode_name(resize_spec.mode)) +
                "=" + std::to_string(resize_spec.value) + ", on-error " + std::string(failure_policy_name(policy.on_error)),
                kTag);
    event_bus_.publish(BatchStartEvent{assets.size(), policy.format});

    ZipWriter zip;
    BatchResult result;

    for (std::size_t i = 0; i < assets.size(); ++i) {
        const ImageAsset& asset = assets[i];
        const std::size_t index = i + 1;
        const auto start = std::chrono::steady_clock::now();
        event_bus_.publish(ItemStartEvent{index, asset.file_name});

        try {
            Prepared prepared = prepare(registry_, asset);
            const MetadataSummary summary = summarize(prepared.exif);
            const ExifDocument sanitized = sanitize(prepared.exif, policy.strip_gps, policy.strip_serials);
            const Image resized = resize(prepared.image, resize_spec);

            const std::string base = safe_base_name(
                build_name(policy.name_pattern, index, asset.file_name, summary.date_time), index);
            const std::string entry_name = unique_entry_name(base, ext, zip);

            std::optional<std::vector<uint8_t>> exif_block;
            if (encoder->can_embed_exif() && !sanitized.empty()) {
                exif_block = try_encode_exif(sanitized);
            }
            EncodeOptions options;
            options.quality = policy.quality;
            if (exif_block) {
                options.exif = *exif_block;
            }
            const std::vector<uint8_t> encoded = encoder->encode(resized, options);

            zip.add_entry(entry_name, encoded);

            const bool embedded = exif_block.has_value();
            ReportRow row;
            row.original_name = asset.file_name;
            row.new_name = entry_name;
            row.width = resized.width();
            row.height = resized.height();
            row.format = image_format_to_string(policy.format);
            row.metadata_removed = !prepared.exif.empty() && (!embedded || sanitized != prepared.exif);
            row.gps_present_before = summary.gps_present;
            result.rows.push_back(std::move(row));

            const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            Logger::log(LogLevel::Info,
                        asset.file_name + " -> " + entry_name + " (" + std::to_string(resized.width()) + "x" +
                        std::to_string(resized.height()) + ", " + std::to_string(encoded.size()) + " bytes)",
                        kTag);
            event_bus_.publish(ItemCompleteEvent{index, asset.file_name, entry_name,
                                                 asset.bytes.size(), encoded.size(), duration});
        } catch (const ArchiveError&) {
            // a broken archive cannot be recovered per item
            throw;
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Failed to process " + asset.file_name + ": " + e.what(), kTag);
            event_bus_.publish(ItemErrorEvent{index, asset.file_name, e.what()});
            if (policy.on_error == FailurePolicy::FailFast) {
                throw;
            }
            result.failures.push_back({index, asset.file_name, e.what()});
        }
    }

    result.archive = zip.finish();

    Logger::log(LogLevel::Info,
                "Batch complete: " + std::to_string(result.rows.size()) + " of " + std::to_string(assets.size()) +
                " images written, archive " + std::to_string(result.archive.size()) + " bytes",
                kTag);
    event_bus_.publish(BatchCompleteEvent{assets.size(), result.rows.size(), result.failures.size(), policy.format});
    return result;
}

std::vector<PreviewRow> BatchProcessor::peek(const std::vector<ImageAsset>& assets) const {
    std::vector<PreviewRow> rows;
    rows.reserve(assets.size());

    for (const auto& asset : assets) {
        PreviewRow row;
        row.file_name = asset.file_name;
        try {
            const Prepared prepared = prepare(registry_, asset);
            const MetadataSummary summary = summarize(prepared.exif);
            row.width = prepared.image.width();
            row.height = prepared.image.height();
            row.camera = summary.camera();
            row.date = summary.date_time.value_or("");
            row.gps = std::string(summary.gps_label());
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, "Cannot preview " + asset.file_name + ": " + e.what(), kTag);
            row.error = e.what();
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace picbatch

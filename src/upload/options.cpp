#include "skyup/upload/options.hpp"

#include <algorithm>
#include <limits>

namespace skyup::upload {
namespace {

template<typename T>
void apply(T& target, const std::optional<T>& value) {
    if (value.has_value()) {
        target = *value;
    }
}

template<typename T>
std::string describe_invalid(const std::string& name, const T& value, const std::string& expectation) {
    return "Expected option '" + name + "' to be " + expectation + ", was '" +
           std::to_string(value) + "'";
}

} // namespace

UploadOptions default_upload_options() {
    using std::chrono::milliseconds;
    UploadOptions options;
    options.retry_delays = {
        milliseconds{0},
        milliseconds{5'000},
        milliseconds{15'000},
        milliseconds{60'000},
        milliseconds{300'000},
        milliseconds{600'000},
    };
    return options;
}

void apply_overrides(UploadOptions& options, const UploadOverrides& layer) {
    apply(options.large_file_size, layer.large_file_size);
    apply(options.base_chunk_size, layer.base_chunk_size);
    apply(options.chunk_size_multiplier, layer.chunk_size_multiplier);
    apply(options.num_parallel_uploads, layer.num_parallel_uploads);
    apply(options.stagger_percent, layer.stagger_percent);
    apply(options.retry_delays, layer.retry_delays);
    apply(options.dry_run, layer.dry_run);
    if (layer.custom_filename.has_value()) {
        options.custom_filename = layer.custom_filename;
    }
    apply(options.endpoint_upload, layer.endpoint_upload);
    apply(options.endpoint_large_upload, layer.endpoint_large_upload);
    apply(options.portal_file_fieldname, layer.portal_file_fieldname);
}

UploadOptions merge_options(const UploadOptions& defaults,
                            const UploadOverrides& client_layer,
                            const UploadOverrides& call_layer) {
    UploadOptions merged = defaults;
    apply_overrides(merged, client_layer);
    apply_overrides(merged, call_layer);
    return merged;
}

Result<void> validate_options(const UploadOptions& options) {
    if (options.large_file_size < 1) {
        return Err<void>(invalid_argument(
            describe_invalid("largeFileSize", options.large_file_size, "greater than or equal to 1")));
    }
    if (options.base_chunk_size < 1) {
        return Err<void>(invalid_argument(
            describe_invalid("baseChunkSize", options.base_chunk_size, "greater than or equal to 1")));
    }
    if (options.chunk_size_multiplier < 1) {
        return Err<void>(invalid_argument(
            describe_invalid("chunkSizeMultiplier", options.chunk_size_multiplier, "greater than or equal to 1")));
    }
    // The partitioner works in signed 64-bit arithmetic.
    const auto max_chunk = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (options.base_chunk_size > max_chunk) {
        return Err<void>(invalid_argument(
            describe_invalid("baseChunkSize", options.base_chunk_size, "at most " + std::to_string(max_chunk))));
    }
    const auto max_multiplier = max_chunk / options.base_chunk_size;
    if (static_cast<std::uint64_t>(options.chunk_size_multiplier) > max_multiplier) {
        return Err<void>(invalid_argument(
            describe_invalid("chunkSizeMultiplier", options.chunk_size_multiplier,
                             "at most " + std::to_string(max_multiplier) + " for a base chunk size of " +
                                 std::to_string(options.base_chunk_size))));
    }
    if (options.num_parallel_uploads < 1) {
        return Err<void>(invalid_argument(
            describe_invalid("numParallelUploads", options.num_parallel_uploads, "greater than or equal to 1")));
    }
    if (options.stagger_percent.has_value() &&
        (*options.stagger_percent < 0 || *options.stagger_percent > 100)) {
        return Err<void>(invalid_argument(
            describe_invalid("staggerPercent", *options.stagger_percent, "between 0 and 100")));
    }
    for (const auto& delay : options.retry_delays) {
        if (delay.count() < 0) {
            return Err<void>(invalid_argument(
                describe_invalid("retryDelays", delay.count(), "non-negative")));
        }
    }
    if (options.endpoint_large_upload.empty() || options.endpoint_upload.empty()) {
        return Err<void>(invalid_argument("Upload endpoints must not be empty"));
    }
    if (options.portal_file_fieldname.empty()) {
        return Err<void>(invalid_argument("Expected option 'portalFileFieldname' to be non-empty"));
    }
    return Ok();
}

Result<int> checked_stagger_percent(std::int64_t value) {
    if (value < 0 || value > 100) {
        return Err<int>(invalid_argument(describe_invalid("staggerPercent", value, "between 0 and 100")));
    }
    return Ok(static_cast<int>(value));
}

std::uint64_t effective_chunk_size(const UploadOptions& options) {
    return options.base_chunk_size * static_cast<std::uint64_t>(options.chunk_size_multiplier);
}

std::size_t effective_parallelism(std::uint64_t total_size, const UploadOptions& options) {
    const std::uint64_t whole_chunks =
        (total_size + options.base_chunk_size - 1) / options.base_chunk_size;
    const std::uint64_t requested = static_cast<std::uint64_t>(options.num_parallel_uploads);
    return static_cast<std::size_t>(std::max<std::uint64_t>(1, std::min(requested, whole_chunks)));
}

} // namespace skyup::upload

#pragma once

#include "skyup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skyup::upload {

/// Base chunk size of the portal's resumable upload endpoint (40 MiB).
constexpr std::uint64_t kTusChunkSize = (std::uint64_t{1} << 22) * 10;

/**
 * @brief Fully resolved options for one upload call
 *
 * Counts are signed so that out-of-range values read from configuration
 * reach validate_options() instead of wrapping.
 */
struct UploadOptions {
    std::uint64_t large_file_size = kTusChunkSize;
    std::uint64_t base_chunk_size = kTusChunkSize;
    std::int64_t chunk_size_multiplier = 1;
    std::int64_t num_parallel_uploads = 2;
    std::optional<int> stagger_percent = 50;
    std::vector<std::chrono::milliseconds> retry_delays;
    bool dry_run = false;
    std::optional<std::string> custom_filename;

    std::string endpoint_upload = "/skynet/skyfile";
    std::string endpoint_large_upload = "/skynet/tus";
    std::string portal_file_fieldname = "file";
};

/**
 * @brief One configuration layer; unset fields leave the lower layer alone
 *
 * `stagger_percent` holds an inner nullopt to switch stagger off explicitly.
 */
struct UploadOverrides {
    std::optional<std::uint64_t> large_file_size;
    std::optional<std::uint64_t> base_chunk_size;
    std::optional<std::int64_t> chunk_size_multiplier;
    std::optional<std::int64_t> num_parallel_uploads;
    std::optional<std::optional<int>> stagger_percent;
    std::optional<std::vector<std::chrono::milliseconds>> retry_delays;
    std::optional<bool> dry_run;
    std::optional<std::string> custom_filename;
    std::optional<std::string> endpoint_upload;
    std::optional<std::string> endpoint_large_upload;
    std::optional<std::string> portal_file_fieldname;
};

/// Built-in defaults: 40 MiB threshold and chunks, 2 parallel uploads,
/// 50% stagger, retries after 0s, 5s, 15s, 60s, 300s and 600s.
UploadOptions default_upload_options();

/// Copy every set field of `layer` onto `options`.
void apply_overrides(UploadOptions& options, const UploadOverrides& layer);

/**
 * @brief Layered merge, lowest precedence first:
 * built-in defaults < client-level overrides < call-level overrides
 */
UploadOptions merge_options(const UploadOptions& defaults,
                            const UploadOverrides& client_layer,
                            const UploadOverrides& call_layer);

/**
 * @brief Reject option values no upload may run with
 *
 * Runs before any I/O; every failure is InvalidArgument.
 */
Result<void> validate_options(const UploadOptions& options);

/// Narrow a parsed staggerPercent to int after checking it lies in [0, 100].
Result<int> checked_stagger_percent(std::int64_t value);

/// Size of every chunk a session delivers.
std::uint64_t effective_chunk_size(const UploadOptions& options);

/**
 * @brief min(numParallelUploads, ceil(totalSize / baseChunkSize)), at least 1
 *
 * Never plans more parts than there are base chunks, so no part is empty.
 * Expects options that passed validate_options().
 */
std::size_t effective_parallelism(std::uint64_t total_size, const UploadOptions& options);

} // namespace skyup::upload

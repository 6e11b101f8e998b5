#pragma once

#include "skyup/core/cancellation.hpp"
#include "skyup/core/channel.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace skyup::upload {

/**
 * @brief Half-open byte range [start, end) of the source owned by one session
 */
struct Part {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }

    bool operator==(const Part& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const Part& other) const noexcept { return !(*this == other); }
};

/// Contiguous, increasing parts covering [0, totalSize).
using PartitionPlan = std::vector<Part>;

enum class UploadStrategy {
    SmallFile,  // one multipart request
    LargeFile   // one or more resumable sessions
};

/**
 * @brief Successful upload result
 */
struct UploadOutcome {
    std::string skylink;    ///< Bare 46-character form
    std::string uri;        ///< "sia://" + skylink
    std::size_t parts = 0;  ///< Sessions used; 0 for the single-request path
    std::uint64_t bytes = 0;
};

enum class ProgressKind {
    Started,
    PartStarted,
    BytesSent,
    Retrying,
    PartCompleted,
    Finalizing,
    Completed,
    Failed
};

/**
 * @brief One incremental progress record pushed to the caller's channel
 */
struct ProgressEvent {
    ProgressKind kind = ProgressKind::Started;
    std::size_t part_index = 0;
    std::uint64_t bytes_sent = 0;   ///< Aggregate over all parts
    std::uint64_t total_bytes = 0;
    std::string detail;             ///< Skylink on Completed, error text on Retrying / Failed
};

using ProgressChannel = Channel<ProgressEvent>;

/**
 * @brief Per-call handles for structured cancellation and progress
 *
 * Both members are optional. The channel is closed by the uploader once the
 * call returns.
 */
struct UploadContext {
    std::shared_ptr<CancellationToken> cancel;
    std::shared_ptr<ProgressChannel> progress;
};

const char* to_string(UploadStrategy strategy);
const char* to_string(ProgressKind kind);

} // namespace skyup::upload

#pragma once

#include "skyup/core/cancellation.hpp"
#include "skyup/core/result.hpp"
#include "skyup/transfer/protocol.hpp"
#include "skyup/upload/source.hpp"
#include "skyup/upload/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace skyup::transfer {

enum class SessionState {
    Idle,
    Creating,
    Transferring,
    Complete,
    Failed,
    Cancelled
};

const char* to_string(SessionState state);

/**
 * @brief Everything one session needs to know about its part
 */
struct SessionSpec {
    std::size_t index = 0;
    upload::Part range;
    std::uint64_t chunk_size = upload::kTusChunkSize;
    bool partial = false;
    UploadMetadata metadata;
    std::vector<std::chrono::milliseconds> retry_delays;
};

struct SessionHooks {
    /// Bytes of the part delivered so far, including the chunk in flight.
    std::function<void(std::size_t index, std::uint64_t part_bytes)> on_progress;
    std::function<void(std::size_t index, const Error& error, std::chrono::milliseconds delay)> on_retry;
};

/**
 * @brief Uploads one byte range as one resumable upload, chunk by chunk
 *
 * Idle -> Creating -> Transferring -> Complete, with Failed and Cancelled
 * reachable from any non-terminal state.
 *
 * Transient failures are retried after the next entry of `retry_delays`;
 * the list is consumed in order across the whole session and never reset.
 * After a failure the session asks the server for its offset and resumes
 * from there. The current chunk stays buffered so resuming inside it does
 * not re-read the source.
 *
 * Cancellation is observed before every request, during every retry
 * wait, and while a chunk is on the wire.
 */
class ResumableSession {
public:
    ResumableSession(SessionSpec spec,
                     ResumableProtocol& protocol,
                     std::unique_ptr<upload::RangeReader> reader,
                     const CancellationToken& cancel,
                     SessionHooks hooks = {});

    ResumableSession(const ResumableSession&) = delete;
    ResumableSession& operator=(const ResumableSession&) = delete;

    /**
     * @brief Drive the session to a terminal state
     *
     * RETURNS: the upload location once every byte of the range is
     * acknowledged by the server
     */
    Result<std::string> run();

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& location() const noexcept { return location_; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t retries_used() const noexcept { return retries_used_; }

private:
    Result<void> transition_to(SessionState next_state);
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    /// One pass: create or resync, then deliver chunks until done or failed.
    Result<void> attempt();
    Result<void> resync_offset();
    Result<void> load_chunk(std::uint64_t chunk_start);
    Result<std::string> terminate(SessionState terminal, Error error);

    SessionSpec spec_;
    ResumableProtocol& protocol_;
    std::unique_ptr<upload::RangeReader> reader_;
    const CancellationToken& cancel_;
    SessionHooks hooks_;

    SessionState state_ = SessionState::Idle;
    std::string location_;
    std::uint64_t offset_ = 0;
    bool needs_resync_ = false;
    std::size_t retries_used_ = 0;

    std::vector<std::uint8_t> buffer_;
    std::uint64_t buffer_start_ = 0;
    bool buffer_valid_ = false;
};

} // namespace skyup::transfer

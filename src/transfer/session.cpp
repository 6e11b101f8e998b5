#include "skyup/transfer/session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace skyup::transfer {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::Creating}},
        {SessionState::Creating, {SessionState::Transferring}},
        {SessionState::Transferring, {SessionState::Complete}},
    };

    if (target == SessionState::Failed || target == SessionState::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Creating: return "Creating";
        case SessionState::Transferring: return "Transferring";
        case SessionState::Complete: return "Complete";
        case SessionState::Failed: return "Failed";
        case SessionState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

ResumableSession::ResumableSession(SessionSpec spec,
                                   ResumableProtocol& protocol,
                                   std::unique_ptr<upload::RangeReader> reader,
                                   const CancellationToken& cancel,
                                   SessionHooks hooks)
    : spec_(std::move(spec)),
      protocol_(protocol),
      reader_(std::move(reader)),
      cancel_(cancel),
      hooks_(std::move(hooks)) {}

Result<std::string> ResumableSession::run() {
    if (state_ != SessionState::Idle) {
        return Err<std::string>(upload_failed("Session already started"));
    }
    if (spec_.chunk_size == 0) {
        return terminate(SessionState::Failed, invalid_argument("chunk_size must be > 0"));
    }
    if (auto res = transition_to(SessionState::Creating); res.is_error()) {
        return res.error_as<std::string>();
    }

    for (;;) {
        if (cancel_.is_cancelled()) {
            return terminate(SessionState::Cancelled, cancelled());
        }

        auto step = attempt();
        if (step.is_ok()) {
            if (auto res = transition_to(SessionState::Complete); res.is_error()) {
                return res.error_as<std::string>();
            }
            spdlog::debug("Part {} complete: {} bytes at {}", spec_.index, offset_, location_);
            reader_.reset();
            return Ok(location_);
        }

        const Error& error = step.error();
        if (error.code == ErrorCode::Cancelled) {
            return terminate(SessionState::Cancelled, error);
        }

        if (error.code != ErrorCode::TransportError || !error.transient) {
            spdlog::error("Part {} failed: {}", spec_.index, error.describe());
            Error final_error = error;
            final_error.transient = false;
            return terminate(SessionState::Failed, std::move(final_error));
        }

        if (retries_used_ >= spec_.retry_delays.size()) {
            spdlog::error("Part {} failed after {} retries: {}", spec_.index, retries_used_, error.message);
            return terminate(SessionState::Failed, transport_error(error.message));
        }

        const auto delay = spec_.retry_delays[retries_used_++];
        spdlog::warn("Part {} transfer failed ({}), retry {}/{} in {} ms",
                     spec_.index, error.message, retries_used_, spec_.retry_delays.size(), delay.count());
        if (hooks_.on_retry) {
            hooks_.on_retry(spec_.index, error, delay);
        }

        if (cancel_.wait_for(delay)) {
            return terminate(SessionState::Cancelled, cancelled());
        }
        needs_resync_ = !location_.empty();
    }
}

Result<void> ResumableSession::attempt() {
    if (location_.empty()) {
        CreateRequest request;
        request.length = spec_.range.length();
        request.metadata = spec_.metadata;
        request.partial = spec_.partial;

        auto created = protocol_.create(request);
        if (created.is_error()) {
            return created.error_as<void>();
        }
        if (created.value().empty()) {
            return Err<void>(upload_incomplete("Server did not return an upload location"));
        }
        location_ = created.value();
        offset_ = 0;
        spdlog::debug("Part {} [{}, {}) created at {}", spec_.index, spec_.range.start, spec_.range.end, location_);

        if (auto res = transition_to(SessionState::Transferring); res.is_error()) {
            return res;
        }
    } else if (needs_resync_) {
        if (auto res = resync_offset(); res.is_error()) {
            return res;
        }
    }
    needs_resync_ = false;

    const std::uint64_t length = spec_.range.length();
    while (offset_ < length) {
        if (cancel_.is_cancelled()) {
            return Err<void>(cancelled());
        }

        const std::uint64_t chunk_start = offset_ / spec_.chunk_size * spec_.chunk_size;
        if (!buffer_valid_ || buffer_start_ != chunk_start) {
            if (auto res = load_chunk(chunk_start); res.is_error()) {
                return res;
            }
        }

        const auto in_chunk = static_cast<std::size_t>(offset_ - chunk_start);
        const std::size_t size = buffer_.size() - in_chunk;
        const std::uint64_t base = offset_;

        auto patched = protocol_.patch(location_, offset_, buffer_.data() + in_chunk, size,
            [this, base](std::uint64_t written) {
                if (hooks_.on_progress) {
                    hooks_.on_progress(spec_.index, base + written);
                }
            }, &cancel_);
        if (patched.is_error()) {
            return patched.error_as<void>();
        }

        const std::uint64_t acknowledged = patched.value();
        if (acknowledged <= offset_ || acknowledged > offset_ + size) {
            return Err<void>(upload_failed(
                "Part " + std::to_string(spec_.index) + ": server acknowledged offset " +
                std::to_string(acknowledged) + " after sending " + std::to_string(size) +
                " bytes at " + std::to_string(offset_)));
        }
        offset_ = acknowledged;
        spdlog::debug("Part {} at {}/{}", spec_.index, offset_, length);
        if (hooks_.on_progress) {
            hooks_.on_progress(spec_.index, offset_);
        }
    }
    return Ok();
}

Result<void> ResumableSession::resync_offset() {
    auto reported = protocol_.offset(location_);
    if (reported.is_error()) {
        return reported.error_as<void>();
    }
    if (reported.value() > spec_.range.length()) {
        return Err<void>(upload_failed(
            "Part " + std::to_string(spec_.index) + ": server offset " + std::to_string(reported.value()) +
            " is beyond the part length " + std::to_string(spec_.range.length())));
    }
    if (reported.value() != offset_) {
        spdlog::info("Part {} resuming at offset {} (was {})", spec_.index, reported.value(), offset_);
    }
    offset_ = reported.value();
    return Ok();
}

Result<void> ResumableSession::load_chunk(std::uint64_t chunk_start) {
    const std::uint64_t chunk_end = std::min(chunk_start + spec_.chunk_size, spec_.range.length());
    const auto chunk_length = static_cast<std::size_t>(chunk_end - chunk_start);

    buffer_valid_ = false;
    buffer_.resize(chunk_length);

    std::size_t filled = 0;
    while (filled < chunk_length) {
        auto read = reader_->read_at(chunk_start + filled, buffer_.data() + filled, chunk_length - filled);
        if (read.is_error()) {
            return read.error_as<void>();
        }
        if (read.value() == 0) {
            return Err<void>(upload_failed(
                "Part " + std::to_string(spec_.index) + ": source ended at " +
                std::to_string(spec_.range.start + chunk_start + filled)));
        }
        filled += read.value();
    }

    buffer_start_ = chunk_start;
    buffer_valid_ = true;
    return Ok();
}

Result<std::string> ResumableSession::terminate(SessionState terminal, Error error) {
    if (auto res = transition_to(terminal); res.is_error()) {
        return res.error_as<std::string>();
    }
    reader_.reset();
    return Err<std::string>(std::move(error));
}

Result<void> ResumableSession::transition_to(SessionState next_state) {
    if (state_ == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Err<void>(upload_failed(std::string("Illegal session state transition ") +
                                       to_string(state_) + " -> " + to_string(next_state)));
    }
    state_ = next_state;
    return Ok();
}

bool ResumableSession::can_transition(SessionState target) const noexcept {
    if (state_ == SessionState::Failed || state_ == SessionState::Complete ||
        state_ == SessionState::Cancelled) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace skyup::transfer

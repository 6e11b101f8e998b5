#include "skyup/transfer/coordinator.hpp"
#include "skyup/network/multipart.hpp"
#include "skyup/skylink/codec.hpp"
#include "skyup/transfer/session.hpp"
#include "skyup/upload/partitioner.hpp"
#include "skyup/upload/strategy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <system_error>

namespace skyup::transfer {

using upload::ProgressEvent;
using upload::ProgressKind;
using upload::UploadContext;
using upload::UploadOutcome;

namespace {

constexpr std::size_t kNoListener = static_cast<std::size_t>(-1);

void publish(const UploadContext& context, ProgressKind kind, std::size_t part_index,
             std::uint64_t bytes_sent, std::uint64_t total_bytes, std::string detail = {}) {
    if (!context.progress) {
        return;
    }
    ProgressEvent event;
    event.kind = kind;
    event.part_index = part_index;
    event.bytes_sent = bytes_sent;
    event.total_bytes = total_bytes;
    event.detail = std::move(detail);
    context.progress->push(std::move(event));
}

/**
 * @brief State shared by the sessions of one large upload
 *
 * Owned through a shared_ptr so that a late cancel() on the caller's token
 * never touches freed memory.
 */
class UploadRun {
public:
    UploadRun(std::size_t parts, std::uint64_t total_bytes)
        : gate_open_(parts, false), part_bytes_(parts, 0), total_bytes_(total_bytes) {
        // Wake every session still waiting for its predecessor.
        abort.on_cancel([this]() {
            {
                std::lock_guard lock(mutex_);
                aborted_ = true;
            }
            cv_.notify_all();
        });
    }

    CancellationToken abort;

    void open_gate(std::size_t index) {
        {
            std::lock_guard lock(mutex_);
            gate_open_[index] = true;
        }
        cv_.notify_all();
    }

    void wait_gate(std::size_t index) {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this, index]() { return gate_open_[index] || aborted_; });
    }

    /// Record the first real failure and stop every other session.
    void fail(const Error& error) {
        {
            std::lock_guard lock(mutex_);
            if (error.code != ErrorCode::Cancelled && !first_error_.has_value()) {
                first_error_ = error;
            }
        }
        abort.cancel();
    }

    std::optional<Error> first_error() const {
        std::lock_guard lock(mutex_);
        return first_error_;
    }

    /// RETURNS: bytes delivered over all parts
    std::uint64_t record_progress(std::size_t index, std::uint64_t part_bytes) {
        std::lock_guard lock(mutex_);
        part_bytes_[index] = part_bytes;
        std::uint64_t sum = 0;
        for (auto bytes : part_bytes_) {
            sum += bytes;
        }
        return std::min(sum, total_bytes_);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<bool> gate_open_;
    std::vector<std::uint64_t> part_bytes_;
    std::uint64_t total_bytes_;
    std::optional<Error> first_error_;
    bool aborted_ = false;
};

} // namespace

ParallelUploadCoordinator::ParallelUploadCoordinator(ResumableProtocol& protocol,
                                                     SingleRequestUploader& single_request)
    : protocol_(protocol), single_request_(single_request) {}

Result<UploadOutcome> ParallelUploadCoordinator::upload(const upload::ByteSource& source,
                                                        const std::string& filename,
                                                        const upload::UploadOptions& options,
                                                        const UploadContext& context) {
    Result<UploadOutcome> result = Err<UploadOutcome>(upload_failed("Upload did not run"));
    try {
        result = run(source, filename, options, context);
    } catch (const std::exception& e) {
        spdlog::error("Upload of '{}' aborted: {}", filename, e.what());
        result = Err<UploadOutcome>(upload_failed(std::string("Upload aborted: ") + e.what()));
    }
    if (result.is_ok()) {
        publish(context, ProgressKind::Completed, 0, result.value().bytes, result.value().bytes,
                result.value().skylink);
    } else {
        publish(context, ProgressKind::Failed, 0, 0, source.size(), result.error().describe());
    }
    if (context.progress) {
        context.progress->close();
    }
    return result;
}

Result<UploadOutcome> ParallelUploadCoordinator::run(const upload::ByteSource& source,
                                                     const std::string& filename,
                                                     const upload::UploadOptions& options,
                                                     const UploadContext& context) {
    if (auto valid = upload::validate_options(options); valid.is_error()) {
        return valid.error_as<UploadOutcome>();
    }
    if (context.cancel && context.cancel->is_cancelled()) {
        return Err<UploadOutcome>(cancelled());
    }

    const std::uint64_t size = source.size();
    const auto strategy = upload::select_strategy(size, options.large_file_size);
    spdlog::info("Uploading '{}' ({} bytes) as {}", filename, size, upload::to_string(strategy));
    publish(context, ProgressKind::Started, 0, 0, size);

    if (strategy == upload::UploadStrategy::SmallFile) {
        return upload_small(source, filename, options, context);
    }
    return upload_large(source, filename, options, context);
}

Result<UploadOutcome> ParallelUploadCoordinator::upload_small(const upload::ByteSource& source,
                                                              const std::string& filename,
                                                              const upload::UploadOptions& options,
                                                              const UploadContext& context) {
    const std::uint64_t size = source.size();
    auto data = source.read_all();
    if (data.is_error()) {
        return data.error_as<UploadOutcome>();
    }

    auto posted = single_request_.post(data.value(), filename, options,
        [&context, size](std::uint64_t written) {
            publish(context, ProgressKind::BytesSent, 0, std::min(written, size), size);
        }, context.cancel.get());
    if (posted.is_error()) {
        return posted.error_as<UploadOutcome>();
    }

    auto normalized = skylink::normalize(posted.value());
    if (normalized.is_error()) {
        return normalized.error_as<UploadOutcome>();
    }

    UploadOutcome outcome;
    outcome.skylink = normalized.value();
    outcome.uri = skylink::to_uri(outcome.skylink);
    outcome.parts = 0;
    outcome.bytes = size;
    spdlog::info("Upload complete: {}{}", outcome.uri, options.dry_run ? " (dry run)" : "");
    return Ok(outcome);
}

Result<UploadOutcome> ParallelUploadCoordinator::upload_large(const upload::ByteSource& source,
                                                              const std::string& filename,
                                                              const upload::UploadOptions& options,
                                                              const UploadContext& context) {
    const std::uint64_t total = source.size();
    const std::uint64_t chunk_size = upload::effective_chunk_size(options);
    const std::size_t parallelism = upload::effective_parallelism(total, options);

    if (parallelism > 1 && !source.supports_ranges()) {
        return Err<UploadOutcome>(invalid_argument(
            "Source cannot be read at independent offsets; set numParallelUploads to 1"));
    }

    upload::PartitionPlan plan;
    if (parallelism == 1) {
        plan.push_back(upload::Part{0, total});
    } else {
        auto split = upload::split_into_chunk_aligned_parts(total, static_cast<std::int64_t>(parallelism),
                                                            static_cast<std::int64_t>(chunk_size));
        if (split.is_error()) {
            return split.error_as<UploadOutcome>();
        }
        plan = std::move(split.value());
    }

    spdlog::info("Planned {} part(s), chunk size {} bytes", plan.size(), chunk_size);
    for (std::size_t i = 0; i < plan.size(); ++i) {
        spdlog::debug("  part {}: [{}, {})", i, plan[i].start, plan[i].end);
    }

    const UploadMetadata metadata{filename, network::mime_type_for(filename)};
    const bool staggered = plan.size() > 1 && options.stagger_percent.has_value();
    const int stagger_percent = options.stagger_percent.value_or(0);

    auto run_state = std::make_shared<UploadRun>(plan.size(), total);
    std::size_t listener = kNoListener;
    if (context.cancel) {
        listener = context.cancel->on_cancel([run_state]() { run_state->abort.cancel(); });
    }

    auto run_session = [&, run_state](std::size_t index) -> Result<std::string> {
        const upload::Part range = plan[index];
        if (staggered && index > 0) {
            run_state->wait_gate(index - 1);
        }
        if (run_state->abort.is_cancelled()) {
            run_state->open_gate(index);
            return Err<std::string>(cancelled());
        }

        publish(context, ProgressKind::PartStarted, index, 0, total);
        auto reader = source.open_range(range);
        if (reader.is_error()) {
            run_state->fail(reader.error());
            run_state->open_gate(index);
            return reader.error_as<std::string>();
        }

        // Bytes of the first chunk after which the next part may start.
        const std::uint64_t first_chunk = std::min(chunk_size, range.length());
        const auto threshold = static_cast<std::uint64_t>(
            std::ceil(static_cast<double>(first_chunk) * stagger_percent / 100.0));
        if (threshold == 0) {
            run_state->open_gate(index);
        }

        SessionSpec spec;
        spec.index = index;
        spec.range = range;
        spec.chunk_size = chunk_size;
        spec.partial = plan.size() > 1;
        spec.metadata = metadata;
        spec.retry_delays = options.retry_delays;

        SessionHooks hooks;
        hooks.on_progress = [&context, run_state, total, threshold](std::size_t part, std::uint64_t part_bytes) {
            const auto sent = run_state->record_progress(part, part_bytes);
            publish(context, ProgressKind::BytesSent, part, sent, total);
            if (part_bytes >= threshold) {
                run_state->open_gate(part);
            }
        };
        hooks.on_retry = [&context, total](std::size_t part, const Error& error, std::chrono::milliseconds delay) {
            publish(context, ProgressKind::Retrying, part, 0, total,
                    error.message + " (retrying in " + std::to_string(delay.count()) + " ms)");
        };

        ResumableSession session(std::move(spec), protocol_, std::move(reader.value()), run_state->abort,
                                 std::move(hooks));
        auto result = session.run();
        run_state->open_gate(index);
        if (result.is_error()) {
            run_state->fail(result.error());
        } else {
            publish(context, ProgressKind::PartCompleted, index, 0, total);
        }
        return result;
    };

    // A throw must still release the successor and stop the other parts,
    // or they wait on this part's gate forever.
    auto run_part = [&run_session, run_state](std::size_t index) -> Result<std::string> {
        try {
            return run_session(index);
        } catch (const std::exception& e) {
            const Error error = upload_failed("Part " + std::to_string(index) + " aborted: " + e.what());
            spdlog::error("{}", error.message);
            run_state->fail(error);
            run_state->open_gate(index);
            return Err<std::string>(error);
        }
    };

    std::vector<std::future<Result<std::string>>> tasks;
    tasks.reserve(plan.size());
    std::optional<Error> launch_error;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        try {
            tasks.push_back(std::async(std::launch::async, run_part, i));
        } catch (const std::system_error& e) {
            launch_error = upload_failed(std::string("Failed to start upload task: ") + e.what());
            run_state->fail(*launch_error);
            break;
        }
    }

    std::vector<std::string> locations;
    locations.reserve(plan.size());
    for (auto& task : tasks) {
        auto result = task.get();
        if (result.is_ok()) {
            locations.push_back(std::move(result.value()));
        }
    }

    if (context.cancel && listener != kNoListener) {
        context.cancel->remove_listener(listener);
    }

    if (auto error = run_state->first_error(); error.has_value()) {
        spdlog::error("Upload of '{}' aborted: {}", filename, error->describe());
        return Err<UploadOutcome>(*error);
    }
    if (locations.size() != plan.size() || run_state->abort.is_cancelled()) {
        spdlog::warn("Upload of '{}' cancelled", filename);
        return Err<UploadOutcome>(cancelled());
    }

    publish(context, ProgressKind::Finalizing, 0, total, total);
    auto finalized = finalize(locations, metadata);
    if (finalized.is_error()) {
        spdlog::error("Upload of '{}' could not be finalized: {}", filename, finalized.error().describe());
        return finalized.error_as<UploadOutcome>();
    }

    UploadOutcome outcome;
    outcome.skylink = finalized.value();
    outcome.uri = skylink::to_uri(outcome.skylink);
    outcome.parts = plan.size();
    outcome.bytes = total;
    spdlog::info("Upload complete: {} ({} part(s))", outcome.uri, outcome.parts);
    return Ok(outcome);
}

Result<std::string> ParallelUploadCoordinator::finalize(const std::vector<std::string>& locations,
                                                        const UploadMetadata& metadata) {
    std::string location;
    if (locations.size() > 1) {
        spdlog::info("Concatenating {} parts", locations.size());
        auto joined = protocol_.concatenate(locations, metadata);
        if (joined.is_error()) {
            return joined.error_as<std::string>();
        }
        location = joined.value();
    } else if (!locations.empty()) {
        location = locations.front();
    }

    if (location.empty()) {
        return Err<std::string>(upload_incomplete("Upload location was not set"));
    }

    auto headers = protocol_.probe(location);
    if (headers.is_error()) {
        return headers.error_as<std::string>();
    }

    const auto value = network::find_header(headers.value(), "Skynet-Skylink");
    if (!value.has_value() || value->empty()) {
        return Err<std::string>(upload_incomplete("No Skynet-Skylink header on " + location));
    }
    return skylink::normalize(*value);
}

} // namespace skyup::transfer

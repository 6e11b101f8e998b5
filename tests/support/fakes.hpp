#pragma once

#include "skyup/network/http_client.hpp"
#include "skyup/skylink/codec.hpp"
#include "skyup/transfer/protocol.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skyup::test_support {

/// Valid bare skylink whose raw bytes all equal `fill`.
inline std::string make_skylink(std::uint8_t fill = 0x2a) {
    skylink::RawSkylink raw{};
    raw.fill(fill);
    return skylink::encode(raw);
}

/**
 * @brief In-memory resumable server
 *
 * Stores every upload's bytes so tests can check what arrived, counts calls,
 * and lets a test inject failures per call through `patch_failures`.
 */
class FakeResumableProtocol : public transfer::ResumableProtocol {
public:
    struct StoredUpload {
        std::uint64_t length = 0;
        bool partial = false;
        std::vector<std::uint8_t> data;
        transfer::UploadMetadata metadata;
    };

    std::string skylink = make_skylink();
    bool omit_skylink_header = false;

    /// Consumed front to back by patch(); an entry makes that call fail.
    std::deque<Error> patch_failures;
    std::optional<Error> create_failure;

    /// Called at the start of every patch() with the upload index and offset.
    std::function<void(std::size_t, std::uint64_t)> on_patch;

    /// Bytes of each patch() reported as written before the token is checked;
    /// the rest of the chunk goes through only if the token is still clear.
    std::size_t deliver_before_cancel_check = 0;

    Result<std::string> create(const transfer::CreateRequest& request) override {
        ++create_calls;
        std::lock_guard lock(mutex_);
        if (create_failure.has_value()) {
            return Err<std::string>(*create_failure);
        }
        StoredUpload upload;
        upload.length = request.length;
        upload.partial = request.partial;
        upload.metadata = request.metadata;
        uploads.push_back(upload);
        return Ok(location_of(uploads.size() - 1));
    }

    Result<std::uint64_t> patch(const std::string& location, std::uint64_t offset,
                                const std::uint8_t* data, std::size_t size,
                                const transfer::ChunkProgress& progress,
                                const CancellationToken* cancel = nullptr) override {
        ++patch_calls;
        if (cancel) {
            ++patches_with_token;
        }
        const std::size_t index = index_of(location);
        if (on_patch) {
            on_patch(index, offset);
        }

        std::lock_guard lock(mutex_);
        if (!patch_failures.empty()) {
            Error failure = patch_failures.front();
            patch_failures.pop_front();
            return Err<std::uint64_t>(failure);
        }
        auto& upload = uploads.at(index);
        if (offset != upload.data.size()) {
            return Err<std::uint64_t>(transport_error("offset mismatch", false));
        }
        if (deliver_before_cancel_check > 0 && deliver_before_cancel_check < size) {
            upload.data.insert(upload.data.end(), data, data + deliver_before_cancel_check);
            if (progress) {
                progress(deliver_before_cancel_check);
            }
            if (cancel && cancel->is_cancelled()) {
                return Err<std::uint64_t>(cancelled("Request cancelled while writing request"));
            }
            data += deliver_before_cancel_check;
            size -= deliver_before_cancel_check;
        }
        upload.data.insert(upload.data.end(), data, data + size);
        if (progress) {
            progress(size);
        }
        return Ok(static_cast<std::uint64_t>(upload.data.size()));
    }

    Result<std::uint64_t> offset(const std::string& location) override {
        ++offset_calls;
        std::lock_guard lock(mutex_);
        return Ok(static_cast<std::uint64_t>(uploads.at(index_of(location)).data.size()));
    }

    Result<std::string> concatenate(const std::vector<std::string>& part_locations,
                                    const transfer::UploadMetadata& metadata) override {
        ++concat_calls;
        std::lock_guard lock(mutex_);
        concatenated = part_locations;
        StoredUpload final_upload;
        final_upload.metadata = metadata;
        for (const auto& location : part_locations) {
            const auto& part = uploads.at(index_of(location)).data;
            final_upload.data.insert(final_upload.data.end(), part.begin(), part.end());
        }
        final_upload.length = final_upload.data.size();
        uploads.push_back(final_upload);
        return Ok(location_of(uploads.size() - 1));
    }

    Result<network::HeaderMap> probe(const std::string& location) override {
        ++probe_calls;
        probed = location;
        network::HeaderMap headers;
        headers["Tus-Resumable"] = "1.0.0";
        if (!omit_skylink_header) {
            headers["skynet-skylink"] = skylink;
        }
        return Ok(headers);
    }

    int total_calls() const {
        return create_calls + patch_calls + offset_calls + concat_calls + probe_calls;
    }

    std::atomic<int> create_calls{0};
    std::atomic<int> patch_calls{0};
    std::atomic<int> offset_calls{0};
    std::atomic<int> concat_calls{0};
    std::atomic<int> probe_calls{0};
    std::atomic<int> patches_with_token{0};

    std::vector<StoredUpload> uploads;
    std::vector<std::string> concatenated;
    std::string probed;

    static std::string location_of(std::size_t index) {
        return "https://portal.test/skynet/tus/" + std::to_string(index);
    }

    static std::size_t index_of(const std::string& location) {
        return static_cast<std::size_t>(std::stoul(location.substr(location.rfind('/') + 1)));
    }

private:
    std::mutex mutex_;
};

class FakeSingleRequest : public transfer::SingleRequestUploader {
public:
    std::string response_skylink = make_skylink(0x11);
    std::optional<Error> failure;

    Result<std::string> post(const std::vector<std::uint8_t>& data, const std::string& filename,
                             const upload::UploadOptions& options,
                             const transfer::ChunkProgress& progress,
                             const CancellationToken* cancel = nullptr) override {
        ++calls;
        received_token = cancel;
        received = data;
        received_filename = filename;
        dry_run = options.dry_run;
        if (failure.has_value()) {
            return Err<std::string>(*failure);
        }
        if (progress) {
            progress(data.size());
        }
        return Ok(response_skylink);
    }

    int calls = 0;
    std::vector<std::uint8_t> received;
    std::string received_filename;
    bool dry_run = false;
    const CancellationToken* received_token = nullptr;
};

/**
 * @brief Scripted HTTP transport
 *
 * Every request is recorded; `handler` produces the reply.
 */
class FakeTransport : public network::HttpTransport {
public:
    std::function<Result<network::HttpResponse>(const network::HttpRequest&)> handler;

    Result<network::HttpResponse> send(const network::HttpRequest& request,
                                       const network::BodyProgress& progress,
                                       const CancellationToken* cancel = nullptr) override {
        {
            std::lock_guard lock(mutex_);
            requests.push_back(request);
            tokens.push_back(cancel);
        }
        if (progress && !request.body.empty()) {
            progress(request.body.size());
        }
        if (!handler) {
            return Err<network::HttpResponse>(transport_error("no handler", true));
        }
        return handler(request);
    }

    std::size_t request_count() {
        std::lock_guard lock(mutex_);
        return requests.size();
    }

    std::vector<network::HttpRequest> requests;
    std::vector<const CancellationToken*> tokens;

private:
    std::mutex mutex_;
};

inline network::HttpResponse make_response(int status, network::HeaderMap headers = {}, const std::string& body = "") {
    network::HttpResponse response;
    response.status_code = status;
    response.headers = std::move(headers);
    response.body.assign(body.begin(), body.end());
    return response;
}

} // namespace skyup::test_support

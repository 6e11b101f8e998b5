#pragma once

#include "skyup/network/http_client.hpp"
#include "skyup/transfer/protocol.hpp"

#include <memory>
#include <string>

namespace skyup::transfer {

constexpr const char* kTusVersion = "1.0.0";

/**
 * @brief tus 1.0.0 client (core, creation, concatenation extensions)
 *
 * POST endpoint           Upload-Length, Upload-Metadata[, Upload-Concat: partial] -> Location
 * PATCH location          Upload-Offset + application/offset+octet-stream body     -> Upload-Offset
 * HEAD location           -> Upload-Offset (resume) or metadata headers (probe)
 * POST endpoint           Upload-Concat: final;<location> <location> ...           -> Location
 *
 * Every request carries Tus-Resumable plus the client's base headers.
 */
class TusProtocol : public ResumableProtocol {
public:
    TusProtocol(std::shared_ptr<network::HttpTransport> transport,
                std::string endpoint_url,
                network::HeaderMap base_headers = {});

    Result<std::string> create(const CreateRequest& request) override;

    Result<std::uint64_t> patch(const std::string& location,
                                std::uint64_t offset,
                                const std::uint8_t* data,
                                std::size_t size,
                                const ChunkProgress& progress,
                                const CancellationToken* cancel = nullptr) override;

    Result<std::uint64_t> offset(const std::string& location) override;

    Result<std::string> concatenate(const std::vector<std::string>& part_locations,
                                    const UploadMetadata& metadata) override;

    Result<network::HeaderMap> probe(const std::string& location) override;

    [[nodiscard]] const std::string& endpoint_url() const noexcept { return endpoint_url_; }

private:
    network::HttpRequest make_request(network::HttpMethod method, const std::string& url) const;
    Result<std::string> location_from(const network::HttpResponse& response, const std::string& action) const;

    std::shared_ptr<network::HttpTransport> transport_;
    std::string endpoint_url_;
    network::HeaderMap base_headers_;
};

/// "filename <base64>,filetype <base64>"; empty values are sent as bare keys.
std::string encode_upload_metadata(const UploadMetadata& metadata);

} // namespace skyup::transfer

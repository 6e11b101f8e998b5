#pragma once

#include "skyup/network/http_client.hpp"
#include "skyup/transfer/protocol.hpp"

#include <memory>
#include <string>

namespace skyup::client {

/**
 * @brief Single-request upload to the portal's skyfile endpoint
 *
 * POST {portal}{endpointUpload}[?dryrun=true] with a multipart/form-data
 * body; the reply is JSON carrying the skylink.
 */
class SkyfileEndpoint : public transfer::SingleRequestUploader {
public:
    SkyfileEndpoint(std::shared_ptr<network::HttpTransport> transport,
                    std::string portal_url,
                    network::HeaderMap base_headers = {});

    Result<std::string> post(const std::vector<std::uint8_t>& data,
                             const std::string& filename,
                             const upload::UploadOptions& options,
                             const transfer::ChunkProgress& progress,
                             const CancellationToken* cancel = nullptr) override;

private:
    std::shared_ptr<network::HttpTransport> transport_;
    std::string portal_url_;
    network::HeaderMap base_headers_;
};

} // namespace skyup::client

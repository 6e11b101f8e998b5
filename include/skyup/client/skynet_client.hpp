#pragma once

#include "skyup/client/config.hpp"
#include "skyup/core/result.hpp"
#include "skyup/network/http_client.hpp"
#include "skyup/upload/options.hpp"
#include "skyup/upload/source.hpp"
#include "skyup/upload/types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace skyup::client {

/**
 * @brief Upload capability of a portal client
 *
 * `overrides` is the call layer of the option merge. The context's progress
 * channel, when given, is closed before each call returns.
 */
class Uploader {
public:
    virtual ~Uploader() = default;

    virtual Result<upload::UploadOutcome> upload(const upload::ByteSource& source,
                                                 const std::string& filename,
                                                 const upload::UploadOverrides& overrides = {},
                                                 const upload::UploadContext& context = {}) = 0;

    virtual Result<upload::UploadOutcome> upload_data(const std::vector<std::uint8_t>& data,
                                                      const std::string& filename,
                                                      const upload::UploadOverrides& overrides = {},
                                                      const upload::UploadContext& context = {}) = 0;

    /// Uploads under customFilename when set, the path's file name otherwise.
    virtual Result<upload::UploadOutcome> upload_file(const std::filesystem::path& path,
                                                      const upload::UploadOverrides& overrides = {},
                                                      const upload::UploadContext& context = {}) = 0;
};

/**
 * @brief Skynet portal client
 *
 * Built from a validated ClientConfig and a transport; immutable afterwards
 * and safe to share between threads.
 */
class SkynetClient : public Uploader {
public:
    static Result<std::unique_ptr<SkynetClient>> create(ClientConfig config,
                                                        std::shared_ptr<network::HttpTransport> transport);

    Result<upload::UploadOutcome> upload(const upload::ByteSource& source,
                                         const std::string& filename,
                                         const upload::UploadOverrides& overrides = {},
                                         const upload::UploadContext& context = {}) override;

    Result<upload::UploadOutcome> upload_data(const std::vector<std::uint8_t>& data,
                                              const std::string& filename,
                                              const upload::UploadOverrides& overrides = {},
                                              const upload::UploadContext& context = {}) override;

    Result<upload::UploadOutcome> upload_file(const std::filesystem::path& path,
                                              const upload::UploadOverrides& overrides = {},
                                              const upload::UploadContext& context = {}) override;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

    /// Options an upload with `overrides` would run with.
    [[nodiscard]] upload::UploadOptions resolve_options(const upload::UploadOverrides& overrides) const;

private:
    SkynetClient(ClientConfig config, std::shared_ptr<network::HttpTransport> transport);

    ClientConfig config_;
    std::shared_ptr<network::HttpTransport> transport_;
    network::HeaderMap headers_;
};

} // namespace skyup::client

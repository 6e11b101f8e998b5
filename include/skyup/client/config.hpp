#pragma once

#include "skyup/core/result.hpp"
#include "skyup/network/http_types.hpp"
#include "skyup/upload/options.hpp"

#include <filesystem>
#include <string>

namespace skyup::client {

constexpr const char* kDefaultPortalUrl = "https://siasky.net";

/**
 * @brief Client-level configuration
 *
 * JSON form (every key optional, unknown keys ignored):
 * {
 *   "portalUrl": "https://siasky.net",
 *   "apiKey": "...",              // basic-auth password
 *   "skynetApiKey": "...",        // Skynet-Api-Key header
 *   "customUserAgent": "...",
 *   "customCookie": "...",
 *   "logLevel": "info",
 *   "largeFileSize": 41943040,
 *   "chunkSizeMultiplier": 1,
 *   "numParallelUploads": 2,
 *   "staggerPercent": 50,         // null disables stagger
 *   "retryDelays": [0, 5000],     // milliseconds
 *   "dryRun": false,
 *   "customFilename": "name.bin"
 * }
 */
struct ClientConfig {
    std::string portal_url = kDefaultPortalUrl;
    std::string api_key;
    std::string skynet_api_key;
    std::string custom_user_agent;
    std::string custom_cookie;
    std::string log_level = "info";
    upload::UploadOverrides upload;  ///< Client layer of the option merge
};

Result<ClientConfig> parse_client_config(const std::string& json_text);
Result<ClientConfig> load_client_config(const std::filesystem::path& path);

/**
 * @brief Reject configs no client can be built from
 *
 * Checks the portal URL, the log level name, and the upload options that
 * result from merging the client layer over the defaults.
 */
Result<void> validate_client_config(const ClientConfig& config);

/**
 * @brief Headers every portal request carries
 *
 * User-Agent, Cookie and Skynet-Api-Key when configured, and basic auth
 * with an empty user name when apiKey is set. Entries of `base` are kept
 * unless overridden.
 */
network::HeaderMap build_request_headers(const ClientConfig& config, network::HeaderMap base = {});

} // namespace skyup::client

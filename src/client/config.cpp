#include "skyup/client/config.hpp"
#include "skyup/core/base64.hpp"
#include "skyup/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace skyup::client {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/**
 * @brief Typed access to optional top-level keys; remembers the first error
 */
class FieldReader {
public:
    explicit FieldReader(const json& root) : root_(root) {}

    void text(const char* key, std::string& out) {
        if (const json* value = find(key)) {
            if (!value->is_string()) {
                return fail(key, *value, "a string");
            }
            out = value->get<std::string>();
        }
    }

    void text(const char* key, std::optional<std::string>& out) {
        std::string value;
        if (find(key) != nullptr) {
            text(key, value);
            out = value;
        }
    }

    void integer(const char* key, std::optional<std::int64_t>& out) {
        if (const json* value = find(key)) {
            auto parsed = as_integer(key, *value);
            if (parsed.has_value()) {
                out = *parsed;
            }
        }
    }

    void size(const char* key, std::optional<std::uint64_t>& out) {
        if (const json* value = find(key)) {
            auto parsed = as_integer(key, *value);
            if (!parsed.has_value()) {
                return;
            }
            if (*parsed < 1) {
                return fail(key, *value, "greater than or equal to 1");
            }
            out = static_cast<std::uint64_t>(*parsed);
        }
    }

    void flag(const char* key, std::optional<bool>& out) {
        if (const json* value = find(key)) {
            if (!value->is_boolean()) {
                return fail(key, *value, "a boolean");
            }
            out = value->get<bool>();
        }
    }

    /// Number in [0, 100], or null to disable.
    void percent(const char* key, std::optional<std::optional<int>>& out) {
        if (const json* value = find(key)) {
            if (value->is_null()) {
                out = std::optional<int>();
                return;
            }
            auto parsed = as_integer(key, *value);
            if (!parsed.has_value()) {
                return;
            }
            auto percent = upload::checked_stagger_percent(*parsed);
            if (percent.is_error()) {
                return fail(key, *value, "between 0 and 100");
            }
            out = std::optional<int>(percent.value());
        }
    }

    void delays(const char* key, std::optional<std::vector<std::chrono::milliseconds>>& out) {
        if (const json* value = find(key)) {
            if (!value->is_array()) {
                return fail(key, *value, "an array of milliseconds");
            }
            std::vector<std::chrono::milliseconds> parsed;
            for (const auto& entry : *value) {
                auto ms = as_integer(key, entry);
                if (!ms.has_value()) {
                    return;
                }
                if (*ms < 0) {
                    return fail(key, entry, "non-negative");
                }
                parsed.emplace_back(*ms);
            }
            out = std::move(parsed);
        }
    }

    Result<void> status() const {
        if (error_.has_value()) {
            return Err<void>(*error_);
        }
        return Ok();
    }

private:
    const json* find(const char* key) const {
        auto it = root_.find(key);
        return it == root_.end() ? nullptr : &*it;
    }

    std::optional<std::int64_t> as_integer(const char* key, const json& value) {
        if (value.is_number_integer()) {
            return value.get<std::int64_t>();
        }
        if (value.is_number_float()) {
            const double number = value.get<double>();
            if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) < 9.0e15) {
                return static_cast<std::int64_t>(number);
            }
            fail(key, value, "an integer");
            return std::nullopt;
        }
        fail(key, value, "an integer");
        return std::nullopt;
    }

    void fail(const char* key, const json& value, const std::string& expectation) {
        if (!error_.has_value()) {
            error_ = invalid_argument("Expected option '" + std::string(key) + "' to be " + expectation +
                                      ", was '" + value.dump() + "'");
        }
    }

    const json& root_;
    std::optional<Error> error_;
};

bool is_known_log_level(const std::string& level) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
    for (const char* known : kLevels) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

} // namespace

Result<ClientConfig> parse_client_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Err<ClientConfig>(invalid_argument(std::string("Invalid config JSON: ") + e.what()));
    }
    if (!root.is_object()) {
        return Err<ClientConfig>(invalid_argument("Config must be a JSON object"));
    }

    ClientConfig config;
    FieldReader reader(root);
    reader.text("portalUrl", config.portal_url);
    reader.text("apiKey", config.api_key);
    reader.text("skynetApiKey", config.skynet_api_key);
    reader.text("customUserAgent", config.custom_user_agent);
    reader.text("customCookie", config.custom_cookie);
    reader.text("logLevel", config.log_level);

    auto& layer = config.upload;
    reader.size("largeFileSize", layer.large_file_size);
    reader.size("baseChunkSize", layer.base_chunk_size);
    reader.integer("chunkSizeMultiplier", layer.chunk_size_multiplier);
    reader.integer("numParallelUploads", layer.num_parallel_uploads);
    reader.percent("staggerPercent", layer.stagger_percent);
    reader.delays("retryDelays", layer.retry_delays);
    reader.flag("dryRun", layer.dry_run);
    reader.text("customFilename", layer.custom_filename);
    reader.text("endpointUpload", layer.endpoint_upload);
    reader.text("endpointLargeUpload", layer.endpoint_large_upload);
    reader.text("portalFileFieldname", layer.portal_file_fieldname);

    if (auto res = reader.status(); res.is_error()) {
        return Err<ClientConfig>(res.error());
    }
    if (config.portal_url.empty()) {
        config.portal_url = kDefaultPortalUrl;
    }
    return Ok(config);
}

Result<ClientConfig> load_client_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientConfig>(invalid_argument("Failed to open config file: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = parse_client_config(buffer.str());
    if (parsed.is_error()) {
        return Err<ClientConfig>(invalid_argument(path.string() + ": " + parsed.error().message));
    }
    spdlog::debug("Loaded client config from {}", path.string());
    return parsed;
}

Result<void> validate_client_config(const ClientConfig& config) {
    auto url = network::parse_url(config.portal_url);
    if (url.is_error()) {
        return Err<void>(invalid_argument("Invalid portalUrl: " + url.error().message));
    }
    if (!is_known_log_level(config.log_level)) {
        return Err<void>(invalid_argument("Unknown logLevel '" + config.log_level + "'"));
    }
    return upload::validate_options(
        upload::merge_options(upload::default_upload_options(), config.upload, upload::UploadOverrides{}));
}

network::HeaderMap build_request_headers(const ClientConfig& config, network::HeaderMap base) {
    network::HeaderMap headers = std::move(base);
    if (!config.custom_user_agent.empty()) {
        headers["User-Agent"] = config.custom_user_agent;
    }
    if (!config.custom_cookie.empty()) {
        headers["Cookie"] = config.custom_cookie;
    }
    if (!config.skynet_api_key.empty()) {
        headers["Skynet-Api-Key"] = config.skynet_api_key;
    }
    if (!config.api_key.empty()) {
        headers["Authorization"] = "Basic " + base64::encode(":" + config.api_key);
    }
    return headers;
}

} // namespace skyup::client

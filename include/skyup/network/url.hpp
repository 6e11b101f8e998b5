#pragma once

#include "skyup/core/result.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace skyup::network {

/**
 * @brief Absolute http(s) URL split into the parts a client needs
 */
struct Url {
    std::string scheme;   ///< "http" or "https"
    std::string host;
    uint16_t port = 0;    ///< Explicit or scheme default
    std::string target;   ///< Path plus query, always starting with '/'

    [[nodiscard]] bool is_tls() const noexcept { return scheme == "https"; }

    /// scheme://host[:port] with the port omitted when it is the default
    [[nodiscard]] std::string origin() const;

    [[nodiscard]] std::string to_string() const { return origin() + target; }
};

Result<Url> parse_url(const std::string& text);

/**
 * @brief Join a portal URL with an endpoint path and an optional extra
 * segment, collapsing duplicate slashes at the joints
 */
std::string make_url(const std::string& portal_url, const std::string& path, const std::string& extra = "");

/**
 * @brief Resolve a Location header against the request URL
 *
 * Absolute locations are returned unchanged; "/path" replaces the target;
 * anything else is relative to the base path's directory.
 */
Result<std::string> resolve_location(const std::string& base_url, const std::string& location);

/// Append query parameters, percent-encoding keys and values.
std::string add_query(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params);

std::string percent_encode(const std::string& value);

} // namespace skyup::network

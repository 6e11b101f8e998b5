#pragma once

#include "http_types.hpp"
#include "skyup/core/error.hpp"

#include <string>

namespace skyup::network {

/// 5xx, 409 Conflict, 423 Locked and 429 Too Many Requests are worth retrying.
bool is_transient_status(int status_code) noexcept;

/**
 * @brief Human-readable reason for a failed response
 *
 * The JSON "message" field when the body is a JSON object carrying one,
 * otherwise the trimmed body, otherwise the status line.
 */
std::string response_error_message(const HttpResponse& response);

/// TransportError for a non-success response, transient per is_transient_status().
Error status_error(const HttpResponse& response, const std::string& action);

} // namespace skyup::network

#pragma once

#include <string>

namespace skyup {

enum class ErrorCode {
    InvalidArgument,   // bad option values or inputs, raised before any I/O
    MalformedSkylink,  // identifier failed to decode
    TransportError,    // network / HTTP failure after retries
    UploadIncomplete,  // sessions finished but the skylink metadata is missing
    UploadFailed,      // a session aborted for a non-transport reason
    Cancelled          // the caller cancelled the upload
};

/**
 * @brief Typed failure carried by skyup::Result
 *
 * `transient` is only meaningful for TransportError: it marks failures the
 * resumable session may retry (connection errors, 5xx, 409, 423, 429).
 */
struct Error {
    ErrorCode code = ErrorCode::UploadFailed;
    std::string message;
    bool transient = false;

    Error() = default;
    Error(ErrorCode c, std::string msg, bool is_transient = false)
        : code(c), message(std::move(msg)), transient(is_transient) {}

    [[nodiscard]] std::string describe() const;
};

const char* to_string(ErrorCode code);

Error invalid_argument(std::string message);
Error malformed_skylink(std::string message);
Error transport_error(std::string message, bool transient = false);
Error upload_incomplete(std::string message);
Error upload_failed(std::string message);
Error cancelled(std::string message = "upload cancelled");

} // namespace skyup

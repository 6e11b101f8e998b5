#include "skyup/core/error.hpp"

namespace skyup {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::MalformedSkylink: return "MalformedSkylink";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::UploadIncomplete: return "UploadIncomplete";
        case ErrorCode::UploadFailed: return "UploadFailed";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string Error::describe() const {
    return std::string(to_string(code)) + ": " + message;
}

Error invalid_argument(std::string message) {
    return Error(ErrorCode::InvalidArgument, std::move(message));
}

Error malformed_skylink(std::string message) {
    return Error(ErrorCode::MalformedSkylink, std::move(message));
}

Error transport_error(std::string message, bool transient) {
    return Error(ErrorCode::TransportError, std::move(message), transient);
}

Error upload_incomplete(std::string message) {
    return Error(ErrorCode::UploadIncomplete, std::move(message));
}

Error upload_failed(std::string message) {
    return Error(ErrorCode::UploadFailed, std::move(message));
}

Error cancelled(std::string message) {
    return Error(ErrorCode::Cancelled, std::move(message));
}

} // namespace skyup

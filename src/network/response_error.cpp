#include "skyup/network/response_error.hpp"

#include <nlohmann/json.hpp>

namespace skyup::network {
namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

bool is_transient_status(int status_code) noexcept {
    return status_code >= 500 || status_code == 409 || status_code == 423 || status_code == 429;
}

std::string response_error_message(const HttpResponse& response) {
    const std::string body = trim(response.body_as_string());
    if (!body.empty()) {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (!json.is_discarded() && json.is_object()) {
            const auto it = json.find("message");
            if (it != json.end() && it->is_string() && !it->get<std::string>().empty()) {
                return it->get<std::string>();
            }
        }
        return body;
    }

    std::string status = "HTTP " + std::to_string(response.status_code);
    if (!response.reason_phrase.empty()) {
        status += " " + response.reason_phrase;
    }
    return status;
}

Error status_error(const HttpResponse& response, const std::string& action) {
    return transport_error(action + " failed (" + std::to_string(response.status_code) + "): " +
                               response_error_message(response),
                           is_transient_status(response.status_code));
}

} // namespace skyup::network

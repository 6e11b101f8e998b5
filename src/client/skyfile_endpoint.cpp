#include "skyup/client/skyfile_endpoint.hpp"
#include "skyup/network/multipart.hpp"
#include "skyup/network/response_error.hpp"
#include "skyup/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace skyup::client {

using json = nlohmann::json;

SkyfileEndpoint::SkyfileEndpoint(std::shared_ptr<network::HttpTransport> transport,
                                 std::string portal_url,
                                 network::HeaderMap base_headers)
    : transport_(std::move(transport)),
      portal_url_(std::move(portal_url)),
      base_headers_(std::move(base_headers)) {}

Result<std::string> SkyfileEndpoint::post(const std::vector<std::uint8_t>& data,
                                          const std::string& filename,
                                          const upload::UploadOptions& options,
                                          const transfer::ChunkProgress& progress,
                                          const CancellationToken* cancel) {
    std::string url = network::make_url(portal_url_, options.endpoint_upload);
    if (options.dry_run) {
        url = network::add_query(url, {{"dryrun", "true"}});
    }

    auto form = network::build_file_form(options.portal_file_fieldname, filename, data);

    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = url;
    request.headers = base_headers_;
    request.set_header("Content-Type", form.content_type);
    request.body = std::move(form.body);

    // The transport reports bytes of the whole form; clamp to the payload.
    const std::uint64_t payload = data.size();
    auto response = transport_->send(request, [&progress, payload](std::uint64_t written) {
        if (progress) {
            progress(std::min(written, payload));
        }
    }, cancel);
    if (response.is_error()) {
        return response.error_as<std::string>();
    }
    if (!response.value().is_success()) {
        return Err<std::string>(network::status_error(response.value(), "Uploading " + filename));
    }

    const auto body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<std::string>(transport_error("Portal returned a non-JSON upload response"));
    }
    const auto it = body.find("skylink");
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Err<std::string>(upload_incomplete("Upload response has no skylink"));
    }
    spdlog::debug("Portal returned skylink {}", it->get<std::string>());
    return Ok(it->get<std::string>());
}

} // namespace skyup::client

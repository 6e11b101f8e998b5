#include "skyup/transfer/tus_protocol.hpp"
#include "skyup/core/base64.hpp"
#include "skyup/network/response_error.hpp"
#include "skyup/network/url.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace skyup::transfer {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

namespace {

Result<std::uint64_t> parse_offset(const HttpResponse& response, const std::string& action) {
    const auto value = network::find_header(response.headers, "Upload-Offset");
    if (!value.has_value() || value->empty() || value->size() > 19) {
        return Err<std::uint64_t>(upload_failed(action + ": missing or invalid Upload-Offset header"));
    }
    std::uint64_t offset = 0;
    for (char c : *value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Err<std::uint64_t>(upload_failed(action + ": invalid Upload-Offset '" + *value + "'"));
        }
        offset = offset * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return Ok(offset);
}

} // namespace

std::string encode_upload_metadata(const UploadMetadata& metadata) {
    auto pair = [](const std::string& key, const std::string& value) {
        return value.empty() ? key : key + " " + base64::encode(value);
    };
    return pair("filename", metadata.filename) + "," + pair("filetype", metadata.filetype);
}

TusProtocol::TusProtocol(std::shared_ptr<network::HttpTransport> transport,
                         std::string endpoint_url,
                         network::HeaderMap base_headers)
    : transport_(std::move(transport)),
      endpoint_url_(std::move(endpoint_url)),
      base_headers_(std::move(base_headers)) {}

HttpRequest TusProtocol::make_request(HttpMethod method, const std::string& url) const {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.headers = base_headers_;
    request.set_header("Tus-Resumable", kTusVersion);
    return request;
}

Result<std::string> TusProtocol::location_from(const HttpResponse& response, const std::string& action) const {
    const auto location = network::find_header(response.headers, "Location");
    if (!location.has_value() || location->empty()) {
        return Err<std::string>(upload_incomplete(action + ": response has no Location header"));
    }
    return network::resolve_location(endpoint_url_, *location);
}

Result<std::string> TusProtocol::create(const CreateRequest& request) {
    auto http = make_request(HttpMethod::POST, endpoint_url_);
    http.set_header("Upload-Length", std::to_string(request.length));
    http.set_header("Upload-Metadata", encode_upload_metadata(request.metadata));
    if (request.partial) {
        http.set_header("Upload-Concat", "partial");
    }

    auto response = transport_->send(http);
    if (response.is_error()) {
        return response.error_as<std::string>();
    }
    if (!response.value().is_success()) {
        return Err<std::string>(network::status_error(response.value(), "Creating upload"));
    }
    return location_from(response.value(), "Creating upload");
}

Result<std::uint64_t> TusProtocol::patch(const std::string& location,
                                         std::uint64_t offset,
                                         const std::uint8_t* data,
                                         std::size_t size,
                                         const ChunkProgress& progress,
                                         const CancellationToken* cancel) {
    auto http = make_request(HttpMethod::PATCH, location);
    http.set_header("Upload-Offset", std::to_string(offset));
    http.set_header("Content-Type", "application/offset+octet-stream");
    http.body.assign(data, data + size);

    auto response = transport_->send(http, progress, cancel);
    if (response.is_error()) {
        return Err<std::uint64_t>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<std::uint64_t>(network::status_error(response.value(), "Uploading chunk at " + std::to_string(offset)));
    }
    return parse_offset(response.value(), "Uploading chunk");
}

Result<std::uint64_t> TusProtocol::offset(const std::string& location) {
    auto http = make_request(HttpMethod::HEAD, location);
    http.set_header("Cache-Control", "no-store");

    auto response = transport_->send(http);
    if (response.is_error()) {
        return Err<std::uint64_t>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<std::uint64_t>(network::status_error(response.value(), "Reading upload offset"));
    }
    return parse_offset(response.value(), "Reading upload offset");
}

Result<std::string> TusProtocol::concatenate(const std::vector<std::string>& part_locations,
                                             const UploadMetadata& metadata) {
    std::string concat = "final;";
    for (std::size_t i = 0; i < part_locations.size(); ++i) {
        if (i > 0) {
            concat += ' ';
        }
        concat += part_locations[i];
    }

    auto http = make_request(HttpMethod::POST, endpoint_url_);
    http.set_header("Upload-Concat", concat);
    http.set_header("Upload-Metadata", encode_upload_metadata(metadata));

    auto response = transport_->send(http);
    if (response.is_error()) {
        return response.error_as<std::string>();
    }
    if (!response.value().is_success()) {
        return Err<std::string>(network::status_error(response.value(), "Concatenating parts"));
    }
    auto location = location_from(response.value(), "Concatenating parts");
    if (location.is_ok()) {
        spdlog::debug("Final upload at {}", location.value());
    }
    return location;
}

Result<network::HeaderMap> TusProtocol::probe(const std::string& location) {
    auto response = transport_->send(make_request(HttpMethod::HEAD, location));
    if (response.is_error()) {
        return response.error_as<network::HeaderMap>();
    }
    if (!response.value().is_success()) {
        return Err<network::HeaderMap>(network::status_error(response.value(), "Reading upload metadata"));
    }
    return Ok(response.value().headers);
}

} // namespace skyup::transfer

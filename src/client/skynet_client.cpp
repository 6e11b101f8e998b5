#include "skyup/client/skynet_client.hpp"
#include "skyup/client/skyfile_endpoint.hpp"
#include "skyup/network/url.hpp"
#include "skyup/transfer/coordinator.hpp"
#include "skyup/transfer/tus_protocol.hpp"

#include <spdlog/spdlog.h>

namespace skyup::client {
namespace fs = std::filesystem;

namespace {

Result<upload::UploadOutcome> fail_before_upload(const upload::UploadContext& context, Error error) {
    if (context.progress) {
        context.progress->close();
    }
    return Err<upload::UploadOutcome>(std::move(error));
}

} // namespace

SkynetClient::SkynetClient(ClientConfig config, std::shared_ptr<network::HttpTransport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      headers_(build_request_headers(config_)) {}

Result<std::unique_ptr<SkynetClient>> SkynetClient::create(ClientConfig config,
                                                           std::shared_ptr<network::HttpTransport> transport) {
    if (!transport) {
        return Err<std::unique_ptr<SkynetClient>>(invalid_argument("SkynetClient requires a transport"));
    }
    if (auto valid = validate_client_config(config); valid.is_error()) {
        return valid.error_as<std::unique_ptr<SkynetClient>>();
    }
    spdlog::debug("Skynet client for portal {}", config.portal_url);
    return Ok(std::unique_ptr<SkynetClient>(new SkynetClient(std::move(config), std::move(transport))));
}

upload::UploadOptions SkynetClient::resolve_options(const upload::UploadOverrides& overrides) const {
    return upload::merge_options(upload::default_upload_options(), config_.upload, overrides);
}

Result<upload::UploadOutcome> SkynetClient::upload(const upload::ByteSource& source,
                                                   const std::string& filename,
                                                   const upload::UploadOverrides& overrides,
                                                   const upload::UploadContext& context) {
    const auto options = resolve_options(overrides);

    transfer::TusProtocol tus(transport_, network::make_url(config_.portal_url, options.endpoint_large_upload),
                              headers_);
    SkyfileEndpoint skyfile(transport_, config_.portal_url, headers_);
    transfer::ParallelUploadCoordinator coordinator(tus, skyfile);
    return coordinator.upload(source, filename, options, context);
}

Result<upload::UploadOutcome> SkynetClient::upload_data(const std::vector<std::uint8_t>& data,
                                                        const std::string& filename,
                                                        const upload::UploadOverrides& overrides,
                                                        const upload::UploadContext& context) {
    upload::MemorySource source(data);
    return upload(source, filename, overrides, context);
}

Result<upload::UploadOutcome> SkynetClient::upload_file(const fs::path& path,
                                                        const upload::UploadOverrides& overrides,
                                                        const upload::UploadContext& context) {
    const auto options = resolve_options(overrides);
    if (auto valid = upload::validate_options(options); valid.is_error()) {
        return fail_before_upload(context, valid.error());
    }

    auto source = upload::FileSource::open(path);
    if (source.is_error()) {
        return fail_before_upload(context, source.error());
    }

    const std::string filename = options.custom_filename.has_value() && !options.custom_filename->empty()
                                     ? *options.custom_filename
                                     : path.filename().string();
    return upload(*source.value(), filename, overrides, context);
}

} // namespace skyup::client

#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "http_types.hpp"
#include "skyup/core/cancellation.hpp"
#include "skyup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace skyup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/// Called after each slice of the request body is written, with the running total.
using BodyProgress = std::function<void(std::uint64_t bytes_written)>;

/**
 * @brief One request, one response
 *
 * Implementations must be safe to call from several threads at once: every
 * upload session issues its requests from its own thread.
 *
 * Failures to reach the server or to read a well-formed response are
 * TransportError marked transient. HTTP error statuses are NOT failures at
 * this level; they come back as a response for the caller to classify.
 *
 * When `cancel` trips while the request is in flight the connection is
 * dropped and the result is a Cancelled error.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request,
                                      const BodyProgress& progress = {},
                                      const CancellationToken* cancel = nullptr) = 0;
};

struct HttpClientOptions {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds io_timeout{std::chrono::seconds(120)};  ///< Per read or write step
    bool verify_peer = true;
};

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio
 *
 * Opens a fresh connection per request and sends `Connection: close`, so the
 * response ends at EOF at the latest. https:// URLs go through
 * asio::ssl (OpenSSL) with SNI and host name verification against the
 * system trust store.
 *
 * Each send() runs its own io_context; operations are started
 * asynchronously and the context is run in short slices up to a deadline,
 * so neither a stalled peer nor a cancelled caller is kept waiting for a
 * whole request.
 */
class HttpClient : public HttpTransport {
public:
    static Result<std::unique_ptr<HttpClient>> create(HttpClientOptions options = {});

    Result<HttpResponse> send(const HttpRequest& request,
                              const BodyProgress& progress = {},
                              const CancellationToken* cancel = nullptr) override;

private:
    HttpClient(HttpClientOptions options, std::unique_ptr<asio::ssl::context> ssl_context);

    HttpClientOptions options_;
    std::unique_ptr<asio::ssl::context> ssl_context_;
};

/**
 * @brief Request line and headers as written on the wire
 *
 * Adds Host, Content-Length (for requests with a body, and for POST/PATCH)
 * and Connection: close. Caller-supplied values for those three are ignored.
 */
std::string serialize_request_head(const HttpRequest& request, const std::string& host_header,
                                   const std::string& target);

} // namespace network
} // namespace skyup

#include "skyup/network/http_client.hpp"
#include "skyup/network/http_parser.hpp"
#include "skyup/network/url.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <functional>
#include <sstream>

namespace skyup {
namespace network {
namespace {

constexpr std::size_t kWriteSlice = 64 * 1024;
constexpr std::size_t kReadBuffer = 16 * 1024;

constexpr std::chrono::milliseconds kCancelPoll{100};

using Clock = std::chrono::steady_clock;
using LowestLayer = tcp::socket::lowest_layer_type;

enum class RunOutcome { Done, TimedOut, Cancelled };

/**
 * @brief Run the pending operation on `io` until it completes, `timeout`
 * passes or `cancel` trips
 *
 * The context runs in slices of kCancelPoll so that a cancel() from another
 * thread is seen while a write or read is still pending. When the operation
 * is interrupted, `abort_operation` must make it complete with
 * operation_aborted; the handlers are drained before returning.
 */
RunOutcome run_until_done(asio::io_context& io, const std::function<void()>& abort_operation,
                          std::chrono::milliseconds timeout, const CancellationToken* cancel) {
    io.restart();
    const auto deadline = Clock::now() + timeout;
    RunOutcome outcome = RunOutcome::TimedOut;
    for (;;) {
        if (cancel && cancel->is_cancelled()) {
            outcome = RunOutcome::Cancelled;
            break;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        io.run_for(std::min<Clock::duration>(deadline - now, kCancelPoll));
        if (io.stopped()) {
            return RunOutcome::Done;
        }
    }
    abort_operation();
    io.restart();
    io.run();
    return outcome;
}

std::function<void()> closer(LowestLayer& socket) {
    return [&socket]() {
        boost::system::error_code ignored;
        socket.close(ignored);
    };
}

Error interrupted(RunOutcome outcome, const std::string& step) {
    if (outcome == RunOutcome::Cancelled) {
        return cancelled("Request cancelled while " + step);
    }
    return transport_error("Timed out " + step, true);
}

Result<void> connect(asio::io_context& io, LowestLayer& socket, const Url& url,
                     std::chrono::milliseconds timeout, const CancellationToken* cancel) {
    boost::system::error_code ec = asio::error::would_block;
    tcp::resolver resolver(io);
    tcp::resolver::results_type endpoints;

    resolver.async_resolve(url.host, std::to_string(url.port),
        [&](const boost::system::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });
    // A lookup the resolver thread has already started still runs to the end;
    // cancel() only discards its result.
    auto outcome = run_until_done(io, [&resolver]() { resolver.cancel(); }, timeout, cancel);
    if (outcome != RunOutcome::Done) {
        return Err<void>(interrupted(outcome, "resolving " + url.host));
    }
    if (ec) {
        return Err<void>(transport_error("Failed to resolve " + url.host + ": " + ec.message(), true));
    }

    ec = asio::error::would_block;
    asio::async_connect(socket, endpoints,
        [&](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
    outcome = run_until_done(io, closer(socket), timeout, cancel);
    if (outcome != RunOutcome::Done) {
        return Err<void>(interrupted(outcome, "connecting to " + url.origin()));
    }
    if (ec) {
        return Err<void>(transport_error("Failed to connect to " + url.origin() + ": " + ec.message(), true));
    }
    return Ok();
}

template<typename Stream>
Result<void> write_all(asio::io_context& io, Stream& stream, const std::uint8_t* data, std::size_t size,
                       std::chrono::milliseconds timeout, const CancellationToken* cancel) {
    boost::system::error_code ec = asio::error::would_block;
    asio::async_write(stream, asio::buffer(data, size),
        [&](const boost::system::error_code& e, std::size_t) { ec = e; });
    const auto outcome = run_until_done(io, closer(stream.lowest_layer()), timeout, cancel);
    if (outcome != RunOutcome::Done) {
        return Err<void>(interrupted(outcome, "writing request"));
    }
    if (ec) {
        return Err<void>(transport_error("Write failed: " + ec.message(), true));
    }
    return Ok();
}

/**
 * @brief Write the request and read the response on a connected stream
 */
template<typename Stream>
Result<HttpResponse> exchange(asio::io_context& io, Stream& stream, const HttpRequest& request,
                              const std::string& head, const BodyProgress& progress,
                              std::chrono::milliseconds timeout, const CancellationToken* cancel) {
    auto written = write_all(io, stream, reinterpret_cast<const std::uint8_t*>(head.data()), head.size(),
                             timeout, cancel);
    if (written.is_error()) {
        return Err<HttpResponse>(written.error());
    }

    std::uint64_t body_sent = 0;
    while (body_sent < request.body.size()) {
        const auto slice = std::min<std::size_t>(kWriteSlice, request.body.size() - body_sent);
        written = write_all(io, stream, request.body.data() + body_sent, slice, timeout, cancel);
        if (written.is_error()) {
            return Err<HttpResponse>(written.error());
        }
        body_sent += slice;
        if (progress) {
            progress(body_sent);
        }
    }

    HttpResponseParser parser(request.method == HttpMethod::HEAD);
    std::array<char, kReadBuffer> buffer;
    for (;;) {
        boost::system::error_code ec = asio::error::would_block;
        std::size_t bytes_read = 0;
        stream.async_read_some(asio::buffer(buffer),
            [&](const boost::system::error_code& e, std::size_t n) {
                ec = e;
                bytes_read = n;
            });
        const auto outcome = run_until_done(io, closer(stream.lowest_layer()), timeout, cancel);
        if (outcome != RunOutcome::Done) {
            return Err<HttpResponse>(interrupted(outcome, "waiting for the response"));
        }

        if (bytes_read > 0) {
            auto parsed = parser.parse(buffer.data(), bytes_read);
            if (parsed.is_error()) {
                return Err<HttpResponse>(parsed.error());
            }
            if (parsed.value()) {
                break;
            }
        }

        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            break;
        }
        if (ec) {
            return Err<HttpResponse>(transport_error("Read failed: " + ec.message(), true));
        }
    }
    return Ok(parser.get_response());
}

} // namespace

std::string serialize_request_head(const HttpRequest& request, const std::string& host_header,
                                   const std::string& target) {
    std::ostringstream oss;
    oss << HttpMethodUtils::to_string(request.method) << " " << target << " HTTP/1.1\r\n";
    oss << "Host: " << host_header << "\r\n";

    for (const auto& [name, value] : request.headers) {
        if (strcasecmp_cross_platform(name.c_str(), "Host") == 0 ||
            strcasecmp_cross_platform(name.c_str(), "Content-Length") == 0 ||
            strcasecmp_cross_platform(name.c_str(), "Connection") == 0) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }

    if (!request.body.empty() || request.method == HttpMethod::POST || request.method == HttpMethod::PATCH) {
        oss << "Content-Length: " << request.body.size() << "\r\n";
    }
    oss << "Connection: close\r\n\r\n";
    return oss.str();
}

HttpClient::HttpClient(HttpClientOptions options, std::unique_ptr<asio::ssl::context> ssl_context)
    : options_(options), ssl_context_(std::move(ssl_context)) {}

Result<std::unique_ptr<HttpClient>> HttpClient::create(HttpClientOptions options) {
    try {
        auto ssl_context = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
        ssl_context->set_options(asio::ssl::context::default_workarounds |
                                 asio::ssl::context::no_sslv2 |
                                 asio::ssl::context::no_sslv3);
        if (options.verify_peer) {
            ssl_context->set_default_verify_paths();
            ssl_context->set_verify_mode(asio::ssl::verify_peer);
        } else {
            spdlog::warn("TLS peer verification is disabled");
            ssl_context->set_verify_mode(asio::ssl::verify_none);
        }
        return Ok(std::unique_ptr<HttpClient>(new HttpClient(options, std::move(ssl_context))));
    } catch (const boost::system::system_error& e) {
        return Err<std::unique_ptr<HttpClient>>(
            transport_error(std::string("Failed to set up TLS context: ") + e.what()));
    }
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request, const BodyProgress& progress,
                                      const CancellationToken* cancel) {
    auto parsed_url = parse_url(request.url);
    if (parsed_url.is_error()) {
        return Err<HttpResponse>(parsed_url.error());
    }
    const Url& url = parsed_url.value();

    std::string host_header = url.host;
    if (url.port != (url.is_tls() ? 443 : 80)) {
        host_header += ":" + std::to_string(url.port);
    }
    const std::string head = serialize_request_head(request, host_header, url.target);

    spdlog::debug("{} {} ({} body bytes)", HttpMethodUtils::to_string(request.method), request.url,
                  request.body.size());

    try {
        asio::io_context io;
        Result<HttpResponse> result = Err<HttpResponse>(transport_error("Request not sent", true));

        if (url.is_tls()) {
            asio::ssl::stream<tcp::socket> stream(io, *ssl_context_);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                return Err<HttpResponse>(transport_error("Failed to set SNI host name " + url.host, true));
            }
            if (options_.verify_peer) {
                stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
            }

            auto connected = connect(io, stream.lowest_layer(), url, options_.connect_timeout, cancel);
            if (connected.is_error()) {
                return Err<HttpResponse>(connected.error());
            }

            boost::system::error_code ec = asio::error::would_block;
            stream.async_handshake(asio::ssl::stream_base::client,
                [&](const boost::system::error_code& e) { ec = e; });
            const auto outcome = run_until_done(io, closer(stream.lowest_layer()), options_.connect_timeout, cancel);
            if (outcome != RunOutcome::Done) {
                return Err<HttpResponse>(interrupted(outcome, "in the TLS handshake with " + url.host));
            }
            if (ec) {
                return Err<HttpResponse>(
                    transport_error("TLS handshake with " + url.host + " failed: " + ec.message(), true));
            }

            result = exchange(io, stream, request, head, progress, options_.io_timeout, cancel);
        } else {
            tcp::socket socket(io);
            auto connected = connect(io, socket.lowest_layer(), url, options_.connect_timeout, cancel);
            if (connected.is_error()) {
                return Err<HttpResponse>(connected.error());
            }
            result = exchange(io, socket, request, head, progress, options_.io_timeout, cancel);
        }

        if (result.is_ok()) {
            spdlog::debug("{} {} -> {}", HttpMethodUtils::to_string(request.method), request.url,
                          result.value().status_code);
        }
        return result;
    } catch (const boost::system::system_error& e) {
        return Err<HttpResponse>(transport_error(std::string("Network error: ") + e.what(), true));
    }
}

} // namespace network
} // namespace skyup

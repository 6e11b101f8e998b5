#pragma once

#include "http_types.hpp"
#include "skyup/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace skyup {
namespace network {

/**
 * @brief States of the response parser
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    STATUS_LINE,
    HEADER_LINE,
    BODY_FIXED,        // Content-Length bytes
    BODY_UNTIL_CLOSE,  // no framing, body ends with the connection
    CHUNK_SIZE,        // chunked transfer coding: size line
    CHUNK_DATA,
    CHUNK_DATA_END,    // CRLF after each chunk
    CHUNK_TRAILER,     // trailer fields after the last chunk
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed it whatever the socket returned; parse() reports true once a full
 * response is available. Call finish() when the peer closes the connection
 * so that close-delimited bodies complete.
 *
 * Responses to HEAD requests never carry a body even when Content-Length
 * is present, so the parser has to be told the request method.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser(request.method == HttpMethod::HEAD);
 * while (!done) {
 *     auto n = socket.read_some(buffer);
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 *     done = result.value();
 * }
 * HttpResponse response = parser.get_response();
 * ```
 */
class HttpResponseParser {
public:
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    explicit HttpResponseParser(bool head_request = false) : head_request_(head_request) { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            switch (state_) {
                case ResponseParseState::BODY_FIXED:
                case ResponseParseState::CHUNK_DATA: {
                    const size_t take = static_cast<size_t>(
                        std::min<std::uint64_t>(remaining_, static_cast<std::uint64_t>(len - i)));
                    response_.body.insert(response_.body.end(),
                                          reinterpret_cast<const uint8_t*>(data + i),
                                          reinterpret_cast<const uint8_t*>(data + i + take));
                    i += take;
                    remaining_ -= take;
                    if (remaining_ == 0) {
                        state_ = state_ == ResponseParseState::BODY_FIXED
                                     ? ResponseParseState::COMPLETE
                                     : ResponseParseState::CHUNK_DATA_END;
                    }
                    break;
                }

                case ResponseParseState::BODY_UNTIL_CLOSE:
                    response_.body.insert(response_.body.end(),
                                          reinterpret_cast<const uint8_t*>(data + i),
                                          reinterpret_cast<const uint8_t*>(data + len));
                    i = len;
                    break;

                case ResponseParseState::COMPLETE:
                    // Bytes after a complete response are ignored (Connection: close).
                    return Ok(true);

                case ResponseParseState::PARSE_ERROR:
                    return Err<bool>(transport_error("Response parser in error state"));

                default: {
                    const char c = data[i++];
                    if (c != '\n') {
                        line_ += c;
                        if (line_.size() > kMaxLineLength) {
                            return fail("Response line too long");
                        }
                        break;
                    }
                    if (!line_.empty() && line_.back() == '\r') {
                        line_.pop_back();
                    }
                    auto handled = handle_line(line_);
                    line_.clear();
                    if (handled.is_error()) {
                        state_ = ResponseParseState::PARSE_ERROR;
                        return Err<bool>(handled.error());
                    }
                    break;
                }
            }

            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(state_ == ResponseParseState::COMPLETE);
    }

    /**
     * @brief Signal end of stream
     *
     * @return true if the response is complete, error if it was cut short
     */
    Result<bool> finish() {
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
        }
        if (state_ != ResponseParseState::COMPLETE) {
            return fail("Connection closed before the response was complete");
        }
        return Ok(true);
    }

    HttpResponse get_response() const { return response_; }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    void reset() {
        state_ = ResponseParseState::STATUS_LINE;
        response_ = HttpResponse();
        line_.clear();
        remaining_ = 0;
    }

private:
    bool head_request_;
    ResponseParseState state_;
    HttpResponse response_;
    std::string line_;           // Current line without CRLF
    std::uint64_t remaining_;    // Bytes left in the fixed body or current chunk

    Result<bool> fail(const std::string& message) {
        state_ = ResponseParseState::PARSE_ERROR;
        return Err<bool>(transport_error(message, true));
    }

    Result<void> handle_line(const std::string& line) {
        switch (state_) {
            case ResponseParseState::STATUS_LINE:
                return parse_status_line(line);
            case ResponseParseState::HEADER_LINE:
                return parse_header_line(line);
            case ResponseParseState::CHUNK_SIZE:
                return parse_chunk_size(line);
            case ResponseParseState::CHUNK_DATA_END:
                if (!line.empty()) {
                    return Err<void>(transport_error("Missing CRLF after chunk data", true));
                }
                state_ = ResponseParseState::CHUNK_SIZE;
                return Ok();
            case ResponseParseState::CHUNK_TRAILER:
                if (line.empty()) {
                    state_ = ResponseParseState::COMPLETE;
                }
                return Ok();
            default:
                return Err<void>(transport_error("Unexpected parser state", true));
        }
    }

    /**
     * @brief "HTTP/1.1 201 Created"
     */
    Result<void> parse_status_line(const std::string& line) {
        if (line.compare(0, 7, "HTTP/1.") != 0) {
            return Err<void>(transport_error("Malformed status line: " + line, true));
        }
        const auto first_space = line.find(' ');
        if (first_space == std::string::npos || line.size() < first_space + 4) {
            return Err<void>(transport_error("Malformed status line: " + line, true));
        }
        int code = 0;
        for (size_t i = first_space + 1; i < first_space + 4; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
                return Err<void>(transport_error("Malformed status code: " + line, true));
            }
            code = code * 10 + (line[i] - '0');
        }
        response_.status_code = code;
        response_.reason_phrase = line.size() > first_space + 5 ? line.substr(first_space + 5) : "";
        state_ = ResponseParseState::HEADER_LINE;
        return Ok();
    }

    Result<void> parse_header_line(const std::string& line) {
        if (line.empty()) {
            return begin_body();
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return Err<void>(transport_error("Malformed header line: " + line, true));
        }
        const std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        const auto first = value.find_first_not_of(" \t");
        const auto last = value.find_last_not_of(" \t");
        value = first == std::string::npos ? "" : value.substr(first, last - first + 1);

        auto existing = response_.headers.find(name);
        if (existing != response_.headers.end()) {
            existing->second += ", " + value;
        } else {
            response_.headers[name] = value;
        }
        return Ok();
    }

    Result<void> begin_body() {
        const int status = response_.status_code;

        // 1xx interim responses are followed by the real one.
        if (status >= 100 && status < 200) {
            response_ = HttpResponse();
            state_ = ResponseParseState::STATUS_LINE;
            return Ok();
        }

        if (head_request_ || status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return Ok();
        }

        std::string transfer_encoding = response_.get_header("Transfer-Encoding");
        std::transform(transfer_encoding.begin(), transfer_encoding.end(), transfer_encoding.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (transfer_encoding.find("chunked") != std::string::npos) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return Ok();
        }

        if (find_header(response_.headers, "Content-Length").has_value()) {
            const std::string text = response_.get_header("Content-Length");
            std::uint64_t length = 0;
            if (text.empty()) {
                return Err<void>(transport_error("Empty Content-Length", true));
            }
            for (char c : text) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return Err<void>(transport_error("Invalid Content-Length: " + text, true));
                }
                length = length * 10 + static_cast<std::uint64_t>(c - '0');
            }
            if (length == 0) {
                state_ = ResponseParseState::COMPLETE;
                return Ok();
            }
            response_.body.reserve(static_cast<size_t>(std::min<std::uint64_t>(length, 1 << 20)));
            remaining_ = length;
            state_ = ResponseParseState::BODY_FIXED;
            return Ok();
        }

        state_ = ResponseParseState::BODY_UNTIL_CLOSE;
        return Ok();
    }

    /**
     * @brief Hex chunk size, optionally followed by ";extension"
     */
    Result<void> parse_chunk_size(const std::string& line) {
        const std::string digits = line.substr(0, line.find(';'));
        if (digits.empty()) {
            return Err<void>(transport_error("Empty chunk size line", true));
        }
        std::uint64_t size = 0;
        for (char c : digits) {
            if (c == ' ' || c == '\t') {
                break;
            }
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return Err<void>(transport_error("Invalid chunk size: " + line, true));
            }
            const int nibble = std::isdigit(static_cast<unsigned char>(c))
                                   ? c - '0'
                                   : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
            size = (size << 4) | static_cast<std::uint64_t>(nibble);
        }
        if (size == 0) {
            state_ = ResponseParseState::CHUNK_TRAILER;
            return Ok();
        }
        remaining_ = size;
        state_ = ResponseParseState::CHUNK_DATA;
        return Ok();
    }
};

} // namespace network
} // namespace skyup

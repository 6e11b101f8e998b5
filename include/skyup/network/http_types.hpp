#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace skyup {
namespace network {

/**
 * @brief Request methods the portal client issues
 *
 * PATCH carries tus chunk data; HEAD reads upload offsets and the final
 * skylink header.
 */
enum class HttpMethod {
    GET,
    POST,
    PATCH,
    HEAD
};

/**
 * @brief Header storage; names keep their original case, lookups ignore it
 * (RFC 7230 section 3.2)
 */
using HeaderMap = std::unordered_map<std::string, std::string>;

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

/**
 * @brief Case-insensitive header lookup
 *
 * @return Header value if present, nullopt otherwise
 */
inline std::optional<std::string> find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return std::nullopt;
}

/**
 * @brief Outgoing request
 *
 * `url` is absolute (scheme, host, optional port, target). The transport
 * adds Host, Content-Length and Connection itself.
 *
 * Body is a byte vector because chunk payloads are binary.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HeaderMap headers;
    std::vector<uint8_t> body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name).value_or("");
    }
};

/**
 * @brief Parsed response
 *
 * Example wire form:
 * HTTP/1.1 204 No Content
 * Tus-Resumable: 1.0.0
 * Upload-Offset: 41943040
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name).value_or("");
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    /**
     * @brief Body as text (JSON replies, error messages)
     */
    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Method name as written on the request line
 */
class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PATCH: return "PATCH";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "UNKNOWN";
    }
};

} // namespace network
} // namespace skyup

#include "skyup/network/url.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace skyup::network {
namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

} // namespace

std::string Url::origin() const {
    std::string text = scheme + "://" + host;
    if (port != default_port(scheme)) {
        text += ":" + std::to_string(port);
    }
    return text;
}

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(invalid_argument("URL has no scheme: '" + text + "'"));
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(invalid_argument("Unsupported URL scheme '" + url.scheme + "' in '" + text + "'"));
    }

    const auto authority_start = scheme_end + 3;
    const auto target_start = text.find_first_of("/?", authority_start);
    std::string authority = text.substr(authority_start, target_start == std::string::npos
                                                             ? std::string::npos
                                                             : target_start - authority_start);
    if (authority.find('@') != std::string::npos) {
        return Err<Url>(invalid_argument("Credentials in URLs are not supported: '" + text + "'"));
    }

    url.port = default_port(url.scheme);
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        const std::string port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return Err<Url>(invalid_argument("Invalid port in URL '" + text + "'"));
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Url>(invalid_argument("Invalid port in URL '" + text + "'"));
        }
        url.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return Err<Url>(invalid_argument("URL has no host: '" + text + "'"));
    }
    url.host = to_lower(authority);

    if (target_start == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(target_start);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }
    const auto fragment = url.target.find('#');
    if (fragment != std::string::npos) {
        url.target.erase(fragment);
    }
    return Ok(url);
}

std::string make_url(const std::string& portal_url, const std::string& path, const std::string& extra) {
    auto join = [](std::string left, const std::string& right) {
        if (right.empty()) {
            return left;
        }
        while (!left.empty() && left.back() == '/') {
            left.pop_back();
        }
        std::size_t skip = 0;
        while (skip < right.size() && right[skip] == '/') {
            ++skip;
        }
        return left + "/" + right.substr(skip);
    };
    return join(join(portal_url, path), extra);
}

Result<std::string> resolve_location(const std::string& base_url, const std::string& location) {
    if (location.empty()) {
        return Err<std::string>(invalid_argument("Empty location"));
    }
    if (location.find("://") != std::string::npos) {
        return Ok(location);
    }

    auto base = parse_url(base_url);
    if (base.is_error()) {
        return Err<std::string>(base.error());
    }

    if (location.compare(0, 2, "//") == 0) {
        return Ok(base.value().scheme + ":" + location);
    }
    if (location.front() == '/') {
        return Ok(base.value().origin() + location);
    }

    std::string dir = base.value().target.substr(0, base.value().target.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return Ok(base.value().origin() + dir + location);
}

std::string percent_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string add_query(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params) {
    if (params.empty()) {
        return url;
    }
    std::string out = url;
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        out += separator;
        out += percent_encode(key) + "=" + percent_encode(value);
        separator = '&';
    }
    return out;
}

} // namespace skyup::network

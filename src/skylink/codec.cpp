#include "skyup/skylink/codec.hpp"

#include "skyup/core/base64.hpp"

#include <algorithm>

namespace skyup::skylink {
namespace {

constexpr const char* kShortPrefix = "sia:";

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

Result<RawSkylink> decode(const std::string& encoded) {
    if (encoded.size() != kEncodedSize) {
        return Err<RawSkylink>(malformed_skylink(
            "skylink is not " + std::to_string(kEncodedSize) + " characters long (got " +
            std::to_string(encoded.size()) + ")"));
    }

    std::string standard = encoded + "==";
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');

    auto bytes = base64::decode(standard);
    if (!bytes) {
        return Err<RawSkylink>(malformed_skylink("skylink is not valid base64: " + encoded));
    }
    if (bytes->size() != kRawSize) {
        return Err<RawSkylink>(malformed_skylink(
            "skylink decoded to " + std::to_string(bytes->size()) + " bytes, expected " +
            std::to_string(kRawSize)));
    }

    RawSkylink raw{};
    std::copy(bytes->begin(), bytes->end(), raw.begin());
    return Ok(raw);
}

std::string encode(const RawSkylink& raw) {
    std::string text = base64::encode(raw.data(), raw.size());
    while (!text.empty() && text.back() == '=') {
        text.pop_back();
    }
    std::replace(text.begin(), text.end(), '+', '-');
    std::replace(text.begin(), text.end(), '/', '_');
    return text;
}

std::string format(const std::string& input) {
    // Repeated prefixes are all removed so that format(format(x)) == format(x).
    std::string bare = input;
    for (;;) {
        if (starts_with(bare, kUriPrefix)) {
            bare.erase(0, std::char_traits<char>::length(kUriPrefix));
        } else if (starts_with(bare, kShortPrefix)) {
            bare.erase(0, std::char_traits<char>::length(kShortPrefix));
        } else {
            return bare;
        }
    }
}

std::string to_uri(const std::string& encoded) {
    return std::string(kUriPrefix) + encoded;
}

Result<std::string> normalize(const std::string& input) {
    std::string bare = format(input);
    auto decoded = decode(bare);
    if (decoded.is_error()) {
        return Err<std::string>(decoded.error());
    }
    return Ok(std::move(bare));
}

} // namespace skyup::skylink

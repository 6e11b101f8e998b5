#pragma once

#include "skyup/core/result.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace skyup::skylink {

/// Raw size in bytes of the data carried by a skylink.
constexpr std::size_t kRawSize = 34;

/// Length of a skylink in its unpadded base64url form.
constexpr std::size_t kEncodedSize = 46;

/// Canonical URI scheme prefix.
inline constexpr const char* kUriPrefix = "sia://";

using RawSkylink = std::array<std::uint8_t, kRawSize>;

/**
 * @brief Decode a bare 46-character skylink into its 34 raw bytes
 *
 * The input is padded with "==", moved from the URL-safe alphabet to the
 * standard one and base64-decoded. Any other input length, any character
 * outside the alphabet, or a decoded length other than 34 is
 * MalformedSkylink.
 */
Result<RawSkylink> decode(const std::string& encoded);

/// Inverse of decode(): unpadded base64url, always 46 characters.
std::string encode(const RawSkylink& raw);

/**
 * @brief Strip a recognised URI prefix ("sia://" or "sia:")
 *
 * Idempotent; inputs without a prefix come back unchanged.
 */
std::string format(const std::string& input);

/// Prepend the canonical "sia://" prefix to a bare skylink.
std::string to_uri(const std::string& encoded);

/**
 * @brief format() followed by decode(), returning the bare form
 *
 * Used on every skylink the portal hands back before it reaches the caller.
 */
Result<std::string> normalize(const std::string& input);

} // namespace skyup::skylink

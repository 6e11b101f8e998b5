#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skyup::base64 {

// Standard alphabet (RFC 4648 section 4), padded output.
std::string encode(const std::uint8_t* data, std::size_t size);
std::string encode(const std::vector<std::uint8_t>& data);
std::string encode(const std::string& text);

// Decodes padded standard base64. Returns nullopt on any character outside
// the alphabet, a length that is not a multiple of four, or misplaced '='.
std::optional<std::vector<std::uint8_t>> decode(const std::string& text);

} // namespace skyup::base64

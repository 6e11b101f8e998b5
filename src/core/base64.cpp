#include "skyup/core/base64.hpp"

#include <array>

namespace skyup::base64 {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_reverse_table() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

} // namespace

std::string encode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= size; i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                     static_cast<std::uint32_t>(data[i + 2]);
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += kAlphabet[triple & 0x3F];
    }

    const std::size_t rest = size - i;
    if (rest == 1) {
        const std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string encode(const std::vector<std::uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::string encode(const std::string& text) {
    return encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::optional<std::vector<std::uint8_t>> decode(const std::string& text) {
    static const std::array<int, 256> reverse = make_reverse_table();

    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last_group = (i + 4 == text.size());
        int values[4];
        int padding = 0;
        for (int j = 0; j < 4; ++j) {
            const char c = text[i + j];
            if (c == '=') {
                // Padding may only close the final group, in positions 2 and 3.
                if (!last_group || j < 2) {
                    return std::nullopt;
                }
                values[j] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            values[j] = reverse[static_cast<unsigned char>(c)];
            if (values[j] < 0) {
                return std::nullopt;
            }
        }

        const std::uint32_t triple = (static_cast<std::uint32_t>(values[0]) << 18) |
                                     (static_cast<std::uint32_t>(values[1]) << 12) |
                                     (static_cast<std::uint32_t>(values[2]) << 6) |
                                     static_cast<std::uint32_t>(values[3]);
        out.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<std::uint8_t>(triple & 0xFF));
        }
    }
    return out;
}

} // namespace skyup::base64

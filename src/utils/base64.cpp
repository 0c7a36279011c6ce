/**
 * @file base64.cpp
 * @brief Base64 implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/utils/base64.hpp"

#include <array>
#include <cstdint>

namespace pubsubd {
namespace utils {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Reverse lookup: 0..63 for alphabet characters, -1 otherwise.
std::array<int8_t, 256> buildReverseTable() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

}  // namespace

std::string Base64::encode(const std::string& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8) |
                     static_cast<uint8_t>(data[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(data[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

bool Base64::decode(const std::string& text, std::string& out) {
    static const std::array<int8_t, 256> reverse = buildReverseTable();

    out.clear();
    if (text.size() % 4 != 0) {
        return false;
    }
    out.reserve((text.size() / 4) * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool last = (i + 4 == text.size());
        int v[4];
        int padding = 0;

        for (int k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the final quantum, and only in its last two places.
                if (!last || k < 2) {
                    return false;
                }
                v[k] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) {
                return false;
            }
            v[k] = reverse[static_cast<unsigned char>(c)];
            if (v[k] < 0) {
                return false;
            }
        }

        uint32_t n = (static_cast<uint32_t>(v[0]) << 18) |
                     (static_cast<uint32_t>(v[1]) << 12) |
                     (static_cast<uint32_t>(v[2]) << 6) |
                     static_cast<uint32_t>(v[3]);

        out.push_back(static_cast<char>((n >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<char>((n >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<char>(n & 0xFF));
        }
    }

    return true;
}

}  // namespace utils
}  // namespace pubsubd

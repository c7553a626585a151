/*
 * base64.hpp
 *
 * standard alphabet base64 with '=' padding, the same encoding the
 * browser's btoa/atob pair produces for byte strings
 */

#ifndef CODEVEIL_BASE64_HPP
#define CODEVEIL_BASE64_HPP

#include <string>
#include <cstdint>
#include <stdexcept>

namespace codeveil {

inline std::string base64Encode(const std::string& input) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    size_t len = input.length();
    result.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t octet_a = static_cast<uint8_t>(input[i]);
        uint32_t octet_b = (i + 1 < len) ? static_cast<uint8_t>(input[i + 1]) : 0;
        uint32_t octet_c = (i + 2 < len) ? static_cast<uint8_t>(input[i + 2]) : 0;

        uint32_t triple = (octet_a << 16) | (octet_b << 8) | octet_c;

        result += alphabet[(triple >> 18) & 0x3F];
        result += alphabet[(triple >> 12) & 0x3F];
        result += (i + 1 < len) ? alphabet[(triple >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? alphabet[triple & 0x3F] : '=';
    }

    return result;
}

inline int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

/**
 * Decode base64 text. ASCII whitespace is ignored and padding is optional
 * (atob rules). Throws std::invalid_argument on a character outside the
 * alphabet, data after padding, or a dangling 6-bit group.
 */
inline std::string base64Decode(const std::string& input) {
    std::string result;
    result.reserve((input.length() / 4) * 3);

    uint32_t buffer = 0;
    int bits_collected = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char c : input) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
            continue;
        }
        if (c == '=') {
            padding++;
            continue;
        }
        int val = base64Value(c);
        if (val < 0) {
            throw std::invalid_argument(std::string("invalid base64 character '") + c + "'");
        }
        if (padding > 0) {
            throw std::invalid_argument("base64 data after padding");
        }

        buffer = (buffer << 6) | static_cast<uint32_t>(val);
        bits_collected += 6;
        symbols++;

        if (bits_collected >= 8) {
            bits_collected -= 8;
            result += static_cast<char>((buffer >> bits_collected) & 0xFF);
        }
    }

    if (symbols % 4 == 1 || padding > 2 ||
        (padding > 0 && (symbols + padding) % 4 != 0)) {
        throw std::invalid_argument("truncated base64 input");
    }

    return result;
}

} // namespace codeveil

#endif // CODEVEIL_BASE64_HPP

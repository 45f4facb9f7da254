#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Decodes standard (RFC 4648) base64 with '=' padding. ASCII whitespace is
// skipped. Returns nullopt on any other invalid input.
namespace base64 {

inline std::optional<std::vector<uint8_t>> decode(std::string_view in) {
    static constexpr auto table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        constexpr std::string_view alphabet =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (size_t i = 0; i < alphabet.size(); ++i) {
            t[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();

    std::vector<uint8_t> out;
    out.reserve(in.size() / 4 * 3);

    uint32_t acc = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char c : in) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            ++padding;
            ++symbols;
            continue;
        }
        if (padding > 0) return std::nullopt;  // data after padding

        int8_t v = table[static_cast<uint8_t>(c)];
        if (v < 0) return std::nullopt;

        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }

    if (symbols % 4 != 0 || padding > 2) return std::nullopt;
    // Leftover bits below the last full byte must be zero (canonical encoding).
    if (bits > 0 && (acc & ((1u << bits) - 1)) != 0) return std::nullopt;
    return out;
}

} // namespace base64

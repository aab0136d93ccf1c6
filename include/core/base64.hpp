#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flbkinesis::base64 {

namespace detail {
    inline constexpr std::string_view kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    inline constexpr std::array<int8_t, 256> make_reverse_table() {
        std::array<int8_t, 256> table{};
        for (auto& v : table) v = -1;
        for (size_t i = 0; i < kAlphabet.size(); ++i) {
            table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
        }
        return table;
    }

    inline constexpr auto kReverse = make_reverse_table();
} // namespace detail

/// Standard (RFC 4648) base64 with padding; PutRecords "Data" blobs use this form.
[[nodiscard]] inline std::string encode(std::string_view data) {
    std::string out;
    out.reserve(4 * ((data.size() + 2) / 3));

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                           (static_cast<uint8_t>(data[i + 1]) << 8) |
                           static_cast<uint8_t>(data[i + 2]);
        out += detail::kAlphabet[(n >> 18) & 0x3F];
        out += detail::kAlphabet[(n >> 12) & 0x3F];
        out += detail::kAlphabet[(n >> 6) & 0x3F];
        out += detail::kAlphabet[n & 0x3F];
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        const uint32_t n = static_cast<uint8_t>(data[i]) << 16;
        out += detail::kAlphabet[(n >> 18) & 0x3F];
        out += detail::kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                           (static_cast<uint8_t>(data[i + 1]) << 8);
        out += detail::kAlphabet[(n >> 18) & 0x3F];
        out += detail::kAlphabet[(n >> 12) & 0x3F];
        out += detail::kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

/// Strict decode: nullopt on a character outside the alphabet or bad length.
[[nodiscard]] inline std::optional<std::string> decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) return std::nullopt;

    std::string out;
    out.reserve(3 * encoded.size() / 4);

    uint32_t buf = 0;
    int bits = 0;
    size_t padding = 0;
    for (const char c : encoded) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return std::nullopt;  // data after padding
        const int8_t val = detail::kReverse[static_cast<unsigned char>(c)];
        if (val < 0) return std::nullopt;

        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    if (padding > 2) return std::nullopt;
    return out;
}

} // namespace flbkinesis::base64

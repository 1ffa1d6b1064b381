/**
 * @file encoding.cpp
 * @brief Base64URL codec and constant-time hex comparison
 */

#include "pgxnmeta/common.hpp"

#include <array>
#include <cstdint>
#include <format>

namespace pgxnmeta::common {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::uint8_t kInvalid = 0xff;

constexpr std::array<std::uint8_t, 256> make_decode_table()
{
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

constexpr auto kDecodeTable = make_decode_table();

[[nodiscard]] pgxnmeta::Error decode_error(std::string message)
{
    return pgxnmeta::Error::make(pgxnmeta::errc::kPayloadDecodeError,
                                 "invalid Base64URL payload: " + std::move(message));
}

/// A-F onto a-f; every other byte is returned unchanged.
[[nodiscard]] unsigned fold_hex_case(char c) noexcept
{
    const auto byte = static_cast<unsigned char>(c);
    const unsigned is_upper_hex = static_cast<unsigned>(byte - 'A') < 6U ? 1U : 0U;
    return byte | (is_upper_hex << 5);
}

}  // namespace

std::string base64url_encode(std::string_view data)
{
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const auto n = (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i])) << 16)
                       | (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8)
                       | static_cast<std::uint32_t>(static_cast<unsigned char>(data[i + 2]));
        out += kAlphabet[(n >> 18) & 0x3f];
        out += kAlphabet[(n >> 12) & 0x3f];
        out += kAlphabet[(n >> 6) & 0x3f];
        out += kAlphabet[n & 0x3f];
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const auto n = static_cast<std::uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        out += kAlphabet[(n >> 18) & 0x3f];
        out += kAlphabet[(n >> 12) & 0x3f];
    } else if (rest == 2) {
        const auto n = (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i])) << 16)
                       | (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8);
        out += kAlphabet[(n >> 18) & 0x3f];
        out += kAlphabet[(n >> 12) & 0x3f];
        out += kAlphabet[(n >> 6) & 0x3f];
    }
    return out;
}

pgxnmeta::Result<std::string> base64url_decode(std::string_view encoded)
{
    // Tolerate RFC 4648 padding, but only where it belongs.
    if (encoded.size() % 4 == 0) {
        std::size_t pad = 0;
        while (pad < 2 && pad < encoded.size() && encoded[encoded.size() - 1 - pad] == '=') {
            ++pad;
        }
        encoded.remove_suffix(pad);
    }
    if (encoded.size() % 4 == 1) {
        return std::unexpected(decode_error("truncated input"));
    }

    std::string out;
    out.reserve(encoded.size() * 3 / 4);

    std::uint32_t accum = 0;
    int bits = 0;
    for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
        const std::uint8_t value = kDecodeTable[static_cast<unsigned char>(encoded[pos])];
        if (value == kInvalid) {
            return std::unexpected(
                decode_error(std::format("unexpected character at offset {}", pos)));
        }
        accum = (accum << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((accum >> bits) & 0xff);
        }
    }

    // Leftover bits must be zero for a canonical encoding.
    if (bits > 0 && (accum & ((1U << bits) - 1)) != 0) {
        return std::unexpected(decode_error("non-zero trailing bits"));
    }
    return out;
}

bool constant_time_hex_equal(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    unsigned diff = 0;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        diff |= fold_hex_case(lhs[i]) ^ fold_hex_case(rhs[i]);
    }
    return diff == 0;
}

}  // namespace pgxnmeta::common

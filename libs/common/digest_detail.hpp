#pragma once

/**
 * @file digest_detail.hpp
 * @brief Shared helpers for the SHA family implementations
 */

#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>

namespace pgxnmeta::common::detail {

[[nodiscard]] inline std::string to_hex(std::span<const std::uint8_t> bytes)
{
    std::string result;
    result.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        result += std::format("{:02x}", b);
    }
    return result;
}

[[nodiscard]] constexpr std::uint32_t load_be32(const std::uint8_t* p) noexcept
{
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16)
           | (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

[[nodiscard]] constexpr std::uint64_t load_be64(const std::uint8_t* p) noexcept
{
    return (static_cast<std::uint64_t>(load_be32(p)) << 32) | load_be32(p + 4);
}

template <typename Word>
constexpr void store_be(Word value, std::uint8_t* out) noexcept
{
    for (std::size_t i = 0; i < sizeof(Word); ++i) {
        out[i] = static_cast<std::uint8_t>(value >> (8 * (sizeof(Word) - 1 - i)));
    }
}

}  // namespace pgxnmeta::common::detail

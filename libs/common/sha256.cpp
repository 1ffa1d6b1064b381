/**
 * @file sha256.cpp
 * @brief SHA-256 implementation (standalone, no external dependency)
 */

#include "digest_detail.hpp"
#include "pgxnmeta/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <ranges>
#include <span>

namespace pgxnmeta::common {

namespace {

// SHA-256 constants
constexpr std::array<uint32_t, 64> K = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
}};

[[nodiscard]] constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

class Sha256 {
public:
    static constexpr std::size_t kBlockSize = 64;

    void update(std::string_view data) {
        for (char c : data) {
            buffer_[buffer_len_++] = static_cast<uint8_t>(c);
            if (buffer_len_ == kBlockSize) {
                transform();
                bit_count_ += kBlockSize * 8;
                buffer_len_ = 0;
            }
        }
    }

    std::array<uint8_t, 32> finalize() {
        const uint64_t total_bits = bit_count_ + buffer_len_ * 8;

        buffer_[buffer_len_++] = 0x80;
        if (buffer_len_ > 56) {
            while (buffer_len_ < kBlockSize) buffer_[buffer_len_++] = 0;
            transform();
            buffer_len_ = 0;
        }
        while (buffer_len_ < 56) buffer_[buffer_len_++] = 0;
        detail::store_be(total_bits, &buffer_[56]);
        transform();

        std::array<uint8_t, 32> hash{};
        for (auto [i, word] : std::views::enumerate(state_)) {
            detail::store_be(word, &hash[static_cast<std::size_t>(i) * 4uz]);
        }
        return hash;
    }

private:
    void transform() {
        std::array<uint32_t, 64> w{};
        for (std::size_t i = 0; i < 16; ++i) {
            w[i] = detail::load_be32(&buffer_[i * 4uz]);
        }
        for (std::size_t i = 16; i < w.size(); ++i) {
            w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
        }

        uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3];
        uint32_t e = state_[4], f = state_[5], g = state_[6], h = state_[7];

        for (auto [i, w_val] : std::views::enumerate(w)) {
            uint32_t t1 = h + big_sigma1(e) + ch(e, f, g) + K[static_cast<std::size_t>(i)] + w_val;
            uint32_t t2 = big_sigma0(a) + maj(a, b, c);
            h = g; g = f; f = e; e = d + t1;
            d = c; c = b; b = a; a = t1 + t2;
        }

        state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d;
        state_[4] += e; state_[5] += f; state_[6] += g; state_[7] += h;
    }

    std::array<uint32_t, 8> state_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                                   0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};
    std::array<uint8_t, kBlockSize> buffer_{};
    std::size_t buffer_len_ = 0;
    uint64_t bit_count_ = 0;
};

} // namespace

std::string sha256(std::string_view data) {
    Sha256 hasher;
    hasher.update(data);
    return detail::to_hex(hasher.finalize());
}

} // namespace pgxnmeta::common

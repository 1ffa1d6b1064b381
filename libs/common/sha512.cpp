/**
 * @file sha512.cpp
 * @brief SHA-512 implementation (standalone, no external dependency)
 */

#include "digest_detail.hpp"
#include "pgxnmeta/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <ranges>

namespace pgxnmeta::common {

namespace {

constexpr std::array<uint64_t, 80> K = {{
    0x428a2f98d728ae22, 0x7137449123ef65cd, 0xb5c0fbcfec4d3b2f, 0xe9b5dba58189dbbc,
    0x3956c25bf348b538, 0x59f111f1b605d019, 0x923f82a4af194f9b, 0xab1c5ed5da6d8118,
    0xd807aa98a3030242, 0x12835b0145706fbe, 0x243185be4ee4b28c, 0x550c7dc3d5ffb4e2,
    0x72be5d74f27b896f, 0x80deb1fe3b1696b1, 0x9bdc06a725c71235, 0xc19bf174cf692694,
    0xe49b69c19ef14ad2, 0xefbe4786384f25e3, 0x0fc19dc68b8cd5b5, 0x240ca1cc77ac9c65,
    0x2de92c6f592b0275, 0x4a7484aa6ea6e483, 0x5cb0a9dcbd41fbd4, 0x76f988da831153b5,
    0x983e5152ee66dfab, 0xa831c66d2db43210, 0xb00327c898fb213f, 0xbf597fc7beef0ee4,
    0xc6e00bf33da88fc2, 0xd5a79147930aa725, 0x06ca6351e003826f, 0x142929670a0e6e70,
    0x27b70a8546d22ffc, 0x2e1b21385c26c926, 0x4d2c6dfc5ac42aed, 0x53380d139d95b3df,
    0x650a73548baf63de, 0x766a0abb3c77b2a8, 0x81c2c92e47edaee6, 0x92722c851482353b,
    0xa2bfe8a14cf10364, 0xa81a664bbc423001, 0xc24b8b70d0f89791, 0xc76c51a30654be30,
    0xd192e819d6ef5218, 0xd69906245565a910, 0xf40e35855771202a, 0x106aa07032bbd1b8,
    0x19a4c116b8d2d0c8, 0x1e376c085141ab53, 0x2748774cdf8eeb99, 0x34b0bcb5e19b48a8,
    0x391c0cb3c5c95a63, 0x4ed8aa4ae3418acb, 0x5b9cca4f7763e373, 0x682e6ff3d6b2b8a3,
    0x748f82ee5defb2fc, 0x78a5636f43172f60, 0x84c87814a1f0ab72, 0x8cc702081a6439ec,
    0x90befffa23631e28, 0xa4506cebde82bde9, 0xbef9a3f7b2c67915, 0xc67178f2e372532b,
    0xca273eceea26619c, 0xd186b8c721c0c207, 0xeada7dd6cde0eb1e, 0xf57d4f7fee6ed178,
    0x06f067aa72176fba, 0x0a637dc5a2c898a6, 0x113f9804bef90dae, 0x1b710b35131c471b,
    0x28db77f523047d84, 0x32caab7b40c72493, 0x3c9ebe0a15c9bebc, 0x431d67c49c100d4c,
    0x4cc5d4becb3e42b6, 0x597f299cfc657e2a, 0x5fcb6fab3ad6faec, 0x6c44198c4a475817
}};

[[nodiscard]] constexpr uint64_t big_sigma0(uint64_t x) noexcept {
    return std::rotr(x, 28) ^ std::rotr(x, 34) ^ std::rotr(x, 39);
}

[[nodiscard]] constexpr uint64_t big_sigma1(uint64_t x) noexcept {
    return std::rotr(x, 14) ^ std::rotr(x, 18) ^ std::rotr(x, 41);
}

[[nodiscard]] constexpr uint64_t small_sigma0(uint64_t x) noexcept {
    return std::rotr(x, 1) ^ std::rotr(x, 8) ^ (x >> 7U);
}

[[nodiscard]] constexpr uint64_t small_sigma1(uint64_t x) noexcept {
    return std::rotr(x, 19) ^ std::rotr(x, 61) ^ (x >> 6U);
}

class Sha512 {
public:
    static constexpr std::size_t kBlockSize = 128;

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

    std::array<uint8_t, 64> finalize() {
        const uint64_t total_bits = bit_count_ + buffer_len_ * 8;

        // The length field is 128 bits; inputs here never exceed 2^64 bits.
        buffer_[buffer_len_++] = 0x80;
        if (buffer_len_ > 112) {
            while (buffer_len_ < kBlockSize) buffer_[buffer_len_++] = 0;
            transform();
            buffer_len_ = 0;
        }
        while (buffer_len_ < 120) buffer_[buffer_len_++] = 0;
        detail::store_be(total_bits, &buffer_[120]);
        transform();

        std::array<uint8_t, 64> hash{};
        for (auto [i, word] : std::views::enumerate(state_)) {
            detail::store_be(word, &hash[static_cast<std::size_t>(i) * 8uz]);
        }
        return hash;
    }

private:
    void transform() {
        std::array<uint64_t, 80> w{};
        for (std::size_t i = 0; i < 16; ++i) {
            w[i] = detail::load_be64(&buffer_[i * 8uz]);
        }
        for (std::size_t i = 16; i < w.size(); ++i) {
            w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
        }

        uint64_t a = state_[0], b = state_[1], c = state_[2], d = state_[3];
        uint64_t e = state_[4], f = state_[5], g = state_[6], h = state_[7];

        for (auto [i, w_val] : std::views::enumerate(w)) {
            const uint64_t ch = (e & f) ^ (~e & g);
            const uint64_t maj = (a & b) ^ (a & c) ^ (b & c);
            uint64_t t1 = h + big_sigma1(e) + ch + K[static_cast<std::size_t>(i)] + w_val;
            uint64_t t2 = big_sigma0(a) + maj;
            h = g; g = f; f = e; e = d + t1;
            d = c; c = b; b = a; a = t1 + t2;
        }

        state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d;
        state_[4] += e; state_[5] += f; state_[6] += g; state_[7] += h;
    }

    std::array<uint64_t, 8> state_{0x6a09e667f3bcc908, 0xbb67ae8584caa73b, 0x3c6ef372fe94f82b,
                                   0xa54ff53a5f1d36f1, 0x510e527fade682d1, 0x9b05688c2b3e6c1f,
                                   0x1f83d9abfb41bd6b, 0x5be0cd19137e2179};
    std::array<uint8_t, kBlockSize> buffer_{};
    std::size_t buffer_len_ = 0;
    uint64_t bit_count_ = 0;
};

} // namespace

std::string sha512(std::string_view data) {
    Sha512 hasher;
    hasher.update(data);
    return detail::to_hex(hasher.finalize());
}

} // namespace pgxnmeta::common

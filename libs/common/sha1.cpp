/**
 * @file sha1.cpp
 * @brief SHA-1 implementation (standalone, no external dependency)
 *
 * Only used to verify legacy release digests.
 */

#include "digest_detail.hpp"
#include "pgxnmeta/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <ranges>

namespace pgxnmeta::common {

namespace {

class Sha1 {
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

    std::array<uint8_t, 20> finalize() {
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

        std::array<uint8_t, 20> hash{};
        for (auto [i, word] : std::views::enumerate(state_)) {
            detail::store_be(word, &hash[static_cast<std::size_t>(i) * 4uz]);
        }
        return hash;
    }

private:
    void transform() {
        std::array<uint32_t, 80> w{};
        for (std::size_t i = 0; i < 16; ++i) {
            w[i] = detail::load_be32(&buffer_[i * 4uz]);
        }
        for (std::size_t i = 16; i < w.size(); ++i) {
            w[i] = std::rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
        }

        uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3], e = state_[4];

        for (std::size_t i = 0; i < w.size(); ++i) {
            uint32_t f = 0;
            uint32_t k = 0;
            if (i < 20) {
                f = (b & c) | (~b & d);
                k = 0x5a827999;
            } else if (i < 40) {
                f = b ^ c ^ d;
                k = 0x6ed9eba1;
            } else if (i < 60) {
                f = (b & c) | (b & d) | (c & d);
                k = 0x8f1bbcdc;
            } else {
                f = b ^ c ^ d;
                k = 0xca62c1d6;
            }
            const uint32_t temp = std::rotl(a, 5) + f + e + k + w[i];
            e = d;
            d = c;
            c = std::rotl(b, 30);
            b = a;
            a = temp;
        }

        state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d; state_[4] += e;
    }

    std::array<uint32_t, 5> state_{0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476, 0xc3d2e1f0};
    std::array<uint8_t, kBlockSize> buffer_{};
    std::size_t buffer_len_ = 0;
    uint64_t bit_count_ = 0;
};

} // namespace

std::string sha1(std::string_view data) {
    Sha1 hasher;
    hasher.update(data);
    return detail::to_hex(hasher.finalize());
}

} // namespace pgxnmeta::common

/**
 * @file sha256.cpp
 * @brief SHA-256 digest used for cache fingerprints (FIPS 180-4)
 */

#include "verso/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <span>

namespace verso::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
}};

constexpr std::size_t kBlockSize = 64;

[[nodiscard]] constexpr std::uint32_t load_big_endian(const std::uint8_t* bytes) noexcept
{
    return (static_cast<std::uint32_t>(bytes[0]) << 24U)
           | (static_cast<std::uint32_t>(bytes[1]) << 16U)
           | (static_cast<std::uint32_t>(bytes[2]) << 8U) | static_cast<std::uint32_t>(bytes[3]);
}

class Sha256
{
public:
    void update(std::span<const std::uint8_t> data)
    {
        m_total_bytes += data.size();
        for (std::uint8_t byte : data) {
            m_block[m_block_len++] = byte;
            if (m_block_len == kBlockSize) {
                compress();
                m_block_len = 0;
            }
        }
    }

    [[nodiscard]] std::array<std::uint8_t, 32> finish()
    {
        const std::uint64_t bit_length = m_total_bytes * 8U;

        m_block[m_block_len++] = 0x80;
        if (m_block_len > kBlockSize - 8) {
            std::memset(&m_block[m_block_len], 0, kBlockSize - m_block_len);
            compress();
            m_block_len = 0;
        }
        std::memset(&m_block[m_block_len], 0, kBlockSize - 8 - m_block_len);
        for (std::size_t i = 0; i < 8; ++i) {
            m_block[kBlockSize - 1 - i] = static_cast<std::uint8_t>(bit_length >> (8U * i));
        }
        compress();

        std::array<std::uint8_t, 32> digest{};
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            digest[i * 4 + 0] = static_cast<std::uint8_t>(m_state[i] >> 24U);
            digest[i * 4 + 1] = static_cast<std::uint8_t>(m_state[i] >> 16U);
            digest[i * 4 + 2] = static_cast<std::uint8_t>(m_state[i] >> 8U);
            digest[i * 4 + 3] = static_cast<std::uint8_t>(m_state[i]);
        }
        return digest;
    }

private:
    void compress()
    {
        std::array<std::uint32_t, 64> schedule{};
        for (std::size_t i = 0; i < 16; ++i) {
            schedule[i] = load_big_endian(&m_block[i * 4]);
        }
        for (std::size_t i = 16; i < schedule.size(); ++i) {
            const std::uint32_t s0 = std::rotr(schedule[i - 15], 7) ^ std::rotr(schedule[i - 15], 18)
                                     ^ (schedule[i - 15] >> 3U);
            const std::uint32_t s1 = std::rotr(schedule[i - 2], 17) ^ std::rotr(schedule[i - 2], 19)
                                     ^ (schedule[i - 2] >> 10U);
            schedule[i] = schedule[i - 16] + s0 + schedule[i - 7] + s1;
        }

        auto work = m_state;
        for (std::size_t i = 0; i < schedule.size(); ++i) {
            const auto [a, b, c, d, e, f, g, h] = work;
            const std::uint32_t big_s1 = std::rotr(e, 6) ^ std::rotr(e, 11) ^ std::rotr(e, 25);
            const std::uint32_t choose = (e & f) ^ (~e & g);
            const std::uint32_t t1 = h + big_s1 + choose + kRoundConstants[i] + schedule[i];
            const std::uint32_t big_s0 = std::rotr(a, 2) ^ std::rotr(a, 13) ^ std::rotr(a, 22);
            const std::uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
            const std::uint32_t t2 = big_s0 + majority;
            work = {t1 + t2, a, b, c, d + t1, e, f, g};
        }
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            m_state[i] += work[i];
        }
    }

    std::array<std::uint32_t, 8> m_state = kInitialState;
    std::array<std::uint8_t, kBlockSize> m_block{};
    std::size_t m_block_len = 0;
    std::uint64_t m_total_bytes = 0;
};

}  // namespace

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));

    std::string hex;
    hex.reserve(64);
    for (std::uint8_t byte : hasher.finish()) {
        hex += std::format("{:02x}", byte);
    }
    return hex;
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace verso::common

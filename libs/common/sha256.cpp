/**
 * @file sha256.cpp
 * @brief Incremental SHA-256 (standalone, no external dependency)
 */

#include "opentreasury/common.hpp"

#include <algorithm>
#include <bit>
#include <cctype>
#include <format>

namespace opentreasury::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
}};

constexpr std::size_t kBlockSize = 64;
constexpr std::size_t kLengthOffset = kBlockSize - sizeof(std::uint64_t);

[[nodiscard]] constexpr std::uint32_t load_be32(const std::uint8_t* p) noexcept
{
    return (static_cast<std::uint32_t>(p[0]) << 24U) | (static_cast<std::uint32_t>(p[1]) << 16U)
           | (static_cast<std::uint32_t>(p[2]) << 8U) | static_cast<std::uint32_t>(p[3]);
}

}  // namespace

Sha256::Sha256()
    : m_state(kInitialState)
    , m_pending{}
    , m_pending_len(0)
    , m_message_len(0)
{}

void Sha256::reset()
{
    m_state = kInitialState;
    m_pending.fill(0);
    m_pending_len = 0;
    m_message_len = 0;
}

void Sha256::update(std::span<const std::uint8_t> data)
{
    m_message_len += data.size();

    // Top up a partially filled block first.
    if (m_pending_len > 0) {
        const std::size_t take = std::min(kBlockSize - m_pending_len, data.size());
        std::ranges::copy(data.first(take), m_pending.begin() + static_cast<std::ptrdiff_t>(m_pending_len));
        m_pending_len += take;
        data = data.subspan(take);
        if (m_pending_len < kBlockSize) {
            return;
        }
        compress_block(m_pending.data());
        m_pending_len = 0;
    }

    while (data.size() >= kBlockSize) {
        compress_block(data.data());
        data = data.subspan(kBlockSize);
    }

    std::ranges::copy(data, m_pending.begin());
    m_pending_len = data.size();
}

void Sha256::update(std::string_view data)
{
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()),
                                         data.size()));
}

Sha256Digest Sha256::finish()
{
    const std::uint64_t bit_len = m_message_len * 8U;

    m_pending[m_pending_len++] = 0x80;
    if (m_pending_len > kLengthOffset) {
        std::fill(m_pending.begin() + static_cast<std::ptrdiff_t>(m_pending_len),
                  m_pending.end(),
                  std::uint8_t{0});
        compress_block(m_pending.data());
        m_pending_len = 0;
    }
    std::fill(m_pending.begin() + static_cast<std::ptrdiff_t>(m_pending_len),
              m_pending.begin() + static_cast<std::ptrdiff_t>(kLengthOffset),
              std::uint8_t{0});
    for (std::size_t i = 0; i < sizeof(std::uint64_t); ++i) {
        m_pending[kLengthOffset + i] = static_cast<std::uint8_t>(bit_len >> (56U - 8U * i));
    }
    compress_block(m_pending.data());
    m_pending_len = 0;

    Sha256Digest digest{};
    for (std::size_t i = 0; i < m_state.size(); ++i) {
        digest[i * 4 + 0] = static_cast<std::uint8_t>(m_state[i] >> 24U);
        digest[i * 4 + 1] = static_cast<std::uint8_t>(m_state[i] >> 16U);
        digest[i * 4 + 2] = static_cast<std::uint8_t>(m_state[i] >> 8U);
        digest[i * 4 + 3] = static_cast<std::uint8_t>(m_state[i]);
    }
    return digest;
}

void Sha256::compress_block(const std::uint8_t* block)
{
    std::array<std::uint32_t, 64> w{};
    for (std::size_t t = 0; t < 16; ++t) {
        w[t] = load_be32(block + t * 4);
    }
    for (std::size_t t = 16; t < 64; ++t) {
        const std::uint32_t s0 = std::rotr(w[t - 15], 7) ^ std::rotr(w[t - 15], 18) ^ (w[t - 15] >> 3U);
        const std::uint32_t s1 = std::rotr(w[t - 2], 17) ^ std::rotr(w[t - 2], 19) ^ (w[t - 2] >> 10U);
        w[t] = w[t - 16] + s0 + w[t - 7] + s1;
    }

    auto v = m_state;
    for (std::size_t t = 0; t < 64; ++t) {
        const std::uint32_t big_s1 = std::rotr(v[4], 6) ^ std::rotr(v[4], 11) ^ std::rotr(v[4], 25);
        const std::uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
        const std::uint32_t temp1 = v[7] + big_s1 + choose + kRoundConstants[t] + w[t];
        const std::uint32_t big_s0 = std::rotr(v[0], 2) ^ std::rotr(v[0], 13) ^ std::rotr(v[0], 22);
        const std::uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        const std::uint32_t temp2 = big_s0 + majority;

        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + temp1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = temp1 + temp2;
    }

    for (std::size_t i = 0; i < m_state.size(); ++i) {
        m_state[i] += v[i];
    }
}

std::string to_hex(std::span<const std::uint8_t> bytes)
{
    std::string result;
    result.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        result += std::format("{:02x}", b);
    }
    return result;
}

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    const auto digest = hasher.finish();
    return to_hex(digest);
}

bool is_sha256_hex(std::string_view value)
{
    return value.size() == kSha256HexLength && std::ranges::all_of(value, [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

}  // namespace opentreasury::common

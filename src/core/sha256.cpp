#include "wid/core/sha256.h"

#include <algorithm>

namespace wid::core {

namespace {

// FIPS 180-4 §5.3.3: SHA-256 initial hash values.
// First 32 bits of fractional parts of square roots of first 8 primes.
constexpr std::array<std::uint32_t, 8> kH0 = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2: SHA-256 round constants.
// First 32 bits of fractional parts of cube roots of first 64 primes.
constexpr std::array<std::uint32_t, 64> kK = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr std::uint32_t rotr32(std::uint32_t x, unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

// FIPS 180-4 §4.1.2: SHA-256 functions.
constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept {
  return rotr32(x, 2u) ^ rotr32(x, 13u) ^ rotr32(x, 22u);
}

constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept {
  return rotr32(x, 6u) ^ rotr32(x, 11u) ^ rotr32(x, 25u);
}

constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept {
  return rotr32(x, 7u) ^ rotr32(x, 18u) ^ (x >> 3u);
}

constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept {
  return rotr32(x, 17u) ^ rotr32(x, 19u) ^ (x >> 10u);
}

}  // namespace

Sha256::Sha256() : state_(kH0) {}

void Sha256::process_block(const std::uint8_t* block) {
  std::array<std::uint32_t, 64> w{};
  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = (static_cast<std::uint32_t>(block[i * 4u]) << 24u) |
           (static_cast<std::uint32_t>(block[i * 4u + 1u]) << 16u) |
           (static_cast<std::uint32_t>(block[i * 4u + 2u]) << 8u) |
           static_cast<std::uint32_t>(block[i * 4u + 3u]);
  }
  for (unsigned i = 16u; i < 64u; ++i) {
    w[i] = small_sigma1(w[i - 2u]) + w[i - 7u] + small_sigma0(w[i - 15u]) + w[i - 16u];
  }

  auto v = state_;  // a..h
  for (unsigned i = 0; i < 64u; ++i) {
    const std::uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const std::uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const std::uint32_t t1 = v[7] + big_sigma1(v[4]) + ch + kK[i] + w[i];
    const std::uint32_t t2 = big_sigma0(v[0]) + maj;
    std::rotate(v.rbegin(), v.rbegin() + 1, v.rend());
    v[4] += t1;
    v[0] = t1 + t2;
  }

  for (std::size_t i = 0; i < state_.size(); ++i) {
    state_[i] += v[i];
  }
}

void Sha256::update(const std::span<const std::uint8_t> bytes) {
  total_len_ += bytes.size();
  std::size_t offset = 0;

  if (buffered_ > 0) {
    const std::size_t take = std::min(bytes.size(), buffer_.size() - buffered_);
    std::copy_n(bytes.begin(), take, buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_));
    buffered_ += take;
    offset = take;
    if (buffered_ < buffer_.size()) {
      return;
    }
    process_block(buffer_.data());
    buffered_ = 0;
  }

  while (bytes.size() - offset >= 64u) {
    process_block(bytes.data() + offset);
    offset += 64u;
  }

  const std::size_t rest = bytes.size() - offset;
  std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(offset), rest, buffer_.begin());
  buffered_ = rest;
}

void Sha256::update(const std::string_view text) {
  update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                       text.size()));
}

Sha256Digest Sha256::finish() {
  // FIPS 180-4 §5.1.1: append 0x80, zero-fill, then the 64-bit big-endian bit length.
  const std::uint64_t bit_len = total_len_ * 8u;
  buffer_[buffered_++] = 0x80u;
  if (buffered_ > 56u) {
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.end(), 0u);
    process_block(buffer_.data());
    buffered_ = 0;
  }
  std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.begin() + 56, 0u);
  for (unsigned i = 0; i < 8u; ++i) {
    buffer_[56u + i] = static_cast<std::uint8_t>(bit_len >> ((7u - i) * 8u));
  }
  process_block(buffer_.data());

  Sha256Digest digest{};
  for (std::size_t i = 0; i < state_.size(); ++i) {
    digest[i * 4u] = static_cast<std::uint8_t>(state_[i] >> 24u);
    digest[i * 4u + 1u] = static_cast<std::uint8_t>(state_[i] >> 16u);
    digest[i * 4u + 2u] = static_cast<std::uint8_t>(state_[i] >> 8u);
    digest[i * 4u + 3u] = static_cast<std::uint8_t>(state_[i]);
  }
  return digest;
}

std::string to_hex(const Sha256Digest& digest) {
  constexpr const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2u);
  for (const std::uint8_t b : digest) {
    out.push_back(kHex[b >> 4u]);
    out.push_back(kHex[b & 0x0fu]);
  }
  return out;
}

std::string sha256_hex(const std::string_view input) {
  Sha256 hasher;
  hasher.update(input);
  return to_hex(hasher.finish());
}

std::string sha256_hex(const std::span<const std::uint8_t> input) {
  Sha256 hasher;
  hasher.update(input);
  return to_hex(hasher.finish());
}

}  // namespace wid::core

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace wid::core {

using Sha256Digest = std::array<std::uint8_t, 32>;

// Sha256 is an incremental FIPS 180-4 SHA-256 hasher.
// No external dependencies. Feed bytes with update(), then call finish() once.
class Sha256 {
 public:
  Sha256();

  void update(std::span<const std::uint8_t> bytes);
  void update(std::string_view text);

  // Pads, processes the final block(s) and returns the digest.
  // The hasher must not be updated again afterwards.
  [[nodiscard]] Sha256Digest finish();

 private:
  void process_block(const std::uint8_t* block);

  std::array<std::uint32_t, 8> state_;
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_len_{0};
};

// to_hex renders a digest as 64 lower-case hex characters.
[[nodiscard]] std::string to_hex(const Sha256Digest& digest);

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);
[[nodiscard]] std::string sha256_hex(std::span<const std::uint8_t> input);

}  // namespace wid::core

#pragma once

#include "wid/core/result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wid::manifest {

// Wire constants of the SYNM container.
inline constexpr std::string_view kManifestMagic = "SYNM";
inline constexpr std::uint16_t kManifestVersion = 1;
inline constexpr std::size_t kMaxManifestSize = 64 * 1024;
// magic(4) + version(2, big-endian) + metadata length(4, big-endian)
inline constexpr std::size_t kHeaderSize = 10;

enum class DataType {
  kUnknown,
  kText,
  kJson,
  kBinary,
};

// MIME-style names: "unknown", "text/plain", "application/json",
// "application/octet-stream".
[[nodiscard]] std::string to_string(DataType type);
[[nodiscard]] std::optional<DataType> parse_data_type(std::string_view text);

enum class ManifestErrorCode {
  kInvalidMagic,      // leading four bytes are not "SYNM"
  kManifestTooLarge,  // metadata block exceeds kMaxManifestSize
  kDataTooSmall,      // buffer shorter than the header or the declared metadata
  kInvalidJson,       // metadata is not valid UTF-8 JSON or lacks a string "id"
  kIo,                // filesystem read or write failed
};

struct ManifestError {
  ManifestErrorCode code;  // NOLINT(readability-identifier-naming)
  std::string message;     // NOLINT(readability-identifier-naming)
};

// Manifest is the metadata record attached to a payload.
// data_size and data_hash are derived: SynapseFile recomputes them before
// every encode and never trusts the values a decoded manifest carries.
// data_type stays a free string so MIME types outside DataType survive.
struct Manifest {
  std::string id;                                         // NOLINT(readability-identifier-naming)
  std::uint16_t version{kManifestVersion};                // NOLINT(readability-identifier-naming)
  std::string node;                                       // NOLINT(readability-identifier-naming)
  std::string data_type{"unknown"};                       // NOLINT(readability-identifier-naming)
  std::uint64_t data_size{0};                             // NOLINT(readability-identifier-naming)
  std::string data_hash;                                  // NOLINT(readability-identifier-naming)
  nlohmann::json metadata = nlohmann::json::object();     // NOLINT(readability-identifier-naming)

  // Empty metadata is omitted.
  [[nodiscard]] nlohmann::json to_json() const;

  // "id" is required and must be a string; version defaults to
  // kManifestVersion; every other field defaults to empty or zero.
  [[nodiscard]] static core::Result<Manifest, ManifestError> from_json(const nlohmann::json& j);

  // Parses UTF-8 JSON text, then applies from_json().
  [[nodiscard]] static core::Result<Manifest, ManifestError> parse(std::string_view text);
};

}  // namespace wid::manifest

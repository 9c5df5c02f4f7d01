#pragma once

#include "wid/core/result.h"
#include "wid/manifest/manifest.h"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace wid::manifest {

// How a container is laid out on disk.
enum class FramingMode {
  kEmbedded,  // one file: header, metadata JSON, payload
  kSidecar,   // raw payload at path, metadata at <path>.manifest.json
};

// SynapseFile owns one manifest and one opaque payload.
// Copies are deep; two instances never share a payload buffer.
class SynapseFile {
 public:
  using BytesResult = core::Result<std::vector<std::uint8_t>, ManifestError>;
  using DecodeResult = core::Result<SynapseFile, ManifestError>;
  using SaveResult = core::Result<bool, ManifestError>;

  SynapseFile(Manifest manifest, std::vector<std::uint8_t> payload);

  [[nodiscard]] const Manifest& manifest() const { return manifest_; }
  [[nodiscard]] Manifest& manifest() { return manifest_; }
  [[nodiscard]] const std::vector<std::uint8_t>& payload() const { return payload_; }
  [[nodiscard]] std::vector<std::uint8_t>& payload() { return payload_; }

  // Recompute data_size and data_hash from the current payload.
  void refresh_digest();

  // Encode to the embedded wire layout. Refreshes the digest first and fails
  // with kManifestTooLarge rather than truncating the metadata block.
  [[nodiscard]] BytesResult to_bytes();

  // Decode the embedded wire layout. Size, magic, metadata ceiling and
  // truncation are all checked before any byte reaches the JSON parser.
  [[nodiscard]] static DecodeResult from_bytes(std::span<const std::uint8_t> data);

  [[nodiscard]] SaveResult save(const std::filesystem::path& path,
                                FramingMode mode = FramingMode::kEmbedded);

  // Detects the layout: embedded magic first, then a sidecar manifest, then
  // a bare payload with a synthesized manifest (id = file stem).
  [[nodiscard]] static DecodeResult load(const std::filesystem::path& path);

  // True when the payload still hashes to manifest().data_hash.
  [[nodiscard]] bool verify() const;

 private:
  Manifest manifest_;
  std::vector<std::uint8_t> payload_;
};

}  // namespace wid::manifest

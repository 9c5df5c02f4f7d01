#pragma once

#include "wid/manifest/synapse_file.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace wid::manifest {

// IFramingStrategy is one on-disk layout of a SynapseFile.
// Both layouts share the same Manifest/payload model; only the encoding differs.
class IFramingStrategy {
 public:
  virtual ~IFramingStrategy() = default;

  [[nodiscard]] virtual FramingMode mode() const = 0;

  // Writes file to path. The caller refreshes the digest beforehand.
  [[nodiscard]] virtual SynapseFile::SaveResult write(const std::filesystem::path& path,
                                                      SynapseFile& file) const = 0;

  // True when this layout can decode the file at path whose contents are data.
  [[nodiscard]] virtual bool detect(const std::filesystem::path& path,
                                    std::span<const std::uint8_t> data) const = 0;

  [[nodiscard]] virtual SynapseFile::DecodeResult read(const std::filesystem::path& path,
                                                       std::vector<std::uint8_t> data) const = 0;

 protected:
  IFramingStrategy() = default;
  IFramingStrategy(const IFramingStrategy&) = default;
  IFramingStrategy& operator=(const IFramingStrategy&) = default;
  IFramingStrategy(IFramingStrategy&&) = default;
  IFramingStrategy& operator=(IFramingStrategy&&) = default;
};

// Single file: SYNM header, compact JSON metadata, payload.
class EmbeddedFraming final : public IFramingStrategy {
 public:
  [[nodiscard]] FramingMode mode() const override { return FramingMode::kEmbedded; }
  [[nodiscard]] SynapseFile::SaveResult write(const std::filesystem::path& path,
                                              SynapseFile& file) const override;
  [[nodiscard]] bool detect(const std::filesystem::path& path,
                            std::span<const std::uint8_t> data) const override;
  [[nodiscard]] SynapseFile::DecodeResult read(const std::filesystem::path& path,
                                               std::vector<std::uint8_t> data) const override;
};

// Raw payload at path plus indented JSON at sidecar_path(path).
class SidecarFraming final : public IFramingStrategy {
 public:
  [[nodiscard]] FramingMode mode() const override { return FramingMode::kSidecar; }
  [[nodiscard]] SynapseFile::SaveResult write(const std::filesystem::path& path,
                                              SynapseFile& file) const override;
  [[nodiscard]] bool detect(const std::filesystem::path& path,
                            std::span<const std::uint8_t> data) const override;
  [[nodiscard]] SynapseFile::DecodeResult read(const std::filesystem::path& path,
                                               std::vector<std::uint8_t> data) const override;
};

// "<path>.manifest.json", e.g. data.bin -> data.bin.manifest.json.
[[nodiscard]] std::filesystem::path sidecar_path(const std::filesystem::path& path);

[[nodiscard]] std::unique_ptr<IFramingStrategy> make_framing(FramingMode mode);

// Whole-file helpers shared by the framing strategies and the CLI.
[[nodiscard]] core::Result<std::vector<std::uint8_t>, ManifestError> read_file_bytes(
    const std::filesystem::path& path);
[[nodiscard]] SynapseFile::SaveResult write_file_bytes(const std::filesystem::path& path,
                                                       std::span<const std::uint8_t> data);

}  // namespace wid::manifest

#include "wid/manifest/framing.h"

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace wid::manifest {

namespace {

using SaveResult = SynapseFile::SaveResult;
using DecodeResult = SynapseFile::DecodeResult;

SaveResult io_error(std::string message) {
  return SaveResult::err(ManifestError{ManifestErrorCode::kIo, std::move(message)});
}

}  // namespace

core::Result<std::vector<std::uint8_t>, ManifestError> read_file_bytes(
    const std::filesystem::path& path) {
  using BytesResult = core::Result<std::vector<std::uint8_t>, ManifestError>;

  // ifstream opens directories on some platforms and then reports a bogus size.
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return BytesResult::err(
        ManifestError{ManifestErrorCode::kIo, "Not a regular file: " + path.string()});
  }

  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return BytesResult::err(
        ManifestError{ManifestErrorCode::kIo, "Failed to open file: " + path.string()});
  }

  const auto size = file.tellg();
  if (size < 0) {
    return BytesResult::err(
        ManifestError{ManifestErrorCode::kIo, "Failed to size file: " + path.string()});
  }
  file.seekg(0, std::ios::beg);

  std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
  if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
    return BytesResult::err(
        ManifestError{ManifestErrorCode::kIo, "Failed to read file: " + path.string()});
  }
  return BytesResult::ok(std::move(data));
}

SaveResult write_file_bytes(const std::filesystem::path& path,
                            const std::span<const std::uint8_t> data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return io_error("Failed to open file for writing: " + path.string());
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file) {
    return io_error("Failed to write file: " + path.string());
  }
  return SaveResult::ok(true);
}

std::filesystem::path sidecar_path(const std::filesystem::path& path) {
  std::filesystem::path out = path;
  out += ".manifest.json";
  return out;
}

std::unique_ptr<IFramingStrategy> make_framing(const FramingMode mode) {
  if (mode == FramingMode::kSidecar) {
    return std::make_unique<SidecarFraming>();
  }
  return std::make_unique<EmbeddedFraming>();
}

// --- EmbeddedFraming ---

SaveResult EmbeddedFraming::write(const std::filesystem::path& path, SynapseFile& file) const {
  auto bytes = file.to_bytes();
  if (!bytes.has_value()) {
    return SaveResult::err(bytes.error());
  }
  return write_file_bytes(path, bytes.value());
}

bool EmbeddedFraming::detect(const std::filesystem::path& /*path*/,
                             const std::span<const std::uint8_t> data) const {
  if (data.size() < kManifestMagic.size()) {
    return false;
  }
  const std::string_view prefix(reinterpret_cast<const char*>(data.data()), kManifestMagic.size());
  return prefix == kManifestMagic;
}

DecodeResult EmbeddedFraming::read(const std::filesystem::path& /*path*/,
                                   std::vector<std::uint8_t> data) const {
  return SynapseFile::from_bytes(data);
}

// --- SidecarFraming ---

SaveResult SidecarFraming::write(const std::filesystem::path& path, SynapseFile& file) const {
  auto payload_written = write_file_bytes(path, file.payload());
  if (!payload_written.has_value()) {
    return payload_written;
  }

  std::string meta;
  try {
    meta = file.manifest().to_json().dump(2);
  } catch (const nlohmann::json::type_error& e) {
    return SaveResult::err(ManifestError{ManifestErrorCode::kInvalidJson,
                                         std::string("manifest is not valid UTF-8: ") + e.what()});
  }
  const auto* begin = reinterpret_cast<const std::uint8_t*>(meta.data());
  return write_file_bytes(sidecar_path(path), std::span<const std::uint8_t>(begin, meta.size()));
}

bool SidecarFraming::detect(const std::filesystem::path& path,
                            const std::span<const std::uint8_t> /*data*/) const {
  std::error_code ec;
  return std::filesystem::exists(sidecar_path(path), ec);
}

DecodeResult SidecarFraming::read(const std::filesystem::path& path,
                                  std::vector<std::uint8_t> data) const {
  auto meta_bytes = read_file_bytes(sidecar_path(path));
  if (!meta_bytes.has_value()) {
    return DecodeResult::err(meta_bytes.error());
  }
  const auto& raw = meta_bytes.value();
  const std::string_view text(reinterpret_cast<const char*>(raw.data()), raw.size());
  auto manifest = Manifest::parse(text);
  if (!manifest.has_value()) {
    return DecodeResult::err(manifest.error());
  }
  return DecodeResult::ok(SynapseFile(std::move(manifest.value()), std::move(data)));
}

}  // namespace wid::manifest

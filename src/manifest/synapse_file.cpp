#include "wid/manifest/synapse_file.h"

#include "wid/core/sha256.h"
#include "wid/manifest/framing.h"

#include <string>
#include <string_view>
#include <utility>

namespace wid::manifest {

namespace {

using DecodeResult = SynapseFile::DecodeResult;

DecodeResult decode_error(const ManifestErrorCode code, std::string message) {
  return DecodeResult::err(ManifestError{code, std::move(message)});
}

std::uint32_t read_be32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

}  // namespace

SynapseFile::SynapseFile(Manifest manifest, std::vector<std::uint8_t> payload)
    : manifest_(std::move(manifest)), payload_(std::move(payload)) {}

void SynapseFile::refresh_digest() {
  manifest_.data_size = payload_.size();
  manifest_.data_hash = core::sha256_hex(std::span<const std::uint8_t>(payload_));
}

SynapseFile::BytesResult SynapseFile::to_bytes() {
  refresh_digest();

  std::string meta;
  try {
    meta = manifest_.to_json().dump();
  } catch (const nlohmann::json::type_error& e) {
    return BytesResult::err(ManifestError{ManifestErrorCode::kInvalidJson,
                                          std::string("manifest is not valid UTF-8: ") + e.what()});
  }
  if (meta.size() > kMaxManifestSize) {
    return BytesResult::err(ManifestError{
        ManifestErrorCode::kManifestTooLarge,
        "Manifest too large: " + std::to_string(meta.size()) + " bytes"});
  }

  const auto meta_len = static_cast<std::uint32_t>(meta.size());
  std::vector<std::uint8_t> out;
  out.reserve(kHeaderSize + meta.size() + payload_.size());
  out.insert(out.end(), kManifestMagic.begin(), kManifestMagic.end());
  out.push_back(static_cast<std::uint8_t>(kManifestVersion >> 8));
  out.push_back(static_cast<std::uint8_t>(kManifestVersion & 0xFF));
  out.push_back(static_cast<std::uint8_t>((meta_len >> 24) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((meta_len >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((meta_len >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(meta_len & 0xFF));
  out.insert(out.end(), meta.begin(), meta.end());
  out.insert(out.end(), payload_.begin(), payload_.end());
  return BytesResult::ok(std::move(out));
}

DecodeResult SynapseFile::from_bytes(const std::span<const std::uint8_t> data) {
  if (data.size() < kHeaderSize) {
    return decode_error(ManifestErrorCode::kDataTooSmall, "Data too small for SYNAPSE file");
  }
  const std::string_view magic(reinterpret_cast<const char*>(data.data()), kManifestMagic.size());
  if (magic != kManifestMagic) {
    return decode_error(ManifestErrorCode::kInvalidMagic, "Invalid magic bytes");
  }
  // Bytes 4..5 carry the format version; decoding does not branch on it yet.
  const std::size_t meta_len = read_be32(data.data() + 6);
  if (meta_len > kMaxManifestSize) {
    return decode_error(ManifestErrorCode::kManifestTooLarge,
                        "Manifest too large: " + std::to_string(meta_len) + " bytes");
  }
  const std::size_t meta_end = kHeaderSize + meta_len;
  if (meta_end > data.size()) {
    return decode_error(ManifestErrorCode::kDataTooSmall, "Data too small for SYNAPSE file");
  }

  const std::string_view meta(reinterpret_cast<const char*>(data.data()) + kHeaderSize, meta_len);
  auto manifest = Manifest::parse(meta);
  if (!manifest.has_value()) {
    return DecodeResult::err(manifest.error());
  }
  std::vector<std::uint8_t> payload(data.begin() + static_cast<std::ptrdiff_t>(meta_end),
                                    data.end());
  return DecodeResult::ok(SynapseFile(std::move(manifest.value()), std::move(payload)));
}

SynapseFile::SaveResult SynapseFile::save(const std::filesystem::path& path,
                                          const FramingMode mode) {
  refresh_digest();
  return make_framing(mode)->write(path, *this);
}

DecodeResult SynapseFile::load(const std::filesystem::path& path) {
  auto bytes = read_file_bytes(path);
  if (!bytes.has_value()) {
    return DecodeResult::err(bytes.error());
  }
  std::vector<std::uint8_t> data = std::move(bytes.value());

  for (const FramingMode mode : {FramingMode::kEmbedded, FramingMode::kSidecar}) {
    const auto framing = make_framing(mode);
    if (framing->detect(path, data)) {
      return framing->read(path, std::move(data));
    }
  }

  // Bare payload: synthesize a manifest so pre-existing files load unchanged.
  Manifest manifest;
  manifest.id = path.stem().string();
  SynapseFile file(std::move(manifest), std::move(data));
  file.refresh_digest();
  return DecodeResult::ok(std::move(file));
}

bool SynapseFile::verify() const {
  return core::sha256_hex(std::span<const std::uint8_t>(payload_)) == manifest_.data_hash;
}

}  // namespace wid::manifest

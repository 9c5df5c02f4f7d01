#include "wid/manifest/manifest.h"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace wid::manifest {

namespace {

using ManifestResult = core::Result<Manifest, ManifestError>;

ManifestResult invalid_json(std::string message) {
  return ManifestResult::err(ManifestError{ManifestErrorCode::kInvalidJson, std::move(message)});
}

}  // namespace

std::string to_string(const DataType type) {
  switch (type) {
    case DataType::kUnknown:
      return "unknown";
    case DataType::kText:
      return "text/plain";
    case DataType::kJson:
      return "application/json";
    case DataType::kBinary:
      return "application/octet-stream";
  }
  return "unknown";
}

std::optional<DataType> parse_data_type(const std::string_view text) {
  if (text == "unknown") {
    return DataType::kUnknown;
  }
  if (text == "text/plain") {
    return DataType::kText;
  }
  if (text == "application/json") {
    return DataType::kJson;
  }
  if (text == "application/octet-stream") {
    return DataType::kBinary;
  }
  return std::nullopt;
}

nlohmann::json Manifest::to_json() const {
  nlohmann::json j;
  j["id"] = id;
  j["version"] = version;
  j["node"] = node;
  j["data_type"] = data_type;
  j["data_size"] = data_size;
  j["data_hash"] = data_hash;
  if (metadata.is_object() && !metadata.empty()) {
    j["metadata"] = metadata;
  }
  return j;
}

ManifestResult Manifest::from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return invalid_json("manifest must be a JSON object");
  }
  if (!j.contains("id") || !j["id"].is_string()) {
    return invalid_json("manifest is missing string field 'id'");
  }

  Manifest m;
  try {
    m.id = j["id"].get<std::string>();
    m.node = j.value("node", "");
    m.data_type = j.value("data_type", "");
    m.data_hash = j.value("data_hash", "");
  } catch (const nlohmann::json::exception& e) {
    return invalid_json(std::string("manifest field has the wrong type: ") + e.what());
  }

  // Numeric fields are range-checked rather than narrowed.
  if (j.contains("version")) {
    const auto& version = j["version"];
    if (!version.is_number_unsigned() ||
        version.get<std::uint64_t>() > std::numeric_limits<std::uint16_t>::max()) {
      return invalid_json("manifest 'version' must be an integer in 0..65535");
    }
    m.version = static_cast<std::uint16_t>(version.get<std::uint64_t>());
  }
  if (j.contains("data_size")) {
    const auto& size = j["data_size"];
    if (!size.is_number_unsigned()) {
      return invalid_json("manifest 'data_size' must be a non-negative integer");
    }
    m.data_size = size.get<std::uint64_t>();
  }

  if (j.contains("metadata")) {
    if (!j["metadata"].is_object()) {
      return invalid_json("manifest 'metadata' must be an object");
    }
    m.metadata = j["metadata"];
  }
  return ManifestResult::ok(std::move(m));
}

ManifestResult Manifest::parse(const std::string_view text) {
  // Invalid UTF-8 surfaces as a parse_error from the lexer.
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    return invalid_json(std::string("manifest JSON parse error: ") + e.what());
  }
  return from_json(j);
}

}  // namespace wid::manifest

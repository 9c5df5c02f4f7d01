#include "wid/manifest/framing.h"
#include "wid/manifest/synapse_file.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <vector>

using namespace wid;

namespace {

// Scratch directory removed when the test case ends.
struct TempDir {
  std::filesystem::path path;

  explicit TempDir(const std::string& name)
      : path(std::filesystem::temp_directory_path() / ("wid_test_" + name)) {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;
};

manifest::SynapseFile make_file(const std::string& payload) {
  manifest::Manifest m;
  m.id = "20250101T000000.0000Z-io";
  m.node = "io";
  m.data_type = manifest::to_string(manifest::DataType::kText);
  m.metadata["source"] = "unit-test";
  return {m, std::vector<std::uint8_t>(payload.begin(), payload.end())};
}

}  // namespace

TEST_CASE("sidecar_path appends the manifest suffix", "[manifest][io]") {
  CHECK(manifest::sidecar_path("data.bin").string() == "data.bin.manifest.json");
  CHECK(manifest::sidecar_path("README").string() == "README.manifest.json");
}

TEST_CASE("make_framing returns the requested layout", "[manifest][io]") {
  CHECK(manifest::make_framing(manifest::FramingMode::kEmbedded)->mode() ==
        manifest::FramingMode::kEmbedded);
  CHECK(manifest::make_framing(manifest::FramingMode::kSidecar)->mode() ==
        manifest::FramingMode::kSidecar);
}

TEST_CASE("SynapseFile save and load", "[manifest][io]") {
  const TempDir dir("synapse_io");

  SECTION("embedded layout is a single file") {
    const auto path = dir.path / "note.syn";
    auto file = make_file("embedded payload");
    REQUIRE(file.save(path).has_value());
    CHECK(std::filesystem::exists(path));
    CHECK_FALSE(std::filesystem::exists(manifest::sidecar_path(path)));

    auto loaded = manifest::SynapseFile::load(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value().manifest().id == "20250101T000000.0000Z-io");
    CHECK(loaded.value().manifest().metadata["source"] == "unit-test");
    CHECK(loaded.value().payload() == file.payload());
    CHECK(loaded.value().verify());
  }

  SECTION("sidecar layout keeps the payload file raw") {
    const auto path = dir.path / "data.bin";
    auto file = make_file("raw payload bytes");
    REQUIRE(file.save(path, manifest::FramingMode::kSidecar).has_value());
    REQUIRE(std::filesystem::exists(manifest::sidecar_path(path)));

    auto raw = manifest::read_file_bytes(path);
    REQUIRE(raw.has_value());
    const std::string contents(raw.value().begin(), raw.value().end());
    CHECK(contents == "raw payload bytes");

    auto loaded = manifest::SynapseFile::load(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value().manifest().node == "io");
    CHECK(loaded.value().manifest().data_size == contents.size());
    CHECK(loaded.value().verify());
  }

  SECTION("bare payload gets a synthesized manifest") {
    const auto path = dir.path / "plain.txt";
    const std::string text = "no manifest here";
    REQUIRE(manifest::write_file_bytes(
                path, std::span<const std::uint8_t>(
                          reinterpret_cast<const std::uint8_t*>(text.data()), text.size()))
                .has_value());

    auto loaded = manifest::SynapseFile::load(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value().manifest().id == "plain");
    CHECK(loaded.value().manifest().data_size == text.size());
    CHECK(loaded.value().verify());
  }

  SECTION("a modified sidecar payload fails verification") {
    const auto path = dir.path / "tamper.bin";
    auto file = make_file("original");
    REQUIRE(file.save(path, manifest::FramingMode::kSidecar).has_value());

    const std::string replaced = "Original";
    REQUIRE(manifest::write_file_bytes(
                path, std::span<const std::uint8_t>(
                          reinterpret_cast<const std::uint8_t*>(replaced.data()), replaced.size()))
                .has_value());

    auto loaded = manifest::SynapseFile::load(path);
    REQUIRE(loaded.has_value());
    CHECK_FALSE(loaded.value().verify());
  }

  SECTION("missing file reports an I/O error") {
    auto loaded = manifest::SynapseFile::load(dir.path / "absent.syn");
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == manifest::ManifestErrorCode::kIo);
  }

  SECTION("loading a directory reports an I/O error") {
    auto loaded = manifest::SynapseFile::load(dir.path);
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == manifest::ManifestErrorCode::kIo);

    auto raw = manifest::read_file_bytes(dir.path);
    REQUIRE_FALSE(raw.has_value());
    CHECK(raw.error().code == manifest::ManifestErrorCode::kIo);
  }

  SECTION("empty file loads as an empty bare payload") {
    const auto path = dir.path / "empty.bin";
    REQUIRE(manifest::write_file_bytes(path, {}).has_value());
    auto loaded = manifest::SynapseFile::load(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value().payload().empty());
    CHECK(loaded.value().verify());
  }

  SECTION("unwritable destination reports an I/O error") {
    auto file = make_file("x");
    auto saved = file.save(dir.path / "no_such_dir" / "out.syn");
    REQUIRE_FALSE(saved.has_value());
    CHECK(saved.error().code == manifest::ManifestErrorCode::kIo);
  }
}

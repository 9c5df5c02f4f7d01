#include "wid/core/sha256.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace wid;

TEST_CASE("sha256_hex matches FIPS 180-4 test vectors", "[sha256]") {
  SECTION("empty input") {
    CHECK(core::sha256_hex(std::string_view{}) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  }

  SECTION("abc") {
    CHECK(core::sha256_hex("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  }

  SECTION("two-block message") {
    CHECK(core::sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
          "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
  }
}

TEST_CASE("sha256 incremental updates equal one-shot hashing", "[sha256]") {
  const std::string text(1000, 'a');

  core::Sha256 hasher;
  for (std::size_t i = 0; i < text.size(); i += 37) {
    hasher.update(std::string_view(text).substr(i, 37));
  }
  CHECK(core::to_hex(hasher.finish()) == core::sha256_hex(text));
}

TEST_CASE("sha256_hex over bytes equals hashing the same text", "[sha256]") {
  const std::vector<std::uint8_t> bytes = {'H', 'e', 'l', 'l', 'o', '!'};
  CHECK(core::sha256_hex(std::span<const std::uint8_t>(bytes)) == core::sha256_hex("Hello!"));
  CHECK(core::sha256_hex("Hello!").size() == 64);
}

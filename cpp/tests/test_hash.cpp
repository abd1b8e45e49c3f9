#include "treehash/hash.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("Reference SHA-256 vectors") {
  using treehash::reference_sha256; using treehash::to_hex;
  REQUIRE(to_hex(reference_sha256("")) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  REQUIRE(to_hex(reference_sha256("abc")) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  REQUIRE(to_hex(reference_sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
          "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
  REQUIRE(to_hex(reference_sha256(std::string(1000, 'a'))) ==
          "41edece42d63e8d9bf515a9ba6932e1c20cbc9f5a5d134645adb5db1b9737ea3");
}

TEST_CASE("Hex round trip and rejection") {
  using treehash::from_hex; using treehash::to_hex;
  std::vector<std::uint8_t> bytes = {0x00, 0x7f, 0x80, 0xff};
  REQUIRE(to_hex(bytes.data(), bytes.size()) == "007f80ff");
  REQUIRE(from_hex("007F80ff") == bytes);
  REQUIRE(from_hex("").empty());
  REQUIRE_THROWS_AS(from_hex("abc"), std::invalid_argument);
  REQUIRE_THROWS_AS(from_hex("zz"), std::invalid_argument);
}

#include "treehash/compress.hpp"
#include "treehash/hash.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <vector>

TEST_CASE("One compression of a padded single block is standard SHA-256") {
  using namespace treehash;
  const std::string abc = "abc";
  auto blocks = pad_and_split(abc.data(), abc.size());
  REQUIRE(blocks.size() == 1);
  REQUIRE(to_hex(compress(blocks[0], STANDARD_IV)) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  auto empty = pad_and_split(nullptr, 0);
  REQUIRE(to_hex(compress(empty[0], STANDARD_IV)) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Round constant table matches SHA-256") {
  using treehash::ROUND_CONSTANTS;
  REQUIRE(ROUND_CONSTANTS.size() == 64);
  REQUIRE(ROUND_CONSTANTS.front() == 0x428a2f98u);
  REQUIRE(ROUND_CONSTANTS[32] == 0x27b70a85u);
  REQUIRE(ROUND_CONSTANTS.back() == 0xc67178f2u);
}

TEST_CASE("Checked compress rejects anything but 64 bytes") {
  using namespace treehash;
  std::vector<std::uint8_t> buf(65, 0);
  REQUIRE_THROWS_AS(compress(buf.data(), 63, STANDARD_IV), InvalidBlockSize);
  REQUIRE_THROWS_AS(compress(buf.data(), 65, STANDARD_IV), InvalidBlockSize);
  REQUIRE_THROWS_AS(compress(buf.data(), 32, STANDARD_IV), InvalidBlockSize);
  try {
    compress(buf.data(), 31, STANDARD_IV);
    FAIL("expected InvalidBlockSize");
  } catch (const InvalidBlockSize& e) {
    REQUIRE(e.size() == 31);
  }

  Block b{};
  REQUIRE(compress(buf.data(), 64, STANDARD_IV) == compress(b, STANDARD_IV));
}

TEST_CASE("combine_iv adds the XOR of the pair word-wise mod 2^32") {
  using namespace treehash;
  const ChainingValue left{1, 2, 3, 4, 5, 6, 7, 8};
  const ChainingValue right{0xffffffffu, 0xffffffffu, 0xffffffffu, 0xffffffffu,
                            0xffffffffu, 0xffffffffu, 0xffffffffu, 0xffffffffu};
  const ChainingValue expected{0x6a09e665u, 0xbb67ae82u, 0x3c6ef36eu, 0xa54ff535u,
                               0x510e5279u, 0x9b056885u, 0x1f83d9a3u, 0x5be0cd10u};
  REQUIRE(combine_iv(STANDARD_IV, left, right) == expected);
  REQUIRE(combine_iv(STANDARD_IV, left, right) == combine_iv(STANDARD_IV, right, left));

  // identical pair leaves the base untouched
  REQUIRE(combine_iv(STANDARD_IV, left, left) == STANDARD_IV);
}

TEST_CASE("Chaining values serialize big-endian") {
  using namespace treehash;
  const ChainingValue cv{0x01020304u, 0, 0, 0, 0, 0, 0, 0xa0b0c0d0u};
  std::uint8_t buf[32];
  store_chaining_value(buf, cv);
  REQUIRE(buf[0] == 0x01);
  REQUIRE(buf[3] == 0x04);
  REQUIRE(buf[28] == 0xa0);
  REQUIRE(buf[31] == 0xd0);
  REQUIRE(load_chaining_value(buf) == cv);
  REQUIRE(to_hex(cv).substr(0, 8) == "01020304");
}

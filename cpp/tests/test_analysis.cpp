#include "treehash/analysis.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <numeric>
#include <stdexcept>

namespace {
treehash::AnalysisConfig small_run() {
  treehash::AnalysisConfig cfg;
  cfg.samples = 200;
  cfg.min_length = 120;
  cfg.max_length = 300;
  cfg.buckets = 16;
  cfg.seed = 42;
  return cfg;
}
} // namespace

TEST_CASE("Avalanche: one changed byte flips about half the output bits") {
  auto res = treehash::analyze(small_run());
  REQUIRE(res.samples == 200);
  REQUIRE(res.avalanche_bits.size() == 200);
  REQUIRE(res.mean_avalanche > 118.0);
  REQUIRE(res.mean_avalanche < 138.0);
  REQUIRE(res.min_avalanche > 0);
  REQUIRE(res.max_avalanche <= 256);
  REQUIRE(res.collisions == 0);
}

TEST_CASE("Buckets account for every sample") {
  auto res = treehash::analyze(small_run());
  REQUIRE(res.buckets.size() == 16);
  REQUIRE(std::accumulate(res.buckets.begin(), res.buckets.end(), std::uint64_t{0}) == 200);
  REQUIRE(res.chi_square >= 0.0);
}

TEST_CASE("Same seed reproduces the run") {
  auto a = treehash::analyze(small_run());
  auto b = treehash::analyze(small_run());
  REQUIRE(a.avalanche_bits == b.avalanche_bits);
  REQUIRE(a.buckets == b.buckets);

  auto cfg = small_run();
  cfg.seed = 43;
  REQUIRE(treehash::analyze(cfg).avalanche_bits != a.avalanche_bits);
}

TEST_CASE("Progress callback fires on the stride and at the end") {
  auto cfg = small_run();
  cfg.samples = 25;
  cfg.progress_stride = 10;
  std::atomic<unsigned> hits{0};
  std::uint64_t last = 0;
  treehash::analyze(cfg, [&](std::uint64_t done, const treehash::Digest&) { ++hits; last = done; });
  REQUIRE(hits.load() == 3); // 10, 20, 25
  REQUIRE(last == 25);

  cfg.enable_progress = false;
  hits = 0;
  treehash::analyze(cfg, [&](std::uint64_t, const treehash::Digest&) { ++hits; });
  REQUIRE(hits.load() == 0);
}

TEST_CASE("Reject nonsensical configurations") {
  auto cfg = small_run();
  cfg.samples = 0;
  REQUIRE_THROWS_AS(treehash::analyze(cfg), std::invalid_argument);
  cfg = small_run();
  cfg.buckets = 0;
  REQUIRE_THROWS_AS(treehash::analyze(cfg), std::invalid_argument);
  cfg = small_run();
  cfg.min_length = 10;
  cfg.max_length = 5;
  REQUIRE_THROWS_AS(treehash::analyze(cfg), std::invalid_argument);
}

TEST_CASE("Digest integer helpers") {
  using treehash::Digest;
  Digest zero{}, ones{};
  ones.bytes.fill(0xff);
  REQUIRE(treehash::hamming_distance(zero, zero) == 0);
  REQUIRE(treehash::hamming_distance(zero, ones) == 256);

  Digest d{};
  d.bytes[0] = 0x80;
  d.bytes[31] = 0x41;
  REQUIRE(treehash::digest_mod(d, 64) == 1);
  REQUIRE(treehash::digest_mod(d, 1) == 0);
  REQUIRE_THROWS_AS(treehash::digest_mod(d, 0), std::invalid_argument);
}

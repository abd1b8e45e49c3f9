// include/treehash/analysis.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <vector>
#include "treehash.hpp"

namespace treehash {

// Knobs for the empirical collision / avalanche / uniformity run.
struct AnalysisConfig {
  std::uint64_t samples = 1000;
  std::uint32_t min_length = 120;     // random string length, inclusive
  std::uint32_t max_length = 1300;
  std::uint32_t buckets = 64;         // digest mod buckets
  std::uint64_t seed = 0x5eed;
  TreeConfig tree{STANDARD_IV, 1};    // per-digest config; inline by default
  bool enable_progress = true;        // allow callbacks
  std::uint64_t progress_stride = 0;  // 0 = auto (~1% of samples)
};

struct AnalysisResult {
  std::uint64_t samples = 0;
  std::uint64_t collisions = 0;
  std::vector<std::uint64_t> buckets;
  std::vector<std::uint32_t> avalanche_bits; // one entry per sample, 0..256
  double mean_avalanche = 0.0;
  std::uint32_t min_avalanche = 0;
  std::uint32_t max_avalanche = 0;
  double chi_square = 0.0;            // over buckets, df = buckets - 1
};

// Progress callback: samples completed so far and the latest digest.
using ProgressCb = std::function<void(std::uint64_t, const Digest&)>;

// Throws std::invalid_argument for samples == 0, buckets == 0 or
// min_length > max_length.
AnalysisResult analyze(const AnalysisConfig& cfg, ProgressCb cb = {});

// Number of differing bits between two digests.
std::uint32_t hamming_distance(const Digest& a, const Digest& b);

// Digest read as a 256-bit big-endian integer, reduced mod `modulus` (> 0).
std::uint32_t digest_mod(const Digest& d, std::uint32_t modulus);

} // namespace treehash

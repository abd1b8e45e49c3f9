// src/analysis.cpp
#include "treehash/analysis.hpp"
#include "treehash/hash.hpp"

#include <algorithm> // std::max, std::min
#include <cstdint>
#include <gmp.h>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace treehash {
namespace {

const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

// Owns an mpz_t holding a digest as a 256-bit big-endian integer.
class DigestInt {
public:
  explicit DigestInt(const Digest &d) {
    mpz_init2(v_, 256);
    mpz_import(v_, d.bytes.size(), 1, 1, 1, 0, d.bytes.data());
  }
  ~DigestInt() { mpz_clear(v_); }
  DigestInt(const DigestInt &) = delete;
  DigestInt &operator=(const DigestInt &) = delete;

  mpz_srcptr get() const { return v_; }

private:
  mpz_t v_;
};

std::string random_string(std::mt19937_64 &rng, std::uint32_t min_len,
                          std::uint32_t max_len) {
  std::uniform_int_distribution<std::uint32_t> len_dist(min_len, max_len);
  std::uniform_int_distribution<std::size_t> ch_dist(0, sizeof(kAlphabet) - 2);
  std::string s(len_dist(rng), '\0');
  for (auto &c : s)
    c = kAlphabet[ch_dist(rng)];
  return s;
}

} // namespace

std::uint32_t hamming_distance(const Digest &a, const Digest &b) {
  DigestInt x(a), y(b);
  return static_cast<std::uint32_t>(mpz_hamdist(x.get(), y.get()));
}

std::uint32_t digest_mod(const Digest &d, std::uint32_t modulus) {
  if (modulus == 0)
    throw std::invalid_argument("modulus must be > 0");
  DigestInt x(d);
  return static_cast<std::uint32_t>(mpz_fdiv_ui(x.get(), modulus));
}

AnalysisResult analyze(const AnalysisConfig &cfg, ProgressCb cb) {
  if (cfg.samples == 0)
    throw std::invalid_argument("samples must be > 0");
  if (cfg.buckets == 0)
    throw std::invalid_argument("buckets must be > 0");
  if (cfg.min_length > cfg.max_length)
    throw std::invalid_argument("min_length must be <= max_length");

  const std::uint64_t stride = (cfg.progress_stride != 0)
                                   ? cfg.progress_stride
                                   : std::max<std::uint64_t>(1, cfg.samples / 100);

  AnalysisResult out;
  out.samples = cfg.samples;
  out.buckets.assign(cfg.buckets, 0);
  out.avalanche_bits.reserve(cfg.samples);

  std::mt19937_64 rng(cfg.seed);
  std::unordered_set<std::string> seen;
  seen.reserve(cfg.samples);

  std::uint64_t bit_sum = 0;
  out.min_avalanche = 256;
  for (std::uint64_t i = 0; i < cfg.samples; ++i) {
    std::string s = random_string(rng, cfg.min_length, cfg.max_length);
    const Digest base = digest(s, cfg.tree);

    if (!seen.insert(to_hex(base)).second)
      ++out.collisions;

    ++out.buckets[digest_mod(base, cfg.buckets)];

    // single-character change; empty strings are left as they are
    if (!s.empty())
      s[0] = static_cast<char>((static_cast<unsigned char>(s[0]) + 1) % 128);
    const std::uint32_t diff = hamming_distance(base, digest(s, cfg.tree));
    out.avalanche_bits.push_back(diff);
    bit_sum += diff;
    out.min_avalanche = std::min(out.min_avalanche, diff);
    out.max_avalanche = std::max(out.max_avalanche, diff);

    if (cb && cfg.enable_progress && ((i + 1) % stride == 0 || i + 1 == cfg.samples))
      cb(i + 1, base);
  }

  out.mean_avalanche = static_cast<double>(bit_sum) / static_cast<double>(cfg.samples);

  const double expected =
      static_cast<double>(cfg.samples) / static_cast<double>(cfg.buckets);
  for (std::uint64_t count : out.buckets) {
    const double delta = static_cast<double>(count) - expected;
    out.chi_square += delta * delta / expected;
  }
  return out;
}

} // namespace treehash

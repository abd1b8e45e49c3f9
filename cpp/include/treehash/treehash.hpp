// include/treehash/treehash.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace treehash {

// Bump when the trace contract changes (handy for logging/UI).
inline constexpr const char* TREEHASH_VERSION = "0.2.0";

using Word = std::uint32_t;

// 256-bit chaining value; big-endian when serialized.
using ChainingValue = std::array<Word, 8>;

// 512-bit compression input.
using Block = std::array<std::uint8_t, 64>;

// Final 256-bit output, big-endian bytes.
struct Digest {
  std::array<std::uint8_t, 32> bytes{};
};

inline bool operator==(const Digest& a, const Digest& b) { return a.bytes == b.bytes; }
inline bool operator!=(const Digest& a, const Digest& b) { return !(a == b); }

// FIPS 180-4 initial hash value H(0).
inline constexpr ChainingValue STANDARD_IV = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

// A block handed to the compression engine was not 64 bytes.
class InvalidBlockSize : public std::invalid_argument {
public:
  explicit InvalidBlockSize(std::size_t got);
  std::size_t size() const noexcept { return size_; }

private:
  std::size_t size_;
};

// A regrouped reduction block was neither 64 nor 32 bytes (controller bug).
class MalformedReductionBlock : public std::logic_error {
public:
  explicit MalformedReductionBlock(std::size_t got);
  std::size_t size() const noexcept { return size_; }

private:
  std::size_t size_;
};

struct TreeConfig {
  ChainingValue iv = STANDARD_IV;
  std::uint32_t threads = 0; // 0 = auto (hardware concurrency), 1 = inline
};

// One pass of pairing, IV derivation and recompression. All values hex.
struct ReductionRound {
  std::uint32_t round = 0;
  std::vector<std::string> input_hash_outputs;
  std::string computed_new_iv;
  std::vector<std::string> new_blocks;  // 128 hex chars per pair, 64 per carry
  std::vector<std::string> output_hash_outputs;
};

struct Trace {
  std::string original_message; // UTF-8, invalid sequences replaced by U+FFFD
  std::string padded;
  std::vector<std::string> blocks;
  std::vector<std::string> initial_hash_outputs;
  std::vector<ReductionRound> rounds;
  std::string final_digest;
};

struct DigestTrace {
  Digest digest;
  Trace trace;
};

// Observer fired after each reduction round has been recorded.
using RoundCb = std::function<void(const ReductionRound&)>;

Digest digest(const void* data, std::size_t nbytes, const TreeConfig& cfg = {});
Digest digest(const std::string& s, const TreeConfig& cfg = {});
Digest digest(const std::vector<std::uint8_t>& v, const TreeConfig& cfg = {});

// Same digest as digest(), plus a full record of every stage.
DigestTrace digest_with_trace(const void* data, std::size_t nbytes,
                              const TreeConfig& cfg = {}, RoundCb cb = {});
DigestTrace digest_with_trace(const std::string& s, const TreeConfig& cfg = {},
                              RoundCb cb = {});
DigestTrace digest_with_trace(const std::vector<std::uint8_t>& v,
                              const TreeConfig& cfg = {}, RoundCb cb = {});

} // namespace treehash

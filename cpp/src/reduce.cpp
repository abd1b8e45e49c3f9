// src/reduce.cpp
#include "treehash/reduce.hpp"
#include "treehash/compress.hpp"

#include <algorithm> // std::min
#include <cstdint>
#include <exception>
#include <string>
#include <thread>
#include <vector>

namespace treehash {
namespace {

// Fan-out/fan-in over [0, n): worker w handles i = w, w + workers, ...
// and writes out[i], so the result is in input order regardless of which
// worker finishes first. The pool lives only for this batch.
template <typename Fn>
std::vector<ChainingValue> run_batch(std::size_t n, std::uint32_t threads, Fn fn) {
  std::vector<ChainingValue> out(n);
  const std::size_t workers =
      std::min<std::size_t>(effective_threads(threads), n);

  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i)
      out[i] = fn(i);
    return out;
  }

  std::vector<std::exception_ptr> errors(workers);
  std::vector<std::thread> pool;
  pool.reserve(workers);
  try {
    for (std::size_t w = 0; w < workers; ++w) {
      pool.emplace_back([&, w] {
        try {
          for (std::size_t i = w; i < n; i += workers)
            out[i] = fn(i);
        } catch (...) {
          errors[w] = std::current_exception();
        }
      });
    }
  } catch (...) {
    // thread creation failed: drain what was started, then report
    for (auto &t : pool)
      t.join();
    throw;
  }
  for (auto &t : pool)
    t.join();

  for (const auto &e : errors)
    if (e)
      std::rethrow_exception(e);
  return out;
}

} // namespace

MalformedReductionBlock::MalformedReductionBlock(std::size_t got)
    : std::logic_error("reduction block must be 64 or 32 bytes, got " +
                       std::to_string(got)),
      size_(got) {}

std::uint32_t effective_threads(std::uint32_t requested) noexcept {
  if (requested != 0)
    return requested;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw ? hw : 1u;
}

std::vector<ChainingValue> compress_all(const std::vector<Block> &blocks,
                                        const ChainingValue &iv,
                                        std::uint32_t threads) {
  return run_batch(blocks.size(), threads,
                   [&](std::size_t i) { return compress(blocks[i], iv); });
}

std::vector<ReductionBlock> regroup(const std::vector<ChainingValue> &current) {
  std::vector<ReductionBlock> out;
  out.reserve((current.size() + 1) / 2);
  std::size_t i = 0;
  for (; i + 1 < current.size(); i += 2) {
    ReductionBlock pair(64);
    store_chaining_value(pair.data(), current[i]);
    store_chaining_value(pair.data() + 32, current[i + 1]);
    out.push_back(std::move(pair));
  }
  if (i < current.size()) {
    ReductionBlock carry(32);
    store_chaining_value(carry.data(), current[i]);
    out.push_back(std::move(carry));
  }
  return out;
}

std::vector<ChainingValue>
compress_regrouped(const std::vector<ReductionBlock> &blocks,
                   const ChainingValue &iv, std::uint32_t threads) {
  // Validate up front so a bad block never reaches a worker half-way through.
  for (const auto &b : blocks)
    if (b.size() != 64 && b.size() != 32)
      throw MalformedReductionBlock(b.size());

  return run_batch(blocks.size(), threads, [&](std::size_t i) {
    const ReductionBlock &b = blocks[i];
    if (b.size() == 32)
      return load_chaining_value(b.data()); // carry: passthrough, not recompressed
    return compress(b.data(), b.size(), iv);
  });
}

} // namespace treehash

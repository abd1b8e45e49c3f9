// src/tree_core.cpp
#include "treehash/compress.hpp"
#include "treehash/hash.hpp"
#include "treehash/reduce.hpp"
#include "treehash/treehash.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace treehash {
namespace {

std::vector<std::string> hex_all(const std::vector<ChainingValue> &cvs) {
  std::vector<std::string> out;
  out.reserve(cvs.size());
  for (const auto &cv : cvs)
    out.push_back(to_hex(cv));
  return out;
}

std::vector<std::string> hex_all(const std::vector<ReductionBlock> &blocks) {
  std::vector<std::string> out;
  out.reserve(blocks.size());
  for (const auto &b : blocks)
    out.push_back(to_hex(b.data(), b.size()));
  return out;
}

// Stage1 -> Reducing* -> Done. When `trace` is null nothing is recorded and
// the computation is otherwise identical.
ChainingValue reduce_tree(const std::vector<Block> &blocks, const TreeConfig &cfg,
                          Trace *trace, const RoundCb &cb) {
  std::vector<ChainingValue> current = compress_all(blocks, cfg.iv, cfg.threads);
  if (trace)
    trace->initial_hash_outputs = hex_all(current);

  ChainingValue iv = cfg.iv;
  std::uint32_t round = 0;
  while (current.size() > 1) {
    // One IV per round, from the first pair only; later pairs reuse it.
    const ChainingValue new_iv = combine_iv(iv, current[0], current[1]);
    const std::vector<ReductionBlock> regrouped = regroup(current);
    std::vector<ChainingValue> next =
        compress_regrouped(regrouped, new_iv, cfg.threads);

#if defined(TREEHASH_ENABLE_DEBUG_INVARIANTS) || !defined(NDEBUG)
    if (next.size() != (current.size() + 1) / 2)
      throw std::logic_error("reduction invariant violated: round output count");
#endif

    if (trace) {
      ReductionRound r;
      r.round = round;
      r.input_hash_outputs = hex_all(current);
      r.computed_new_iv = to_hex(new_iv);
      r.new_blocks = hex_all(regrouped);
      r.output_hash_outputs = hex_all(next);
      trace->rounds.push_back(std::move(r));
      if (cb)
        cb(trace->rounds.back());
    }

    current = std::move(next);
    iv = new_iv;
    ++round;
  }

  if (current.size() != 1)
    throw std::logic_error("reduction invariant violated: no surviving value");
  return current.front();
}

} // namespace

Digest digest(const void *data, std::size_t nbytes, const TreeConfig &cfg) {
  return to_digest(reduce_tree(pad_and_split(data, nbytes), cfg, nullptr, {}));
}

Digest digest(const std::string &s, const TreeConfig &cfg) {
  return digest(s.data(), s.size(), cfg);
}

Digest digest(const std::vector<std::uint8_t> &v, const TreeConfig &cfg) {
  return digest(v.data(), v.size(), cfg);
}

DigestTrace digest_with_trace(const void *data, std::size_t nbytes,
                              const TreeConfig &cfg, RoundCb cb) {
  DigestTrace out;
  Trace &t = out.trace;
  t.original_message = sanitize_utf8(data, nbytes);

  const std::vector<std::uint8_t> padded = pad(data, nbytes);
  t.padded = to_hex(padded.data(), padded.size());
  const std::vector<Block> blocks = split_blocks(padded);
  t.blocks.reserve(blocks.size());
  for (const auto &b : blocks)
    t.blocks.push_back(to_hex(b.data(), b.size()));

  out.digest = to_digest(reduce_tree(blocks, cfg, &t, cb));
  t.final_digest = to_hex(out.digest);
  return out;
}

DigestTrace digest_with_trace(const std::string &s, const TreeConfig &cfg,
                              RoundCb cb) {
  return digest_with_trace(s.data(), s.size(), cfg, std::move(cb));
}

DigestTrace digest_with_trace(const std::vector<std::uint8_t> &v,
                              const TreeConfig &cfg, RoundCb cb) {
  return digest_with_trace(v.data(), v.size(), cfg, std::move(cb));
}

} // namespace treehash

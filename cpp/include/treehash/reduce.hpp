// include/treehash/reduce.hpp
#pragma once
#include <cstdint>
#include <vector>
#include "treehash.hpp"

namespace treehash {

// Regrouped reduction input: 64 bytes for a pair, 32 bytes for a carry.
using ReductionBlock = std::vector<std::uint8_t>;

// Resolve a thread count (0 = auto) to a concrete worker count >= 1.
std::uint32_t effective_threads(std::uint32_t requested) noexcept;

// Stage 1: compress every block with `iv`. Output order matches input order.
std::vector<ChainingValue> compress_all(const std::vector<Block>& blocks,
                                        const ChainingValue& iv,
                                        std::uint32_t threads);

// Pair (0,1), (2,3), ... into 64-byte blocks; an odd tail becomes a 32-byte carry.
std::vector<ReductionBlock> regroup(const std::vector<ChainingValue>& current);

// Compress each 64-byte block with `iv`; pass 32-byte carries through as-is.
// Throws MalformedReductionBlock for any other length.
std::vector<ChainingValue> compress_regrouped(const std::vector<ReductionBlock>& blocks,
                                              const ChainingValue& iv,
                                              std::uint32_t threads);

} // namespace treehash

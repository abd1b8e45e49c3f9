// include/treehash/compress.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "treehash.hpp"

namespace treehash {

// SHA-256 round constants (cube roots of the first 64 primes).
extern const std::array<Word, 64> ROUND_CONSTANTS;

// Standard SHA-256 padding: 0x80, zeros up to 56 mod 64, then the 64-bit
// big-endian bit length (taken mod 2^64). Result size is a positive multiple of 64.
std::vector<std::uint8_t> pad(const void* data, std::size_t nbytes);

std::vector<Block> split_blocks(const std::vector<std::uint8_t>& padded);
std::vector<Block> pad_and_split(const void* data, std::size_t nbytes);

// One 64-round SHA-256 compression of `block` starting from `cv`.
ChainingValue compress(const Block& block, const ChainingValue& cv) noexcept;

// Checked overload for raw spans. Throws InvalidBlockSize unless nbytes == 64.
ChainingValue compress(const std::uint8_t* block, std::size_t nbytes,
                       const ChainingValue& cv);

// word i = base[i] + (left[i] ^ right[i])  (mod 2^32)
ChainingValue combine_iv(const ChainingValue& base, const ChainingValue& left,
                         const ChainingValue& right) noexcept;

void store_chaining_value(std::uint8_t* out, const ChainingValue& cv) noexcept;
ChainingValue load_chaining_value(const std::uint8_t* in) noexcept;
Digest to_digest(const ChainingValue& cv) noexcept;

} // namespace treehash

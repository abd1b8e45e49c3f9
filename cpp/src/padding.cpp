// src/padding.cpp
#include "treehash/compress.hpp"
#include <cstdint>
#include <cstring>
#include <vector>

namespace treehash {

std::vector<std::uint8_t> pad(const void *data, std::size_t nbytes) {
  const std::size_t rem = (nbytes + 1) % 64;
  const std::size_t zeros = rem <= 56 ? 56 - rem : 120 - rem;

  std::vector<std::uint8_t> out;
  out.reserve(nbytes + 1 + zeros + 8);
  const auto *in = static_cast<const std::uint8_t *>(data);
  if (nbytes)
    out.insert(out.end(), in, in + nbytes);
  out.push_back(0x80);
  out.insert(out.end(), zeros, 0x00);

  // length in bits (big-endian), wraps mod 2^64
  const std::uint64_t bits = static_cast<std::uint64_t>(nbytes) * 8;
  for (int i = 7; i >= 0; --i)
    out.push_back(static_cast<std::uint8_t>(bits >> (8 * i)));
  return out;
}

std::vector<Block> split_blocks(const std::vector<std::uint8_t> &padded) {
  std::vector<Block> blocks(padded.size() / 64);
  for (std::size_t i = 0; i < blocks.size(); ++i)
    std::memcpy(blocks[i].data(), padded.data() + 64 * i, 64);
  return blocks;
}

std::vector<Block> pad_and_split(const void *data, std::size_t nbytes) {
  return split_blocks(pad(data, nbytes));
}

} // namespace treehash

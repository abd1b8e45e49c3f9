// src/compress.cpp
#include "treehash/compress.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace treehash {

const std::array<Word, 64> ROUND_CONSTANTS = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu,
    0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u, 0xd807aa98u, 0x12835b01u,
    0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u,
    0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu,
    0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u,
    0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u,
    0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u,
    0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u, 0x1e376c08u,
    0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu,
    0x682e6ff3u, 0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
    0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

namespace {

inline constexpr Word rotr(Word x, int n) { return (x >> n) | (x << (32 - n)); }

inline Word load_be32(const std::uint8_t *p) {
  return (Word)p[0] << 24 | (Word)p[1] << 16 | (Word)p[2] << 8 | (Word)p[3];
}
inline void store_be32(std::uint8_t *p, Word v) {
  p[0] = (std::uint8_t)(v >> 24);
  p[1] = (std::uint8_t)(v >> 16);
  p[2] = (std::uint8_t)(v >> 8);
  p[3] = (std::uint8_t)(v);
}

inline Word small_sigma0(Word x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline Word small_sigma1(Word x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }
inline Word big_sigma0(Word x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline Word big_sigma1(Word x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline Word ch(Word e, Word f, Word g) { return (e & f) ^ (~e & g); }
inline Word maj(Word a, Word b, Word c) { return (a & b) ^ (a & c) ^ (b & c); }

ChainingValue compress_raw(const std::uint8_t *block, const ChainingValue &cv) {
  Word w[64];
  for (int i = 0; i < 16; ++i)
    w[i] = load_be32(block + 4 * i);
  for (int i = 16; i < 64; ++i)
    w[i] = w[i - 16] + small_sigma0(w[i - 15]) + w[i - 7] + small_sigma1(w[i - 2]);

  Word a = cv[0], b = cv[1], c = cv[2], d = cv[3], e = cv[4], f = cv[5],
       g = cv[6], h = cv[7];
  for (int i = 0; i < 64; ++i) {
    Word t1 = h + big_sigma1(e) + ch(e, f, g) + ROUND_CONSTANTS[i] + w[i];
    Word t2 = big_sigma0(a) + maj(a, b, c);
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }

  return {cv[0] + a, cv[1] + b, cv[2] + c, cv[3] + d,
          cv[4] + e, cv[5] + f, cv[6] + g, cv[7] + h};
}

} // namespace

InvalidBlockSize::InvalidBlockSize(std::size_t got)
    : std::invalid_argument("compression block must be 64 bytes, got " +
                            std::to_string(got)),
      size_(got) {}

ChainingValue compress(const Block &block, const ChainingValue &cv) noexcept {
  return compress_raw(block.data(), cv);
}

ChainingValue compress(const std::uint8_t *block, std::size_t nbytes,
                       const ChainingValue &cv) {
  if (nbytes != 64 || block == nullptr)
    throw InvalidBlockSize(nbytes);
  return compress_raw(block, cv);
}

ChainingValue combine_iv(const ChainingValue &base, const ChainingValue &left,
                         const ChainingValue &right) noexcept {
  ChainingValue out{};
  for (std::size_t i = 0; i < out.size(); ++i)
    out[i] = base[i] + (left[i] ^ right[i]);
  return out;
}

void store_chaining_value(std::uint8_t *out, const ChainingValue &cv) noexcept {
  for (int i = 0; i < 8; ++i)
    store_be32(out + 4 * i, cv[i]);
}

ChainingValue load_chaining_value(const std::uint8_t *in) noexcept {
  ChainingValue cv{};
  for (int i = 0; i < 8; ++i)
    cv[i] = load_be32(in + 4 * i);
  return cv;
}

Digest to_digest(const ChainingValue &cv) noexcept {
  Digest d{};
  store_chaining_value(d.bytes.data(), cv);
  return d;
}

} // namespace treehash

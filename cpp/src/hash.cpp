// src/hash.cpp
#include "treehash/hash.hpp"
#include "treehash/compress.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace treehash {
namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

const char *const kReplacement = "\xEF\xBF\xBD"; // U+FFFD

} // namespace

Digest reference_sha256(const void *data, std::size_t nbytes) {
  // Plain Merkle-Damgard chaining: each block feeds the next.
  ChainingValue h = STANDARD_IV;
  for (const Block &b : pad_and_split(data, nbytes))
    h = compress(b, h);
  return to_digest(h);
}

Digest reference_sha256(const std::string &s) {
  return reference_sha256(s.data(), s.size());
}

Digest reference_sha256(const std::vector<std::uint8_t> &v) {
  return reference_sha256(v.data(), v.size());
}

std::string to_hex(const std::uint8_t *data, std::size_t nbytes) {
  static const char *hex = "0123456789abcdef";
  std::string out;
  out.resize(nbytes * 2);
  for (std::size_t i = 0; i < nbytes; ++i) {
    out[2 * i] = hex[(data[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[data[i] & 0xF];
  }
  return out;
}

std::string to_hex(const Digest &d) { return to_hex(d.bytes.data(), d.bytes.size()); }

std::string to_hex(const ChainingValue &cv) { return to_hex(to_digest(cv)); }

std::vector<std::uint8_t> from_hex(const std::string &hex) {
  if (hex.size() % 2 != 0)
    throw std::invalid_argument("hex string has odd length");
  std::vector<std::uint8_t> out(hex.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = hex_value(hex[2 * i]);
    const int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      throw std::invalid_argument("invalid hex digit at offset " +
                                  std::to_string(hi < 0 ? 2 * i : 2 * i + 1));
    out[i] = static_cast<std::uint8_t>(hi << 4 | lo);
  }
  return out;
}

std::string sanitize_utf8(const void *data, std::size_t nbytes) {
  const auto *in = static_cast<const std::uint8_t *>(data);
  std::string out;
  out.reserve(nbytes);

  std::size_t i = 0;
  while (i < nbytes) {
    const std::uint8_t b = in[i];
    if (b < 0x80) {
      out.push_back(static_cast<char>(b));
      ++i;
      continue;
    }

    // continuation count and the allowed range of the first continuation
    std::size_t need = 0;
    std::uint8_t lo = 0x80, hi = 0xBF;
    if (b >= 0xC2 && b <= 0xDF) {
      need = 1;
    } else if (b >= 0xE0 && b <= 0xEF) {
      need = 2;
      if (b == 0xE0)
        lo = 0xA0; // overlong
      else if (b == 0xED)
        hi = 0x9F; // surrogates
    } else if (b >= 0xF0 && b <= 0xF4) {
      need = 3;
      if (b == 0xF0)
        lo = 0x90;
      else if (b == 0xF4)
        hi = 0x8F; // > U+10FFFF
    } else {
      out += kReplacement;
      ++i;
      continue;
    }

    // Replace the maximal invalid subpart with a single U+FFFD.
    std::size_t k = 1;
    for (; k <= need && i + k < nbytes; ++k) {
      const std::uint8_t c = in[i + k];
      const std::uint8_t min = k == 1 ? lo : 0x80;
      const std::uint8_t max = k == 1 ? hi : 0xBF;
      if (c < min || c > max)
        break;
    }
    if (k == need + 1)
      out.append(reinterpret_cast<const char *>(in + i), k);
    else
      out += kReplacement;
    i += k;
  }
  return out;
}

} // namespace treehash

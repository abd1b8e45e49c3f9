// include/treehash/hash.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "treehash.hpp"

namespace treehash {

// Canonical sequential SHA-256 over the same padder and compression function.
// Used for the "normalHash" comparison value; callers don't depend on details.
Digest reference_sha256(const void* data, std::size_t nbytes);

// Convenience overloads for tests/logging.
Digest reference_sha256(const std::string& s);
Digest reference_sha256(const std::vector<std::uint8_t>& v);

// Hex encoding for logs, traces and debugging.
std::string to_hex(const Digest& d);
std::string to_hex(const ChainingValue& cv);
std::string to_hex(const std::uint8_t* data, std::size_t nbytes);

// Inverse of to_hex for raw bytes; throws std::invalid_argument on bad input.
std::vector<std::uint8_t> from_hex(const std::string& hex);

// Lossy UTF-8 decode: every invalid sequence becomes U+FFFD.
std::string sanitize_utf8(const void* data, std::size_t nbytes);

} // namespace treehash

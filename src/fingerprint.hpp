#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>

constexpr std::size_t kDigestLength = 32; // SHA-256

using Digest = std::array<unsigned char, kDigestLength>;

std::string digest_hex(const Digest& digest);

struct DigestHash {
  std::size_t operator()(const Digest& digest) const {
    // Leading machine word of the digest.
    std::size_t value = 0;
    std::memcpy(&value, digest.data(), sizeof(value));
    return value;
  }
};

struct FingerprintEntry {
  std::string identifier;
  Digest digest{};
  uint64_t size = 0;
};

// Ordered by identifier so that every walk over an index, and everything
// derived from one, comes out in the same order on every run.
using FingerprintIndex = std::map<std::string, FingerprintEntry>;

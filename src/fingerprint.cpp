#include "fingerprint.hpp"

#include "utils.hpp"

std::string digest_hex(const Digest& digest) {
  return hex_from_bytes(digest.data(), digest.size());
}

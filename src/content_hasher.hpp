#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

#include "byte_source.hpp"
#include "cancel_token.hpp"
#include "fingerprint.hpp"
#include "progress.hpp"

struct HashResult {
  Digest digest{};
  uint64_t bytes = 0;
};

// Chunked SHA-256. One instance is shared by every hashing worker of a run;
// hash() keeps its state on the stack so concurrent calls are fine.
class ContentHasher {
public:
  static constexpr std::size_t kDefaultChunkSize = 8192;

  explicit ContentHasher(std::size_t chunk_size = kDefaultChunkSize,
                         ProgressState* progress = nullptr,
                         const CancelToken* cancel = nullptr);

  HashResult hash(ByteSource& source) const;
  HashResult hash_file(const std::filesystem::path& path) const;
  HashResult hash_bytes(std::string_view data) const;

  std::size_t chunk_size() const { return chunk_size_; }
  ProgressState* progress() const { return progress_; }
  const CancelToken* cancel_token() const { return cancel_; }

private:
  std::size_t chunk_size_;
  ProgressState* progress_;
  const CancelToken* cancel_;
};

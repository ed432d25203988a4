#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "content_hasher.hpp"
#include "fingerprint.hpp"
#include "log.hpp"

struct TreeListing {
  std::filesystem::path root;
  std::vector<std::filesystem::path> files;
  uint64_t total_bytes = 0;
};

// Fingerprints every regular file below a directory. Directory symlinks are
// followed; each real directory is entered at most once.
class TreeFingerprinter {
public:
  struct Options {
    std::size_t max_workers = 0;  // 0 = hardware concurrency
    std::size_t max_pending = 0;  // queued hashing tasks, 0 = 4 x workers
  };

  TreeFingerprinter(const ContentHasher& hasher,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);

  // The sizing pass. Files whose size cannot be read are logged and left out.
  // Throws OperationCancelled once the hasher's token is set.
  TreeListing list(const std::filesystem::path& root) const;

  FingerprintIndex scan(const TreeListing& listing) const;
  FingerprintIndex scan(const std::filesystem::path& root) const;

  std::size_t worker_count() const;
  std::size_t pending_limit() const;

private:
  const ContentHasher& hasher_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};

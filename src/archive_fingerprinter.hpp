#pragma once

#include <filesystem>
#include <memory>

#include "archive_reader.hpp"
#include "content_hasher.hpp"
#include "fingerprint.hpp"
#include "log.hpp"

// Hashes archive entries one at a time; directory entries are not indexed.
// A symbolic link entry is hashed over its stored target path, and a name
// listed more than once is indexed from its last copy. Any ArchiveError
// aborts the scan.
class ArchiveFingerprinter {
public:
  ArchiveFingerprinter(const ContentHasher& hasher,
                       ArchiveReader::Options options = {},
                       std::shared_ptr<Logger> logger = nullptr);

  FingerprintIndex scan(const std::filesystem::path& archive_path) const;

private:
  const ContentHasher& hasher_;
  ArchiveReader::Options options_;
  std::shared_ptr<Logger> logger_;
};

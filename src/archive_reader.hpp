#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "byte_source.hpp"
#include "cancel_token.hpp"

struct archive;

// A structural problem with the archive container itself: unreadable
// central directory, bad entry header, corrupt entry data.
class ArchiveError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ArchiveEntryInfo {
  std::string name;
  uint64_t size = 0;
  bool size_known = false;
  bool is_directory = false;
  // Symbolic link entries read back as their target path, the bytes the
  // archive stores for them.
  bool is_symlink = false;
  std::string link_target;
};

// Forward-only reader over the entries of an archive file (libarchive).
// The handle is read-only; independent readers may be opened on the same
// file at the same time.
class ArchiveReader {
public:
  struct Options {
    bool all_formats = false;  // otherwise ZIP only
    std::size_t block_size = 10240;
  };

  explicit ArchiveReader(const std::filesystem::path& path);
  ArchiveReader(const std::filesystem::path& path, Options options);
  ~ArchiveReader();

  ArchiveReader(const ArchiveReader&) = delete;
  ArchiveReader& operator=(const ArchiveReader&) = delete;

  // Advances to the next entry header, skipping any unread data of the
  // current one. Returns nullopt at the end of the archive.
  std::optional<ArchiveEntryInfo> next_entry();

  // Decompressed bytes of the entry most recently returned by next_entry().
  ByteSource& data();

  const std::filesystem::path& path() const { return path_; }

  // Header-only passes; the token is checked once per entry.
  static std::vector<ArchiveEntryInfo> list(const std::filesystem::path& path);
  static std::vector<ArchiveEntryInfo> list(const std::filesystem::path& path,
                                            Options options,
                                            const CancelToken* cancel = nullptr);
  // Sum of the uncompressed sizes of every non-directory entry.
  static uint64_t total_size(const std::filesystem::path& path);
  static uint64_t total_size(const std::filesystem::path& path,
                             Options options,
                             const CancelToken* cancel = nullptr);

private:
  class EntryStream : public ByteSource {
  public:
    explicit EntryStream(ArchiveReader& owner) : owner_(owner) {}
    std::size_t read(char* buffer, std::size_t length) override;
    void open(std::string name);
    void open_link(std::string name, std::string target);
    void close();

  private:
    ArchiveReader& owner_;
    std::string name_;
    bool exhausted_ = true;
    std::string link_target_;
    std::optional<MemoryByteSource> link_source_;
  };

  [[noreturn]] void fail(const std::string& what) const;

  std::filesystem::path path_;
  std::unique_ptr<::archive, int (*)(::archive*)> archive_;
  EntryStream stream_;
};

#include "archive_reader.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <spdlog/fmt/fmt.h>

namespace {

bool looks_like_directory(::archive_entry* entry, const std::string& name) {
  if(archive_entry_filetype(entry) == AE_IFDIR) return true;
  return !name.empty() && name.back() == '/';
}

std::string symlink_target(::archive_entry* entry) {
  if(const char* utf8 = archive_entry_symlink_utf8(entry)) return utf8;
  if(const char* raw = archive_entry_symlink(entry)) return raw;
  return {};
}

std::string entry_name(::archive_entry* entry) {
  if(const char* utf8 = archive_entry_pathname_utf8(entry)) return utf8;
  if(const char* raw = archive_entry_pathname(entry)) return raw;
  return {};
}

} // namespace

ArchiveReader::ArchiveReader(const std::filesystem::path& path)
  : ArchiveReader(path, Options{}) {}

ArchiveReader::ArchiveReader(const std::filesystem::path& path, Options options)
  : path_(path),
    archive_(archive_read_new(), archive_read_free),
    stream_(*this) {
  if(!archive_) {
    throw ArchiveError("Unable to allocate archive reader for " + path_.string());
  }
  if(options.all_formats) {
    archive_read_support_filter_all(archive_.get());
    archive_read_support_format_all(archive_.get());
  } else {
    archive_read_support_format_zip(archive_.get());
  }
  if(archive_read_open_filename(archive_.get(), path_.c_str(), options.block_size) != ARCHIVE_OK) {
    fail("Unable to open archive");
  }
}

ArchiveReader::~ArchiveReader() = default;

void ArchiveReader::fail(const std::string& what) const {
  const char* detail = archive_error_string(archive_.get());
  throw ArchiveError(fmt::format("{} {}: {}", what, path_.string(),
                                 detail ? detail : "unknown error"));
}

std::optional<ArchiveEntryInfo> ArchiveReader::next_entry() {
  ::archive_entry* entry = nullptr;
  int rc = archive_read_next_header(archive_.get(), &entry);
  if(rc == ARCHIVE_EOF) {
    stream_.close();
    return std::nullopt;
  }
  if(rc < ARCHIVE_WARN) {
    fail("Corrupt entry header in");
  }

  ArchiveEntryInfo info;
  info.name = entry_name(entry);
  info.is_directory = looks_like_directory(entry, info.name);
  info.size_known = archive_entry_size_is_set(entry) != 0;
  if(info.size_known && archive_entry_size(entry) > 0) {
    info.size = static_cast<uint64_t>(archive_entry_size(entry));
  }
  if(!info.is_directory && archive_entry_filetype(entry) == AE_IFLNK) {
    info.is_symlink = true;
    info.link_target = symlink_target(entry);
    info.size = info.link_target.size();
    info.size_known = true;
    stream_.open_link(info.name, info.link_target);
  } else {
    stream_.open(info.name);
  }
  return info;
}

ByteSource& ArchiveReader::data() {
  return stream_;
}

void ArchiveReader::EntryStream::open(std::string name) {
  name_ = std::move(name);
  exhausted_ = false;
  link_source_.reset();
  link_target_.clear();
}

void ArchiveReader::EntryStream::open_link(std::string name, std::string target) {
  open(std::move(name));
  link_target_ = std::move(target);
  link_source_.emplace(link_target_);
}

void ArchiveReader::EntryStream::close() {
  name_.clear();
  exhausted_ = true;
  link_source_.reset();
  link_target_.clear();
}

std::size_t ArchiveReader::EntryStream::read(char* buffer, std::size_t length) {
  if(exhausted_ || length == 0) return 0;
  if(link_source_) {
    std::size_t n = link_source_->read(buffer, length);
    if(n == 0) exhausted_ = true;
    return n;
  }
  la_ssize_t n = archive_read_data(owner_.archive_.get(), buffer, length);
  if(n < 0) {
    owner_.fail("Corrupt data for entry '" + name_ + "' in");
  }
  if(n == 0) exhausted_ = true;
  return static_cast<std::size_t>(n);
}

std::vector<ArchiveEntryInfo> ArchiveReader::list(const std::filesystem::path& path) {
  return list(path, Options{});
}

std::vector<ArchiveEntryInfo> ArchiveReader::list(const std::filesystem::path& path,
                                                  Options options,
                                                  const CancelToken* cancel) {
  ArchiveReader reader(path, options);
  std::vector<ArchiveEntryInfo> entries;
  for(;;) {
    if(cancel) cancel->throw_if_cancelled();
    auto entry = reader.next_entry();
    if(!entry) break;
    entries.push_back(std::move(*entry));
  }
  return entries;
}

uint64_t ArchiveReader::total_size(const std::filesystem::path& path) {
  return total_size(path, Options{});
}

uint64_t ArchiveReader::total_size(const std::filesystem::path& path,
                                   Options options,
                                   const CancelToken* cancel) {
  uint64_t total = 0;
  for(const auto& entry : list(path, options, cancel)) {
    if(!entry.is_directory) total += entry.size;
  }
  return total;
}

#include "archive_fingerprinter.hpp"

ArchiveFingerprinter::ArchiveFingerprinter(const ContentHasher& hasher,
                                           ArchiveReader::Options options,
                                           std::shared_ptr<Logger> logger)
  : hasher_(hasher),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("archive")) {}

FingerprintIndex ArchiveFingerprinter::scan(const std::filesystem::path& archive_path) const {
  ArchiveReader reader(archive_path, options_);
  ProgressState* progress = hasher_.progress();

  FingerprintIndex index;
  std::size_t directories = 0;
  while(auto entry = reader.next_entry()) {
    if(entry->is_directory) {
      ++directories;
      continue;
    }
    if(progress) progress->set_current(entry->name);
    auto result = hasher_.hash(reader.data());
    if(entry->size_known && result.bytes != entry->size) {
      logger_->warn("Entry '{}' declared {} bytes but produced {}",
                    entry->name, entry->size, result.bytes);
    }
    // A later copy of a name shadows the earlier ones, as it does on extraction.
    if(index.count(entry->name)) {
      logger_->warn("Archive lists '{}' more than once; keeping the last copy", entry->name);
    }
    index[entry->name] = FingerprintEntry{entry->name, result.digest, result.bytes};
  }

  logger_->debug("Hashed {} entries from {} ({} directory entries skipped)",
                 index.size(), archive_path.string(), directories);
  return index;
}

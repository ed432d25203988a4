#include "comparison_session.hpp"

#include <stdexcept>

#include "archive_fingerprinter.hpp"
#include "content_hasher.hpp"
#include "tree_fingerprinter.hpp"
#include "utils.hpp"

ComparisonSession::ComparisonSession(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("session")) {
  if(options_.chunk_size == 0) {
    options_.chunk_size = ContentHasher::kDefaultChunkSize;
  }
}

void ComparisonSession::validate() const {
  if(options_.folder.empty()) {
    throw std::runtime_error("No folder to compare against was given");
  }
  if(options_.archive.empty()) {
    throw std::runtime_error("No archive was given");
  }
  if(!options_.dry_run && options_.output.empty()) {
    throw std::runtime_error("No output directory was given");
  }
  std::error_code ec;
  if(!std::filesystem::is_regular_file(options_.archive, ec)) {
    throw std::runtime_error("Archive is not a readable file: " + options_.archive.string());
  }
}

ComparisonResult ComparisonSession::run() {
  validate();
  const auto started = std::chrono::steady_clock::now();
  logger_->reset_counters();

  ComparisonResult result;
  result.folder = options_.folder;
  result.archive = options_.archive;
  result.output = options_.output;

  ArchiveReader::Options archive_options;
  archive_options.all_formats = options_.all_formats;

  ContentHasher hasher(options_.chunk_size, &progress_, &cancel_);
  TreeFingerprinter::Options tree_options;
  tree_options.max_workers = options_.max_workers;
  tree_options.max_pending = options_.max_pending;
  TreeFingerprinter tree(hasher, tree_options, logger_);
  ArchiveFingerprinter archive(hasher, archive_options, logger_);

  progress_.reset(ProgressPhase::Sizing, 0);
  logger_->info("Calculating total sizes...");
  auto listing = tree.list(options_.folder);
  result.folder_bytes = listing.total_bytes;
  result.archive_bytes = ArchiveReader::total_size(options_.archive, archive_options, &cancel_);
  cancel_.throw_if_cancelled();
  logger_->info("Folder: {} files, {}; archive: {}",
                listing.files.size(), format_size(result.folder_bytes),
                format_size(result.archive_bytes));

  progress_.reset(ProgressPhase::HashingFolder, result.folder_bytes);
  logger_->info("Scanning folder {} with {} workers", options_.folder.string(), tree.worker_count());
  result.folder_index = tree.scan(listing);

  progress_.reset(ProgressPhase::HashingArchive, result.archive_bytes);
  logger_->info("Scanning archive {}", options_.archive.string());
  result.archive_index = archive.scan(options_.archive);
  cancel_.throw_if_cancelled();

  result.plan = DiffEngine::diff(result.folder_index, result.archive_index);
  result.summary = DiffEngine::summarize(result.plan);
  logger_->info("{} duplicates, {} unique entries", result.summary.duplicates, result.summary.uniques);

  if(options_.dry_run) {
    logger_->info("Dry run: nothing extracted");
  } else {
    progress_.reset(ProgressPhase::Extracting, result.summary.unique_bytes);
    Extractor::Options extract_options;
    extract_options.on_failure = options_.on_failure;
    extract_options.chunk_size = options_.chunk_size;
    extract_options.archive = archive_options;
    Extractor extractor(extract_options, logger_, &progress_, &cancel_);
    result.extraction = extractor.materialize(options_.archive, result.plan, options_.output);
    result.extraction_ran = true;
  }

  progress_.reset(ProgressPhase::Idle, 0);
  result.warnings = logger_->warning_count();
  result.elapsed = std::chrono::steady_clock::now() - started;
  return result;
}

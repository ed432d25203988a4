#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "archive_reader.hpp"
#include "cancel_token.hpp"
#include "diff_engine.hpp"
#include "extractor.hpp"
#include "fingerprint.hpp"
#include "log.hpp"
#include "progress.hpp"

struct ComparisonResult {
  std::filesystem::path folder;
  std::filesystem::path archive;
  std::filesystem::path output;

  uint64_t folder_bytes = 0;
  uint64_t archive_bytes = 0;
  uint64_t combined_bytes() const { return folder_bytes + archive_bytes; }

  FingerprintIndex folder_index;
  FingerprintIndex archive_index;
  ClassificationPlan plan;
  PlanSummary summary;

  bool extraction_ran = false;
  ExtractionReport extraction;

  uint64_t warnings = 0;
  std::chrono::steady_clock::duration elapsed{};
};

// One comparison of an archive against a folder: size both, fingerprint
// both, classify, then extract the unique entries.
class ComparisonSession {
public:
  struct Options {
    std::filesystem::path folder;
    std::filesystem::path archive;
    std::filesystem::path output;
    std::size_t chunk_size = 8192;
    std::size_t max_workers = 0;
    std::size_t max_pending = 0;
    Extractor::FailurePolicy on_failure = Extractor::FailurePolicy::Continue;
    bool dry_run = false;
    bool all_formats = false;
  };

  explicit ComparisonSession(Options options, std::shared_ptr<Logger> logger = nullptr);

  // Throws ArchiveError for a structurally bad archive, OperationCancelled
  // if cancel() was called, std::runtime_error for unusable inputs.
  ComparisonResult run();

  // Safe to call from any thread, including a signal-handling one.
  void cancel() { cancel_.cancel(); }
  bool cancelled() const { return cancel_.cancelled(); }

  const Options& options() const { return options_; }
  const ProgressState& progress() const { return progress_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void validate() const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  ProgressState progress_;
  CancelToken cancel_;
};

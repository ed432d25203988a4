#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "archive_reader.hpp"
#include "cancel_token.hpp"
#include "diff_engine.hpp"
#include "log.hpp"
#include "progress.hpp"

struct ExtractionFailure {
  std::string identifier;
  std::string reason;
};

struct ExtractionReport {
  std::vector<std::string> written;  // plan order
  std::vector<ExtractionFailure> failures;
  bool aborted = false;

  std::size_t count() const { return written.size(); }
  bool ok() const { return failures.empty() && !aborted; }
};

// Writes the Unique entries of a plan below an output directory. Each file is
// streamed into a hidden staging file beside its target and renamed into
// place once complete, so a final name never holds a partial file.
class Extractor {
public:
  enum class FailurePolicy {
    Continue,
    Abort
  };

  struct Options {
    FailurePolicy on_failure = FailurePolicy::Continue;
    std::size_t chunk_size = 8192;
    ArchiveReader::Options archive;
  };

  static constexpr const char* kStagingSuffix = ".archdiff-part";

  explicit Extractor(Options options,
                     std::shared_ptr<Logger> logger = nullptr,
                     ProgressState* progress = nullptr,
                     const CancelToken* cancel = nullptr);

  ExtractionReport materialize(const std::filesystem::path& archive_path,
                               const ClassificationPlan& plan,
                               const std::filesystem::path& output_dir) const;

  static FailurePolicy parse_policy(const std::string& value);

private:
  // Returns an empty string on success, otherwise why the entry failed.
  std::string write_entry(ByteSource& source,
                          const std::string& identifier,
                          const std::filesystem::path& target) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  ProgressState* progress_;
  const CancelToken* cancel_;
};

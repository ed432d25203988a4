#include "extractor.hpp"

#include <fstream>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

void remove_quietly(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
}

} // namespace

Extractor::Extractor(Options options,
                     std::shared_ptr<Logger> logger,
                     ProgressState* progress,
                     const CancelToken* cancel)
  : options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("extract")),
    progress_(progress),
    cancel_(cancel) {
  if(options_.chunk_size == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
}

Extractor::FailurePolicy Extractor::parse_policy(const std::string& value) {
  if(value == "continue") return FailurePolicy::Continue;
  if(value == "abort") return FailurePolicy::Abort;
  throw std::invalid_argument("unknown extraction failure policy '" + value + "'");
}

std::string Extractor::write_entry(ByteSource& source,
                                   const std::string& identifier,
                                   const fs::path& target) const {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if(ec) {
    return "unable to create " + target.parent_path().string() + ": " + ec.message();
  }

  const fs::path staging = target.parent_path() /
    ("." + target.filename().string() + kStagingSuffix);
  std::ofstream out(staging, std::ios::binary | std::ios::trunc);
  if(!out) {
    return "unable to create " + staging.string();
  }

  std::vector<char> buffer(options_.chunk_size);
  try {
    for(;;) {
      if(cancel_) cancel_->throw_if_cancelled();
      std::size_t read = source.read(buffer.data(), buffer.size());
      if(read == 0) break;
      out.write(buffer.data(), static_cast<std::streamsize>(read));
      if(!out) {
        out.close();
        remove_quietly(staging);
        return "write failed for " + staging.string();
      }
      if(progress_) progress_->add_bytes(read);
    }
    out.close();
    if(!out) {
      remove_quietly(staging);
      return "unable to finish writing " + staging.string();
    }
  } catch(...) {
    out.close();
    remove_quietly(staging);
    throw;
  }

  fs::rename(staging, target, ec);
  if(ec) {
    std::error_code copy_ec;
    fs::copy_file(staging, target, fs::copy_options::overwrite_existing, copy_ec);
    remove_quietly(staging);
    if(copy_ec) {
      return "unable to move into place: " + copy_ec.message();
    }
  }
  logger_->debug("Extracted {} -> {}", identifier, target.string());
  return {};
}

ExtractionReport Extractor::materialize(const fs::path& archive_path,
                                        const ClassificationPlan& plan,
                                        const fs::path& output_dir) const {
  ExtractionReport report;

  std::unordered_map<std::string, std::size_t> pending;
  for(std::size_t i = 0; i < plan.size(); ++i) {
    if(!plan[i].is_duplicate()) pending.emplace(plan[i].archive_identifier, i);
  }
  if(pending.empty()) return report;

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if(ec) {
    throw std::runtime_error("Unable to create output directory " + output_dir.string() +
                             ": " + ec.message());
  }

  struct SlotOutcome {
    enum class State { Untouched, Written, Failed };
    State state = State::Untouched;
    std::string reason;
  };
  std::vector<SlotOutcome> outcomes(plan.size());

  auto record_failure = [&](std::size_t slot, std::string reason) {
    logger_->error("Failed to extract {}: {}", plan[slot].archive_identifier, reason);
    outcomes[slot] = SlotOutcome{SlotOutcome::State::Failed, std::move(reason)};
    if(options_.on_failure == FailurePolicy::Abort) report.aborted = true;
  };

  // A repeated name is extracted from its last copy only.
  std::unordered_map<std::string, std::size_t> copies_left;
  for(const auto& info : ArchiveReader::list(archive_path, options_.archive, cancel_)) {
    if(!info.is_directory && pending.count(info.name)) ++copies_left[info.name];
  }

  // Distinct names can clean up to one path ("a.txt", "./a.txt"); the first
  // one written keeps it.
  std::map<fs::path, std::string> claimed;

  ArchiveReader reader(archive_path, options_.archive);
  while(!report.aborted && !pending.empty()) {
    auto entry = reader.next_entry();
    if(!entry) break;
    if(entry->is_directory) continue;
    auto it = pending.find(entry->name);
    if(it == pending.end()) continue;
    auto copies = copies_left.find(entry->name);
    if(copies != copies_left.end() && --copies->second > 0) continue;
    const std::size_t slot = it->second;
    pending.erase(it);

    if(progress_) progress_->set_current(entry->name);
    auto relative = safe_relative_path(entry->name);
    if(!relative) {
      record_failure(slot, "unsafe entry path");
      continue;
    }
    auto claim = claimed.emplace(*relative, entry->name);
    if(!claim.second) {
      record_failure(slot, "path collides with " + claim.first->second);
      continue;
    }
    auto failure = write_entry(reader.data(), entry->name, output_dir / *relative);
    if(failure.empty()) {
      outcomes[slot].state = SlotOutcome::State::Written;
    } else {
      claimed.erase(claim.first);
      record_failure(slot, std::move(failure));
    }
  }

  if(!report.aborted) {
    for(const auto& missing : pending) {
      record_failure(missing.second, "entry not found in archive");
      if(report.aborted) break;
    }
  }

  for(std::size_t i = 0; i < plan.size(); ++i) {
    if(outcomes[i].state == SlotOutcome::State::Written) {
      report.written.push_back(plan[i].archive_identifier);
    } else if(outcomes[i].state == SlotOutcome::State::Failed) {
      report.failures.push_back({plan[i].archive_identifier, outcomes[i].reason});
    }
  }
  return report;
}

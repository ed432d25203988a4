#include "diff_engine.hpp"

const char* classification_label(Classification classification) {
  return classification == Classification::Duplicate ? "duplicate" : "unique";
}

ReverseIndex DiffEngine::build_reverse_index(const FingerprintIndex& folder) {
  ReverseIndex reverse;
  reverse.reserve(folder.size());
  // FingerprintIndex iterates in identifier order, so emplace keeps the smallest.
  for(const auto& [identifier, entry] : folder) {
    reverse.emplace(entry.digest, identifier);
  }
  return reverse;
}

ClassificationPlan DiffEngine::diff(const FingerprintIndex& folder,
                                    const FingerprintIndex& archive) {
  const auto reverse = build_reverse_index(folder);

  ClassificationPlan plan;
  plan.reserve(archive.size());
  for(const auto& [identifier, entry] : archive) {
    ClassificationRecord record;
    record.archive_identifier = identifier;
    record.digest = entry.digest;
    record.size = entry.size;
    auto hit = reverse.find(entry.digest);
    if(hit != reverse.end()) {
      record.outcome = Classification::Duplicate;
      record.matched_identifier = hit->second;
    }
    plan.push_back(std::move(record));
  }
  return plan;
}

PlanSummary DiffEngine::summarize(const ClassificationPlan& plan) {
  PlanSummary summary;
  for(const auto& record : plan) {
    if(record.is_duplicate()) {
      ++summary.duplicates;
      summary.duplicate_bytes += record.size;
    } else {
      ++summary.uniques;
      summary.unique_bytes += record.size;
    }
  }
  return summary;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "fingerprint.hpp"

enum class Classification {
  Duplicate,
  Unique
};

const char* classification_label(Classification classification);

struct ClassificationRecord {
  std::string archive_identifier;
  Digest digest{};
  uint64_t size = 0;
  Classification outcome = Classification::Unique;
  std::string matched_identifier;  // set for Duplicate only

  bool is_duplicate() const { return outcome == Classification::Duplicate; }
};

// Ordered by archive identifier.
using ClassificationPlan = std::vector<ClassificationRecord>;

// digest -> representative folder identifier
using ReverseIndex = std::unordered_map<Digest, std::string, DigestHash>;

struct PlanSummary {
  std::size_t duplicates = 0;
  std::size_t uniques = 0;
  uint64_t duplicate_bytes = 0;
  uint64_t unique_bytes = 0;

  std::size_t total() const { return duplicates + uniques; }
};

class DiffEngine {
public:
  // When several folder files share a digest, the lexicographically smallest
  // identifier represents them.
  static ReverseIndex build_reverse_index(const FingerprintIndex& folder);

  static ClassificationPlan diff(const FingerprintIndex& folder,
                                 const FingerprintIndex& archive);

  static PlanSummary summarize(const ClassificationPlan& plan);
};

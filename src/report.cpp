#include "report.hpp"

#include <fstream>
#include <string>

#include "utils.hpp"

namespace {

const std::string kRule(50, '-');

nlohmann::json index_to_json(const FingerprintIndex& index) {
  nlohmann::json out = nlohmann::json::array();
  for(const auto& [identifier, entry] : index) {
    out.push_back({{"path", identifier},
                   {"sha256", digest_hex(entry.digest)},
                   {"size", entry.size}});
  }
  return out;
}

} // namespace

void render_report(const ComparisonResult& result, Logger* logger) {
  print_out(logger, "");
  print_out(logger, "Diff Report:");
  print_out(logger, "{}", kRule);
  print_out(logger, "Archive examined: {}", result.archive.string());
  print_out(logger, "Compared against folder: {}", result.folder.string());
  if(result.extraction_ran) {
    print_out(logger, "Files extracted to: {}", result.output.string());
  } else {
    print_out(logger, "Dry run: no files extracted");
  }
  print_out(logger, "{}", kRule);

  print_out(logger, "");
  print_out(logger, "Duplicate files found ({}):", result.summary.duplicates);
  for(const auto& record : result.plan) {
    if(!record.is_duplicate()) continue;
    print_out(logger, "Archive: {}", record.archive_identifier);
    print_out(logger, "Matches: {}", record.matched_identifier);
    print_out(logger, "");
  }

  if(result.extraction_ran) {
    print_out(logger, "");
    print_out(logger, "Files extracted ({}):", result.extraction.count());
    for(const auto& name : result.extraction.written) {
      print_out(logger, "- {}", name);
    }
    if(!result.extraction.failures.empty()) {
      print_out(logger, "");
      print_out(logger, "Extraction failures ({}):", result.extraction.failures.size());
      for(const auto& failure : result.extraction.failures) {
        print_out(logger, "- {}: {}", failure.identifier, failure.reason);
      }
    }
    if(result.extraction.aborted) {
      print_out(logger, "Extraction stopped after the first failure.");
    }
  } else {
    print_out(logger, "");
    print_out(logger, "Files that would be extracted ({}):", result.summary.uniques);
    for(const auto& record : result.plan) {
      if(!record.is_duplicate()) print_out(logger, "- {}", record.archive_identifier);
    }
  }

  print_out(logger, "");
  print_out(logger, "Summary:");
  print_out(logger, "{}", kRule);
  print_out(logger, "Archive processed: {}", result.archive.filename().string());
  print_out(logger, "Total archive size: {}", format_size(result.archive_bytes));
  print_out(logger, "Total folder size scanned: {}", format_size(result.folder_bytes));
  print_out(logger, "Total files processed: {}", result.archive_index.size());
  print_out(logger, "Total duplicates: {}", result.summary.duplicates);
  print_out(logger, "Total files extracted: {}", result.extraction.count());
  if(!result.extraction.failures.empty()) {
    print_out(logger, "Total extraction failures: {}", result.extraction.failures.size());
  }
  if(result.warnings > 0) {
    print_out(logger, "Completed with {} warning(s); see log output above.", result.warnings);
  }
  print_out(logger, "Elapsed: {}", format_duration(result.elapsed));
}

nlohmann::json report_to_json(const ComparisonResult& result) {
  nlohmann::json doc;
  doc["folder"] = result.folder.string();
  doc["archive"] = result.archive.string();
  doc["output"] = result.output.string();
  doc["folder_bytes"] = result.folder_bytes;
  doc["archive_bytes"] = result.archive_bytes;
  doc["combined_bytes"] = result.combined_bytes();
  doc["warnings"] = result.warnings;

  nlohmann::json records = nlohmann::json::array();
  for(const auto& record : result.plan) {
    nlohmann::json item = {
      {"entry", record.archive_identifier},
      {"sha256", digest_hex(record.digest)},
      {"size", record.size},
      {"outcome", classification_label(record.outcome)}
    };
    if(record.is_duplicate()) item["matches"] = record.matched_identifier;
    records.push_back(std::move(item));
  }
  doc["classification"] = std::move(records);
  doc["summary"] = {
    {"duplicates", result.summary.duplicates},
    {"unique", result.summary.uniques},
    {"duplicate_bytes", result.summary.duplicate_bytes},
    {"unique_bytes", result.summary.unique_bytes}
  };

  nlohmann::json extraction;
  extraction["ran"] = result.extraction_ran;
  extraction["written"] = result.extraction.written;
  extraction["aborted"] = result.extraction.aborted;
  nlohmann::json failures = nlohmann::json::array();
  for(const auto& failure : result.extraction.failures) {
    failures.push_back({{"entry", failure.identifier}, {"reason", failure.reason}});
  }
  extraction["failures"] = std::move(failures);
  doc["extraction"] = std::move(extraction);

  doc["folder_index"] = index_to_json(result.folder_index);
  doc["archive_index"] = index_to_json(result.archive_index);
  return doc;
}

bool write_json_report(const ComparisonResult& result,
                       const std::filesystem::path& path,
                       Logger* logger) {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    log_error(logger, "Unable to write report {}", path.string());
    return false;
  }
  out << report_to_json(result).dump(2) << "\n";
  if(!out) {
    log_error(logger, "Unable to write report {}", path.string());
    return false;
  }
  log_info(logger, "Wrote JSON report to {}", path.string());
  return true;
}

#include "archive_fingerprinter.hpp"
#include "archive_reader.hpp"
#include "command_line_parser.hpp"
#include "comparison_session.hpp"
#include "content_hasher.hpp"
#include "diff_engine.hpp"
#include "extractor.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "report.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "tree_fingerprinter.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <iterator>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using archdiff::test::TempWorkspace;
using archdiff::test::dir_entry;
using archdiff::test::file_entry;
using archdiff::test::link_entry;
using archdiff::test::list_relative_files;
using archdiff::test::read_file;
using archdiff::test::write_file;
using archdiff::test::write_zip;

namespace {

const char* kSha256Hello = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
const char* kSha256Empty = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

struct TestContext {
  archdiff::test::LogCapture& logs;
  bool verbose = false;
  std::vector<std::string> failures;

  bool expect(bool condition, const std::string& what) {
    if(!condition) failures.push_back(what);
    return condition;
  }

  std::shared_ptr<Logger> logger(const std::string& name) {
    auto logger = std::make_shared<Logger>(name);
    logs.attach(logger);
    return logger;
  }
};

std::string pattern_bytes(std::size_t length) {
  std::string out(length, '\0');
  for(std::size_t i = 0; i < length; ++i) {
    out[i] = static_cast<char>((i * 131 + 7) % 251);
  }
  return out;
}

class FailingSource : public ByteSource {
public:
  std::size_t read(char* buffer, std::size_t length) override {
    if(served_) throw std::runtime_error("device went away");
    served_ = true;
    std::size_t count = std::min<std::size_t>(length, 10);
    std::fill(buffer, buffer + count, 'x');
    return count;
  }

private:
  bool served_ = false;
};

ComparisonSession::Options session_options(const TempWorkspace& ws) {
  ComparisonSession::Options options;
  options.folder = ws / "folder";
  options.archive = ws / "input.zip";
  options.output = ws / "out";
  options.max_workers = 2;
  return options;
}

const ClassificationRecord* find_record(const ClassificationPlan& plan, const std::string& name) {
  for(const auto& record : plan) {
    if(record.archive_identifier == name) return &record;
  }
  return nullptr;
}

// ---- ContentHasher --------------------------------------------------------

bool test_hasher_known_vectors(TestContext& ctx) {
  ContentHasher hasher;
  bool ok = ctx.expect(digest_hex(hasher.hash_bytes("hello").digest) == kSha256Hello, "sha256(hello)");
  ok &= ctx.expect(digest_hex(hasher.hash_bytes("").digest) == kSha256Empty, "sha256(empty)");
  ok &= ctx.expect(hasher.hash_bytes("hello").bytes == 5, "byte count");
  return ok;
}

bool test_hasher_chunk_size_independent(TestContext& ctx) {
  const auto content = pattern_bytes(100003);
  const auto reference = ContentHasher(ContentHasher::kDefaultChunkSize).hash_bytes(content).digest;
  bool ok = true;
  for(std::size_t chunk : {std::size_t{1}, std::size_t{7}, std::size_t{4096}, std::size_t{65536}, std::size_t{1} << 20}) {
    ContentHasher hasher(chunk);
    ok &= ctx.expect(hasher.hash_bytes(content).digest == reference,
                     "digest differs with chunk size " + std::to_string(chunk));
  }

  TempWorkspace ws("chunks");
  write_file(ws / "blob.bin", content);
  ok &= ctx.expect(ContentHasher(333).hash_file(ws / "blob.bin").digest == reference, "file digest");
  return ok;
}

bool test_hasher_counts_progress(TestContext& ctx) {
  ProgressState progress;
  progress.reset(ProgressPhase::HashingFolder, 100);
  ContentHasher hasher(30, &progress);
  hasher.hash_bytes(std::string(100, 'a'));
  auto snap = progress.snapshot();
  bool ok = ctx.expect(snap.processed_bytes == 100, "processed bytes");
  ok &= ctx.expect(snap.percent() == 100.0, "percent");
  return ok;
}

bool test_hasher_propagates_read_failure(TestContext& ctx) {
  ContentHasher hasher(4);
  FailingSource source;
  try {
    hasher.hash(source);
  } catch(const std::runtime_error& e) {
    return ctx.expect(std::string(e.what()) == "device went away", "original error surfaces");
  }
  return ctx.expect(false, "read failure was swallowed");
}

bool test_hasher_stops_when_cancelled(TestContext& ctx) {
  CancelToken cancel;
  cancel.cancel();
  ContentHasher hasher(ContentHasher::kDefaultChunkSize, nullptr, &cancel);
  try {
    hasher.hash_bytes("data");
  } catch(const OperationCancelled&) {
    return true;
  }
  return ctx.expect(false, "cancelled hash completed");
}

// ---- TreeFingerprinter ----------------------------------------------------

bool test_tree_indexes_regular_files(TestContext& ctx) {
  TempWorkspace ws("tree");
  const auto root = ws / "folder";
  write_file(root / "a.txt", "hello");
  write_file(root / "sub" / "b.txt", "world!");
  write_file(root / "sub" / "deeper" / "c.bin", pattern_bytes(20000));
  fs::create_directories(root / "empty");

  ContentHasher hasher;
  TreeFingerprinter tree(hasher, {}, ctx.logger("tree"));
  auto listing = tree.list(root);
  bool ok = ctx.expect(listing.files.size() == 3, "listed file count");
  ok &= ctx.expect(listing.total_bytes == 5 + 6 + 20000, "listed bytes");

  auto index = tree.scan(listing);
  ok &= ctx.expect(index.size() == 3, "index size");
  auto a = index.find((root / "a.txt").generic_string());
  ok &= ctx.expect(a != index.end(), "a.txt indexed by path");
  if(a != index.end()) {
    ok &= ctx.expect(digest_hex(a->second.digest) == kSha256Hello, "a.txt digest");
    ok &= ctx.expect(a->second.size == 5, "a.txt size");
  }
  auto c = index.find((root / "sub" / "deeper" / "c.bin").generic_string());
  ok &= ctx.expect(c != index.end() && c->second.digest == hasher.hash_bytes(pattern_bytes(20000)).digest,
                   "nested file digest");
  return ok;
}

bool test_tree_skips_vanished_files(TestContext& ctx) {
  TempWorkspace ws("vanish");
  const auto root = ws / "folder";
  write_file(root / "keep.txt", "keep");
  write_file(root / "gone.txt", "gone");

  ContentHasher hasher;
  TreeFingerprinter tree(hasher, {}, ctx.logger("tree"));
  auto listing = tree.list(root);
  fs::remove(root / "gone.txt");
  auto index = tree.scan(listing);

  bool ok = ctx.expect(index.size() == 1, "only surviving file indexed");
  ok &= ctx.expect(index.count((root / "keep.txt").generic_string()) == 1, "keep.txt indexed");
  ok &= ctx.expect(ctx.logs.contains("Error processing"), "warning logged for vanished file");
  return ok;
}

bool test_tree_bounded_pool(TestContext& ctx) {
  TempWorkspace ws("pool");
  const auto root = ws / "folder";
  for(int i = 0; i < 64; ++i) {
    write_file(root / ("dir" + std::to_string(i % 5)) / ("f" + std::to_string(i)), std::string(i * 97, 'z'));
  }
  ContentHasher hasher(512);
  TreeFingerprinter::Options options;
  options.max_workers = 2;
  options.max_pending = 1;
  TreeFingerprinter tree(hasher, options, ctx.logger("tree"));
  bool ok = ctx.expect(tree.worker_count() == 2 && tree.pending_limit() == 1, "pool limits");
  auto index = tree.scan(root);
  ok &= ctx.expect(index.size() == 64, "every file hashed");
  return ok;
}

bool test_tree_follows_symlinks_without_looping(TestContext& ctx) {
  TempWorkspace ws("symlink");
  const auto root = ws / "folder";
  write_file(root / "real" / "x.txt", "linked");
  std::error_code ec;
  fs::create_directory_symlink(root, root / "real" / "loop", ec);
  if(ec) return ctx.expect(false, "cannot create directory symlink: " + ec.message());
  fs::create_symlink(root / "real" / "x.txt", root / "alias.txt", ec);
  if(ec) return ctx.expect(false, "cannot create file symlink: " + ec.message());

  ContentHasher hasher;
  TreeFingerprinter tree(hasher, {}, ctx.logger("tree"));
  auto listing = tree.list(root);
  std::set<std::string> names;
  for(const auto& file : listing.files) names.insert(file.lexically_relative(root).generic_string());
  return ctx.expect(names == std::set<std::string>{"alias.txt", "real/x.txt"}, "symlinked file listed once, cycle cut");
}

bool test_tree_rejects_missing_root(TestContext& ctx) {
  TempWorkspace ws("missing");
  ContentHasher hasher;
  TreeFingerprinter tree(hasher, {}, ctx.logger("tree"));
  try {
    tree.list(ws / "does-not-exist");
  } catch(const std::runtime_error&) {
    return true;
  }
  return ctx.expect(false, "missing root accepted");
}

bool test_sizing_pass_honours_cancellation(TestContext& ctx) {
  TempWorkspace ws("sizing_cancel");
  write_file(ws / "folder" / "a.txt", "hello");
  write_zip(ws / "input.zip", {file_entry("a.txt", "hello")});

  CancelToken cancel;
  cancel.cancel();
  ContentHasher hasher(ContentHasher::kDefaultChunkSize, nullptr, &cancel);
  TreeFingerprinter tree(hasher, {}, ctx.logger("tree"));

  bool walk_stopped = false;
  try {
    tree.list(ws / "folder");
  } catch(const OperationCancelled&) {
    walk_stopped = true;
  }
  bool listing_stopped = false;
  try {
    ArchiveReader::total_size(ws / "input.zip", ArchiveReader::Options{}, &cancel);
  } catch(const OperationCancelled&) {
    listing_stopped = true;
  }
  bool ok = ctx.expect(walk_stopped, "folder walk stops on cancel");
  ok &= ctx.expect(listing_stopped, "archive listing stops on cancel");
  return ok;
}

// ---- ArchiveFingerprinter -------------------------------------------------

bool test_archive_skips_directory_entries(TestContext& ctx) {
  TempWorkspace ws("archive");
  write_zip(ws / "input.zip", {
    dir_entry("sub/"),
    file_entry("sub/a.txt", "hello"),
    file_entry("b.txt", "world"),
    dir_entry("empty/")
  });

  ContentHasher hasher;
  ArchiveFingerprinter fingerprinter(hasher, {}, ctx.logger("archive"));
  auto index = fingerprinter.scan(ws / "input.zip");
  std::set<std::string> keys;
  for(const auto& item : index) keys.insert(item.first);

  bool ok = ctx.expect(keys == std::set<std::string>{"b.txt", "sub/a.txt"}, "only file entries indexed");
  ok &= ctx.expect(digest_hex(index["sub/a.txt"].digest) == kSha256Hello, "entry digest over decompressed bytes");
  ok &= ctx.expect(ArchiveReader::total_size(ws / "input.zip") == 10, "archive total size");
  ok &= ctx.expect(ArchiveReader::list(ws / "input.zip").size() == 4, "listing includes directories");
  return ok;
}

bool test_archive_rejects_corrupt_archive(TestContext& ctx) {
  TempWorkspace ws("corrupt");
  write_file(ws / "bad.zip", "this is certainly not a zip file");
  ContentHasher hasher;
  ArchiveFingerprinter fingerprinter(hasher, {}, ctx.logger("archive"));
  try {
    fingerprinter.scan(ws / "bad.zip");
  } catch(const ArchiveError&) {
    return true;
  }
  return ctx.expect(false, "corrupt archive accepted");
}

bool test_archive_symlink_hashed_as_target(TestContext& ctx) {
  TempWorkspace ws("symlink_entry");
  write_file(ws / "folder" / "empty.txt", "");
  write_zip(ws / "input.zip", {link_entry("link", "target/path.txt"), file_entry("real.txt", "x")});

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  auto result = session.run();

  ContentHasher hasher;
  auto link = result.archive_index.find("link");
  bool ok = ctx.expect(link != result.archive_index.end(), "link indexed");
  if(link != result.archive_index.end()) {
    ok &= ctx.expect(link->second.digest == hasher.hash_bytes("target/path.txt").digest,
                     "link hashed over its target path");
    ok &= ctx.expect(link->second.size == 15, "link size is target length");
  }
  const auto* record = find_record(result.plan, "link");
  ok &= ctx.expect(record && !record->is_duplicate(), "link does not match an empty file");
  ok &= ctx.expect(result.archive_bytes == 16, "link counted in archive size");
  ok &= ctx.expect(read_file(ws / "out" / "link") == "target/path.txt", "link extracted with its stored bytes");
  return ok;
}

bool test_archive_repeated_name_keeps_last_copy(TestContext& ctx) {
  TempWorkspace ws("repeated");
  fs::create_directories(ws / "folder");
  write_zip(ws / "input.zip", {
    file_entry("a.txt", "first"), file_entry("b.txt", "other"), file_entry("a.txt", "second")
  });

  ContentHasher hasher;
  ArchiveFingerprinter fingerprinter(hasher, {}, ctx.logger("archive"));
  auto index = fingerprinter.scan(ws / "input.zip");
  bool ok = ctx.expect(index.size() == 2, "one record per name");
  ok &= ctx.expect(index["a.txt"].digest == hasher.hash_bytes("second").digest && index["a.txt"].size == 6,
                   "last copy indexed");
  ok &= ctx.expect(ctx.logs.contains("more than once"), "repeat reported");

  Extractor extractor(Extractor::Options{}, ctx.logger("extract"));
  auto report = extractor.materialize(ws / "input.zip", DiffEngine::diff({}, index), ws / "out");
  ok &= ctx.expect(report.ok() && report.written == std::vector<std::string>{"a.txt", "b.txt"}, "both names written");
  ok &= ctx.expect(read_file(ws / "out" / "a.txt") == "second", "last copy extracted");
  return ok;
}

// ---- DiffEngine -----------------------------------------------------------

bool test_scenario_duplicate_and_unique(TestContext& ctx) {
  TempWorkspace ws("scenario1");
  write_file(ws / "folder" / "a.txt", "hello");
  write_zip(ws / "input.zip", {file_entry("a.txt", "hello"), file_entry("b.txt", "world")});

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  auto result = session.run();

  bool ok = ctx.expect(result.plan.size() == 2, "two records");
  const auto* a = find_record(result.plan, "a.txt");
  const auto* b = find_record(result.plan, "b.txt");
  ok &= ctx.expect(a && a->is_duplicate() &&
                   a->matched_identifier == (ws / "folder" / "a.txt").generic_string(),
                   "a.txt duplicates folder a.txt");
  ok &= ctx.expect(b && !b->is_duplicate(), "b.txt unique");
  ok &= ctx.expect(result.extraction.written == std::vector<std::string>{"b.txt"}, "only b.txt written");
  ok &= ctx.expect(list_relative_files(ws / "out") == std::set<std::string>{"b.txt"}, "output holds b.txt only");
  ok &= ctx.expect(read_file(ws / "out" / "b.txt") == "world", "b.txt content");
  ok &= ctx.expect(result.folder_bytes == 5 && result.archive_bytes == 10, "totals");
  return ok;
}

bool test_scenario_empty_folder(TestContext& ctx) {
  TempWorkspace ws("scenario2");
  fs::create_directories(ws / "folder");
  write_zip(ws / "input.zip", {file_entry("x.txt", "data")});

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  auto result = session.run();

  bool ok = ctx.expect(result.summary.duplicates == 0 && result.summary.uniques == 1, "one unique record");
  ok &= ctx.expect(result.extraction.count() == 1, "one extraction");
  ok &= ctx.expect(read_file(ws / "out" / "x.txt") == "data", "x.txt extracted");
  return ok;
}

bool test_scenario_directory_only_archive(TestContext& ctx) {
  TempWorkspace ws("scenario3");
  write_file(ws / "folder" / "a.txt", "hello");
  write_zip(ws / "input.zip", {dir_entry("sub/")});

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  auto result = session.run();

  bool ok = ctx.expect(result.plan.empty(), "no records");
  ok &= ctx.expect(result.archive_index.empty(), "directory not indexed");
  ok &= ctx.expect(result.extraction.count() == 0, "nothing extracted");
  ok &= ctx.expect(list_relative_files(ws / "out").empty(), "output empty");
  return ok;
}

bool test_diff_tie_break_is_deterministic(TestContext& ctx) {
  ContentHasher hasher;
  const auto digest = hasher.hash_bytes("shared").digest;
  FingerprintIndex folder;
  for(const char* name : {"z/copy", "a/copy", "m/copy"}) {
    folder.emplace(name, FingerprintEntry{name, digest, 6});
  }
  FingerprintIndex archive;
  archive.emplace("entry", FingerprintEntry{"entry", digest, 6});

  auto reverse = DiffEngine::build_reverse_index(folder);
  bool ok = ctx.expect(reverse.size() == 1 && reverse.at(digest) == "a/copy", "smallest identifier wins");
  auto plan = DiffEngine::diff(folder, archive);
  ok &= ctx.expect(plan.size() == 1 && plan[0].matched_identifier == "a/copy", "plan uses smallest identifier");
  return ok;
}

bool test_diff_counts_cover_every_entry(TestContext& ctx) {
  ContentHasher hasher;
  FingerprintIndex folder;
  FingerprintIndex archive;
  for(int i = 0; i < 20; ++i) {
    auto content = "content-" + std::to_string(i);
    auto name = "entry" + std::to_string(i);
    archive.emplace(name, FingerprintEntry{name, hasher.hash_bytes(content).digest, content.size()});
    if(i % 3 == 0) {
      auto path = "folder/" + name;
      folder.emplace(path, FingerprintEntry{path, hasher.hash_bytes(content).digest, content.size()});
    }
  }
  auto plan = DiffEngine::diff(folder, archive);
  auto summary = DiffEngine::summarize(plan);
  bool ok = ctx.expect(summary.total() == archive.size(), "duplicates + uniques == entries");
  ok &= ctx.expect(summary.duplicates == 7, "duplicate count");
  bool sorted = std::is_sorted(plan.begin(), plan.end(),
    [](const ClassificationRecord& a, const ClassificationRecord& b){
      return a.archive_identifier < b.archive_identifier;
    });
  ok &= ctx.expect(sorted, "plan ordered by archive identifier");
  return ok;
}

bool test_diff_uses_content_not_name_or_size(TestContext& ctx) {
  ContentHasher hasher;
  FingerprintIndex folder;
  folder.emplace("folder/a.txt", FingerprintEntry{"folder/a.txt", hasher.hash_bytes("abcd").digest, 4});
  folder.emplace("folder/photo.jpg", FingerprintEntry{"folder/photo.jpg", hasher.hash_bytes("pixels").digest, 6});

  FingerprintIndex archive;
  archive.emplace("a.txt", FingerprintEntry{"a.txt", hasher.hash_bytes("abce").digest, 4});
  archive.emplace("renamed.bin", FingerprintEntry{"renamed.bin", hasher.hash_bytes("pixels").digest, 6});

  auto plan = DiffEngine::diff(folder, archive);
  const auto* same_name = find_record(plan, "a.txt");
  const auto* renamed = find_record(plan, "renamed.bin");
  bool ok = ctx.expect(same_name && !same_name->is_duplicate(), "same name and size, different bytes is unique");
  ok &= ctx.expect(renamed && renamed->is_duplicate() && renamed->matched_identifier == "folder/photo.jpg",
                   "same bytes under another name is a duplicate");
  return ok;
}

// ---- Extractor ------------------------------------------------------------

bool test_extractor_writes_exactly_unique_set(TestContext& ctx) {
  TempWorkspace ws("extract");
  write_file(ws / "folder" / "known.txt", "known");
  write_file(ws / "folder" / "nested" / "also-known.txt", "also known");
  write_zip(ws / "input.zip", {
    dir_entry("docs/"),
    file_entry("docs/readme.md", "# readme"),
    file_entry("docs/copy-of-known.txt", "known"),
    file_entry("deep/a/b/c.txt", "deep"),
    file_entry("also-known.txt", "also known"),
    file_entry("fresh.txt", "fresh")
  });

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  auto result = session.run();

  const std::set<std::string> expected{"deep/a/b/c.txt", "docs/readme.md", "fresh.txt"};
  bool ok = ctx.expect(list_relative_files(ws / "out") == expected, "output matches unique set");
  ok &= ctx.expect(std::set<std::string>(result.extraction.written.begin(), result.extraction.written.end()) == expected,
                   "report matches unique set");
  ok &= ctx.expect(result.extraction.written.front() == "deep/a/b/c.txt", "written in plan order");
  ok &= ctx.expect(read_file(ws / "out" / "deep" / "a" / "b" / "c.txt") == "deep", "nested content");
  ok &= ctx.expect(result.extraction.ok(), "no failures");
  return ok;
}

bool test_extractor_rejects_unsafe_paths(TestContext& ctx) {
  TempWorkspace ws("unsafe");
  write_zip(ws / "input.zip", {file_entry("../escape.txt", "nope"), file_entry("ok.txt", "fine")});

  ContentHasher hasher;
  ArchiveFingerprinter fingerprinter(hasher, {}, ctx.logger("archive"));
  auto plan = DiffEngine::diff({}, fingerprinter.scan(ws / "input.zip"));

  Extractor extractor(Extractor::Options{}, ctx.logger("extract"));
  auto report = extractor.materialize(ws / "input.zip", plan, ws / "out");
  bool ok = ctx.expect(report.written == std::vector<std::string>{"ok.txt"}, "safe entry still written");
  ok &= ctx.expect(report.failures.size() == 1 && report.failures[0].identifier == "../escape.txt",
                   "unsafe entry reported");
  ok &= ctx.expect(!fs::exists(ws / "escape.txt"), "nothing written outside output");
  ok &= ctx.expect(!report.aborted, "continue policy keeps going");
  return ok;
}

bool test_extractor_abort_policy(TestContext& ctx) {
  TempWorkspace ws("abort");
  write_zip(ws / "input.zip", {file_entry("../escape.txt", "nope"), file_entry("ok.txt", "fine")});

  ContentHasher hasher;
  ArchiveFingerprinter fingerprinter(hasher, {}, ctx.logger("archive"));
  auto plan = DiffEngine::diff({}, fingerprinter.scan(ws / "input.zip"));

  Extractor::Options options;
  options.on_failure = Extractor::parse_policy("abort");
  Extractor extractor(options, ctx.logger("extract"));
  auto report = extractor.materialize(ws / "input.zip", plan, ws / "out");
  bool ok = ctx.expect(report.aborted, "aborted flag");
  ok &= ctx.expect(report.written.empty(), "nothing written after failure");
  ok &= ctx.expect(report.failures.size() == 1, "single failure recorded");
  return ok;
}

bool test_extractor_reports_missing_entries(TestContext& ctx) {
  TempWorkspace ws("missing_entry");
  write_zip(ws / "input.zip", {file_entry("present.txt", "here")});

  ContentHasher hasher;
  ClassificationPlan plan;
  for(const char* name : {"ghost.txt", "present.txt"}) {
    ClassificationRecord record;
    record.archive_identifier = name;
    record.digest = hasher.hash_bytes(name).digest;
    plan.push_back(record);
  }

  Extractor extractor(Extractor::Options{}, ctx.logger("extract"));
  auto report = extractor.materialize(ws / "input.zip", plan, ws / "out");
  bool ok = ctx.expect(report.written == std::vector<std::string>{"present.txt"}, "present entry written");
  ok &= ctx.expect(report.failures.size() == 1 && report.failures[0].identifier == "ghost.txt" &&
                   report.failures[0].reason == "entry not found in archive", "missing entry reported");
  return ok;
}

bool test_extractor_rejects_colliding_paths(TestContext& ctx) {
  TempWorkspace ws("collide");
  write_zip(ws / "input.zip", {
    file_entry("a.txt", "one"), file_entry("./a.txt", "two"),
    file_entry("d/x", "three"), file_entry("d//x", "four")
  });

  ContentHasher hasher;
  ArchiveFingerprinter fingerprinter(hasher, {}, ctx.logger("archive"));
  auto plan = DiffEngine::diff({}, fingerprinter.scan(ws / "input.zip"));

  Extractor extractor(Extractor::Options{}, ctx.logger("extract"));
  auto report = extractor.materialize(ws / "input.zip", plan, ws / "out");
  std::set<std::string> written(report.written.begin(), report.written.end());
  bool ok = ctx.expect(written == std::set<std::string>{"a.txt", "d/x"}, "first name keeps each path");
  ok &= ctx.expect(report.failures.size() == 2, "each collision reported");
  for(const auto& failure : report.failures) {
    ok &= ctx.expect((failure.identifier == "./a.txt" && failure.reason == "path collides with a.txt") ||
                     (failure.identifier == "d//x" && failure.reason == "path collides with d/x"),
                     "collision reason for " + failure.identifier);
  }
  ok &= ctx.expect(read_file(ws / "out" / "a.txt") == "one", "earlier bytes kept");
  ok &= ctx.expect(read_file(ws / "out" / "d" / "x") == "three", "earlier nested bytes kept");
  ok &= ctx.expect(!report.ok(), "run reports the failure");
  return ok;
}

bool test_extractor_cancel_leaves_no_partial_file(TestContext& ctx) {
  TempWorkspace ws("cancel_extract");
  write_zip(ws / "input.zip", {file_entry("big.bin", pattern_bytes(50000))});

  ContentHasher hasher;
  ArchiveFingerprinter fingerprinter(hasher, {}, ctx.logger("archive"));
  auto plan = DiffEngine::diff({}, fingerprinter.scan(ws / "input.zip"));

  CancelToken cancel;
  cancel.cancel();
  Extractor extractor(Extractor::Options{}, ctx.logger("extract"), nullptr, &cancel);
  bool threw = false;
  try {
    extractor.materialize(ws / "input.zip", plan, ws / "out");
  } catch(const OperationCancelled&) {
    threw = true;
  }
  bool ok = ctx.expect(threw, "cancellation surfaced");
  ok &= ctx.expect(list_relative_files(ws / "out").empty(), "no staged or partial file left");
  return ok;
}

// ---- ComparisonSession ----------------------------------------------------

bool test_session_is_idempotent(TestContext& ctx) {
  TempWorkspace ws("idempotent");
  write_file(ws / "folder" / "one.txt", "one");
  write_file(ws / "folder" / "dup" / "one-again.txt", "one");
  write_file(ws / "folder" / "two.txt", "two");
  write_zip(ws / "input.zip", {
    file_entry("one.txt", "one"), file_entry("three.txt", "three"), file_entry("x/two.txt", "two")
  });

  auto options = session_options(ws);
  options.dry_run = true;
  ComparisonSession first(options, ctx.logger("session"));
  ComparisonSession second(options, ctx.logger("session"));
  auto a = first.run();
  auto b = second.run();

  bool ok = ctx.expect(a.plan.size() == b.plan.size(), "same record count");
  for(std::size_t i = 0; ok && i < a.plan.size(); ++i) {
    ok &= ctx.expect(a.plan[i].archive_identifier == b.plan[i].archive_identifier &&
                     a.plan[i].outcome == b.plan[i].outcome &&
                     a.plan[i].matched_identifier == b.plan[i].matched_identifier,
                     "record " + a.plan[i].archive_identifier + " differs between runs");
  }
  const auto* one = find_record(a.plan, "one.txt");
  ok &= ctx.expect(one && one->matched_identifier == (ws / "folder" / "dup" / "one-again.txt").generic_string(),
                   "tie broken towards smallest path");
  return ok;
}

bool test_session_dry_run(TestContext& ctx) {
  TempWorkspace ws("dry_run");
  fs::create_directories(ws / "folder");
  write_zip(ws / "input.zip", {file_entry("x.txt", "data")});

  auto options = session_options(ws);
  options.dry_run = true;
  ComparisonSession session(options, ctx.logger("session"));
  auto result = session.run();
  bool ok = ctx.expect(!result.extraction_ran, "extraction skipped");
  ok &= ctx.expect(result.summary.uniques == 1, "still classified");
  ok &= ctx.expect(!fs::exists(ws / "out"), "output untouched");
  return ok;
}

bool test_session_corrupt_archive_is_fatal(TestContext& ctx) {
  TempWorkspace ws("session_corrupt");
  write_file(ws / "folder" / "a.txt", "hello");
  write_file(ws / "input.zip", "PK but not really");

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  try {
    session.run();
  } catch(const ArchiveError&) {
    return ctx.expect(!fs::exists(ws / "out"), "no partial output");
  }
  return ctx.expect(false, "corrupt archive produced a result");
}

bool test_session_cancelled_produces_no_result(TestContext& ctx) {
  TempWorkspace ws("session_cancel");
  write_file(ws / "folder" / "a.txt", "hello");
  write_zip(ws / "input.zip", {file_entry("b.txt", "world")});

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  session.cancel();
  try {
    session.run();
  } catch(const OperationCancelled&) {
    return ctx.expect(!fs::exists(ws / "out" / "b.txt"), "nothing extracted");
  }
  return ctx.expect(false, "cancelled session completed");
}

bool test_json_report(TestContext& ctx) {
  TempWorkspace ws("json");
  write_file(ws / "folder" / "a.txt", "hello");
  write_zip(ws / "input.zip", {file_entry("a.txt", "hello"), file_entry("b.txt", "world")});

  ComparisonSession session(session_options(ws), ctx.logger("session"));
  auto result = session.run();
  auto logger = ctx.logger("report");
  bool ok = ctx.expect(write_json_report(result, ws / "report" / "result.json", logger.get()), "report written");

  auto doc = nlohmann::json::parse(read_file(ws / "report" / "result.json"));
  ok &= ctx.expect(doc["summary"]["duplicates"] == 1 && doc["summary"]["unique"] == 1, "summary counts");
  ok &= ctx.expect(doc["classification"].size() == 2, "every record present");
  ok &= ctx.expect(doc["classification"][0]["entry"] == "a.txt" &&
                   doc["classification"][0]["outcome"] == "duplicate" &&
                   doc["classification"][0]["sha256"] == kSha256Hello, "duplicate record");
  ok &= ctx.expect(doc["extraction"]["written"] == nlohmann::json::array({"b.txt"}), "written list");
  ok &= ctx.expect(doc["combined_bytes"] == 15, "combined bytes");
  return ok;
}

// ---- Settings, CLI, utilities ---------------------------------------------

bool test_command_line_parsing(TestContext& ctx) {
  SettingsManager settings;
  CommandLineParser parser("archdiff");
  const char* argv[] = {"archdiff", "/data/folder", "/data/in.zip", "/data/out",
                        "--workers", "3", "-n", "--on_error=abort", "-cs", "4096"};
  parser.parse(static_cast<int>(std::size(argv)), argv, settings);

  bool ok = ctx.expect(settings.get<std::string>("folder") == "/data/folder", "folder positional");
  ok &= ctx.expect(settings.get<std::string>("archive") == "/data/in.zip", "archive positional");
  ok &= ctx.expect(settings.get<std::string>("output") == "/data/out", "output positional");
  ok &= ctx.expect(settings.get<int>("workers") == 3, "workers");
  ok &= ctx.expect(settings.get<bool>("dry_run"), "bare bool alias");
  ok &= ctx.expect(settings.get<std::string>("on_error") == "abort", "inline value");
  ok &= ctx.expect(settings.get<int>("chunk_size") == 4096, "alias with value");

  auto rejects = [&](std::vector<const char*> args) {
    SettingsManager fresh;
    try {
      parser.parse(static_cast<int>(args.size()), args.data(), fresh);
    } catch(const UsageError&) {
      return true;
    }
    return false;
  };
  ok &= ctx.expect(rejects({"archdiff", "--on_error", "maybe"}), "bad choice rejected");
  ok &= ctx.expect(rejects({"archdiff", "--chunk_size", "0"}), "chunk size below minimum rejected");
  ok &= ctx.expect(rejects({"archdiff", "--bogus", "1"}), "unknown option rejected");
  ok &= ctx.expect(rejects({"archdiff", "a", "b", "c", "d"}), "extra positional rejected");
  ok &= ctx.expect(rejects({"archdiff", "--workers"}), "missing value rejected");
  return ok;
}

bool test_settings_round_trip(TestContext& ctx) {
  TempWorkspace ws("settings");
  SettingsManager settings;
  std::string error;
  bool ok = ctx.expect(settings.set_from_string("workers", "6", error), "set workers");
  ok &= ctx.expect(settings.set_from_string("archive", "/tmp/a.zip", error), "set archive");
  ok &= ctx.expect(settings.set_from_json("progress", false, error), "set progress");
  ok &= ctx.expect(settings.save_to_file(ws / ".config" / "archdiff.json"), "saved");

  SettingsManager loaded;
  ok &= ctx.expect(loaded.load_from_file(ws / ".config" / "archdiff.json"), "loaded");
  ok &= ctx.expect(loaded.get<int>("workers") == 6, "persistent int restored");
  ok &= ctx.expect(!loaded.get<bool>("progress"), "persistent bool restored");
  ok &= ctx.expect(loaded.get<std::string>("archive").empty(), "non-persistent key not saved");
  return ok;
}

bool test_safe_relative_path(TestContext& ctx) {
  bool ok = ctx.expect(!safe_relative_path("../x"), "parent escape");
  ok &= ctx.expect(!safe_relative_path("a/../../x"), "nested escape");
  ok &= ctx.expect(!safe_relative_path("/etc/passwd"), "absolute");
  ok &= ctx.expect(!safe_relative_path(""), "empty");
  auto clean = safe_relative_path("dir/./file.txt");
  ok &= ctx.expect(clean && clean->generic_string() == "dir/file.txt", "dot segments dropped");
  return ok;
}

bool test_format_helpers(TestContext& ctx) {
  bool ok = ctx.expect(format_size(512) == "512 B", "bytes");
  ok &= ctx.expect(format_size(1536) == "1.50 KB", "kilobytes");
  ok &= ctx.expect(format_size(3ull * 1024 * 1024 * 1024) == "3.00 GB", "gigabytes");
  ok &= ctx.expect(format_duration(std::chrono::seconds(3725)) == "1h 2m 5s", "duration");
  return ok;
}

bool test_logger_counts_warnings(TestContext& ctx) {
  auto logger = ctx.logger("counter");
  logger->warn("first {}", 1);
  logger->info("not counted");
  logger->warn("second {}", 2);
  bool ok = ctx.expect(logger->warning_count() == 2, "warnings counted");
  ok &= ctx.expect(ctx.logs.contains("counter:warn: second 2"), "channel label carries logger name");
  logger->reset_counters();
  ok &= ctx.expect(logger->warning_count() == 0, "counter reset");
  return ok;
}

bool test_progress_reporter(TestContext& ctx) {
  ProgressState progress;
  progress.reset(ProgressPhase::HashingArchive, 200);
  progress.add_bytes(50);
  progress.set_current("entry.bin");

  std::mutex mutex;
  int periodic = 0;
  int finals = 0;
  ProgressSnapshot last;
  {
    ProgressReporter reporter(progress, std::chrono::milliseconds(10),
      [&](const ProgressSnapshot& snap, bool final_update){
        std::lock_guard<std::mutex> lock(mutex);
        if(final_update) ++finals; else ++periodic;
        last = snap;
      });
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    reporter.stop();
  }
  bool ok = ctx.expect(finals == 1, "exactly one final update");
  ok &= ctx.expect(periodic >= 1, "periodic updates delivered");
  ok &= ctx.expect(last.processed_bytes == 50 && last.percent() == 25.0, "snapshot values");
  ok &= ctx.expect(last.current == "entry.bin" && last.phase == ProgressPhase::HashingArchive, "snapshot labels");
  return ok;
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("ARCHDIFF_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  init(verbose);
  const bool suppress_logs = !verbose && std::getenv("ARCHDIFF_TEST_LOGS") == nullptr;
  if(suppress_logs) {
    set_log_passthrough(false);
  }

  archdiff::test::LogCapture logs;
  std::vector<TestCase> tests = {
    {"hasher_known_vectors", test_hasher_known_vectors},
    {"hasher_chunk_size_independent", test_hasher_chunk_size_independent},
    {"hasher_counts_progress", test_hasher_counts_progress},
    {"hasher_propagates_read_failure", test_hasher_propagates_read_failure},
    {"hasher_stops_when_cancelled", test_hasher_stops_when_cancelled},
    {"tree_indexes_regular_files", test_tree_indexes_regular_files},
    {"tree_skips_vanished_files", test_tree_skips_vanished_files},
    {"tree_bounded_pool", test_tree_bounded_pool},
    {"tree_follows_symlinks_without_looping", test_tree_follows_symlinks_without_looping},
    {"tree_rejects_missing_root", test_tree_rejects_missing_root},
    {"sizing_pass_honours_cancellation", test_sizing_pass_honours_cancellation},
    {"archive_skips_directory_entries", test_archive_skips_directory_entries},
    {"archive_rejects_corrupt_archive", test_archive_rejects_corrupt_archive},
    {"archive_symlink_hashed_as_target", test_archive_symlink_hashed_as_target},
    {"archive_repeated_name_keeps_last_copy", test_archive_repeated_name_keeps_last_copy},
    {"scenario_duplicate_and_unique", test_scenario_duplicate_and_unique},
    {"scenario_empty_folder", test_scenario_empty_folder},
    {"scenario_directory_only_archive", test_scenario_directory_only_archive},
    {"diff_tie_break_is_deterministic", test_diff_tie_break_is_deterministic},
    {"diff_counts_cover_every_entry", test_diff_counts_cover_every_entry},
    {"diff_uses_content_not_name_or_size", test_diff_uses_content_not_name_or_size},
    {"extractor_writes_exactly_unique_set", test_extractor_writes_exactly_unique_set},
    {"extractor_rejects_unsafe_paths", test_extractor_rejects_unsafe_paths},
    {"extractor_abort_policy", test_extractor_abort_policy},
    {"extractor_reports_missing_entries", test_extractor_reports_missing_entries},
    {"extractor_rejects_colliding_paths", test_extractor_rejects_colliding_paths},
    {"extractor_cancel_leaves_no_partial_file", test_extractor_cancel_leaves_no_partial_file},
    {"session_is_idempotent", test_session_is_idempotent},
    {"session_dry_run", test_session_dry_run},
    {"session_corrupt_archive_is_fatal", test_session_corrupt_archive_is_fatal},
    {"session_cancelled_produces_no_result", test_session_cancelled_produces_no_result},
    {"json_report", test_json_report},
    {"command_line_parsing", test_command_line_parsing},
    {"settings_round_trip", test_settings_round_trip},
    {"safe_relative_path", test_safe_relative_path},
    {"format_helpers", test_format_helpers},
    {"logger_counts_warnings", test_logger_counts_warnings},
    {"progress_reporter", test_progress_reporter}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " archdiff tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    TestContext ctx{logs, verbose, {}};
    bool passed = false;
    try {
      passed = test.fn(ctx) && ctx.failures.empty();
    } catch(const std::exception& e) {
      passed = false;
      ctx.failures.push_back(std::string("exception: ") + e.what());
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& failure : ctx.failures) {
        std::cout << "    expected: " << failure << "\n";
      }
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " archdiff tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

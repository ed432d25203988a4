#include "tree_fingerprinter.hpp"

#include <asio.hpp>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

TreeFingerprinter::TreeFingerprinter(const ContentHasher& hasher,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : hasher_(hasher),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tree")) {}

std::size_t TreeFingerprinter::worker_count() const {
  if(options_.max_workers > 0) return options_.max_workers;
  return std::max(1u, std::thread::hardware_concurrency());
}

std::size_t TreeFingerprinter::pending_limit() const {
  if(options_.max_pending > 0) return options_.max_pending;
  return worker_count() * 4;
}

TreeListing TreeFingerprinter::list(const fs::path& root) const {
  std::error_code ec;
  if(!fs::is_directory(root, ec)) {
    throw std::runtime_error("Not a readable directory: " + root.string());
  }

  TreeListing listing;
  listing.root = root;

  std::set<fs::path> visited_dirs;
  auto canonical_root = fs::canonical(root, ec);
  if(!ec) visited_dirs.insert(canonical_root);

  const auto walk_options = fs::directory_options::follow_directory_symlink |
                            fs::directory_options::skip_permission_denied;
  fs::recursive_directory_iterator it(root, walk_options, ec);
  if(ec) {
    throw std::runtime_error("Unable to walk " + root.string() + ": " + ec.message());
  }

  const CancelToken* cancel = hasher_.cancel_token();
  fs::recursive_directory_iterator end;
  for(; it != end; it.increment(ec)) {
    if(cancel) cancel->throw_if_cancelled();
    if(ec) {
      logger_->warn("Stopped walking {}: {}", root.string(), ec.message());
      break;
    }
    const auto& entry = *it;
    std::error_code entry_ec;
    if(entry.is_directory(entry_ec)) {
      // A symlinked directory that resolves somewhere already walked would
      // otherwise be entered again, forever in the case of a cycle.
      auto real = fs::canonical(entry.path(), entry_ec);
      if(entry_ec || !visited_dirs.insert(real).second) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if(!entry.is_regular_file(entry_ec)) {
      if(entry_ec) {
        logger_->warn("Could not access {}: {}", entry.path().string(), entry_ec.message());
      }
      continue;
    }
    auto size = fs::file_size(entry.path(), entry_ec);
    if(entry_ec) {
      logger_->warn("Could not access {}: {}", entry.path().string(), entry_ec.message());
      continue;
    }
    listing.files.push_back(entry.path());
    listing.total_bytes += size;
  }
  logger_->debug("Listed {} files ({} bytes) under {}",
                 listing.files.size(), listing.total_bytes, root.string());
  return listing;
}

FingerprintIndex TreeFingerprinter::scan(const fs::path& root) const {
  return scan(list(root));
}

FingerprintIndex TreeFingerprinter::scan(const TreeListing& listing) const {
  const CancelToken* cancel = hasher_.cancel_token();
  ProgressState* progress = hasher_.progress();
  const std::size_t limit = pending_limit();

  FingerprintIndex index;
  std::mutex index_mutex;

  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::size_t pending = 0;

  asio::thread_pool pool(worker_count());

  auto hash_one = [&](const fs::path& file) {
    if(cancel && cancel->cancelled()) return;
    const auto identifier = file.generic_string();
    try {
      if(progress) progress->set_current(identifier);
      auto result = hasher_.hash_file(file);
      FingerprintEntry entry{identifier, result.digest, result.bytes};
      std::lock_guard<std::mutex> lock(index_mutex);
      index.emplace(identifier, std::move(entry));
    } catch(const OperationCancelled&) {
      // The scan as a whole is abandoned below.
    } catch(const std::exception& e) {
      logger_->warn("Error processing {}: {}", identifier, e.what());
    }
  };

  for(const auto& file : listing.files) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex);
      queue_cv.wait(lock, [&]{
        return pending < limit || (cancel && cancel->cancelled());
      });
      if(cancel && cancel->cancelled()) break;
      ++pending;
    }
    asio::post(pool, [&, file]{
      hash_one(file);
      {
        std::lock_guard<std::mutex> lock(queue_mutex);
        --pending;
      }
      queue_cv.notify_one();
    });
  }
  pool.join();

  if(cancel) cancel->throw_if_cancelled();
  logger_->debug("Hashed {} of {} files under {}",
                 index.size(), listing.files.size(), listing.root.string());
  return index;
}

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

enum class ProgressPhase {
  Idle,
  Sizing,
  HashingFolder,
  HashingArchive,
  Extracting
};

const char* phase_label(ProgressPhase phase);

struct ProgressSnapshot {
  ProgressPhase phase = ProgressPhase::Idle;
  uint64_t processed_bytes = 0;
  uint64_t total_bytes = 0;
  std::string current;
  std::chrono::steady_clock::duration elapsed{};

  double percent() const;
  double bytes_per_second() const;
  // Zero until some bytes have been processed.
  std::chrono::steady_clock::duration eta() const;
};

// Shared between hashing workers (writers) and a reporter (reader). Byte
// counts are relaxed: a momentary undercount only skews the displayed ETA.
class ProgressState {
public:
  void reset(ProgressPhase phase, uint64_t total_bytes);
  void add_bytes(uint64_t bytes) { processed_.fetch_add(bytes, std::memory_order_relaxed); }
  void set_current(const std::string& identifier);

  uint64_t processed_bytes() const { return processed_.load(std::memory_order_relaxed); }
  uint64_t total_bytes() const { return total_.load(std::memory_order_relaxed); }

  ProgressSnapshot snapshot() const;

private:
  std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> total_{0};
  mutable std::mutex mutex_;
  ProgressPhase phase_ = ProgressPhase::Idle;
  std::string current_;
  std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
};

class ProgressReporter {
public:
  // final_update is true exactly once, for the snapshot taken by stop().
  using Callback = std::function<void(const ProgressSnapshot& snapshot, bool final_update)>;

  ProgressReporter(const ProgressState& state,
                   std::chrono::milliseconds interval,
                   Callback callback);
  ~ProgressReporter();

  ProgressReporter(const ProgressReporter&) = delete;
  ProgressReporter& operator=(const ProgressReporter&) = delete;

  void stop();

private:
  void run();

  const ProgressState& state_;
  std::chrono::milliseconds interval_;
  Callback callback_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
  bool stopped_ = false;
  std::thread thread_;
};

#include "progress.hpp"

#include <algorithm>

const char* phase_label(ProgressPhase phase) {
  switch(phase) {
    case ProgressPhase::Idle: return "idle";
    case ProgressPhase::Sizing: return "sizing";
    case ProgressPhase::HashingFolder: return "scanning folder";
    case ProgressPhase::HashingArchive: return "scanning archive";
    case ProgressPhase::Extracting: return "extracting";
  }
  return "idle";
}

double ProgressSnapshot::percent() const {
  if(total_bytes == 0) return 0.0;
  double value = static_cast<double>(processed_bytes) * 100.0 / static_cast<double>(total_bytes);
  return std::min(value, 100.0);
}

double ProgressSnapshot::bytes_per_second() const {
  double seconds = std::chrono::duration<double>(elapsed).count();
  if(seconds <= 0.0) return 0.0;
  return static_cast<double>(processed_bytes) / seconds;
}

std::chrono::steady_clock::duration ProgressSnapshot::eta() const {
  double speed = bytes_per_second();
  if(processed_bytes == 0 || speed <= 0.0 || processed_bytes >= total_bytes) {
    return std::chrono::steady_clock::duration::zero();
  }
  double remaining = static_cast<double>(total_bytes - processed_bytes) / speed;
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
    std::chrono::duration<double>(remaining));
}

void ProgressState::reset(ProgressPhase phase, uint64_t total_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  processed_.store(0, std::memory_order_relaxed);
  total_.store(total_bytes, std::memory_order_relaxed);
  phase_ = phase;
  current_.clear();
  start_ = std::chrono::steady_clock::now();
}

void ProgressState::set_current(const std::string& identifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = identifier;
}

ProgressSnapshot ProgressState::snapshot() const {
  ProgressSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snap.phase = phase_;
    snap.current = current_;
    snap.elapsed = std::chrono::steady_clock::now() - start_;
  }
  snap.processed_bytes = processed_bytes();
  snap.total_bytes = total_bytes();
  return snap;
}

ProgressReporter::ProgressReporter(const ProgressState& state,
                                   std::chrono::milliseconds interval,
                                   Callback callback)
  : state_(state),
    interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(250)),
    callback_(std::move(callback)) {
  if(callback_) {
    thread_ = std::thread([this](){ run(); });
  }
}

ProgressReporter::~ProgressReporter() {
  stop();
}

void ProgressReporter::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while(!stopping_) {
    if(cv_.wait_for(lock, interval_, [this]{ return stopping_; })) break;
    lock.unlock();
    callback_(state_.snapshot(), false);
    lock.lock();
  }
}

void ProgressReporter::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(stopped_) return;
    stopped_ = true;
    stopping_ = true;
  }
  cv_.notify_all();
  if(thread_.joinable()) thread_.join();
  if(callback_) callback_(state_.snapshot(), true);
}

#pragma once

#include <atomic>
#include <stdexcept>

// Thrown at the next chunk boundary once a run has been cancelled.
class OperationCancelled : public std::runtime_error {
public:
  OperationCancelled() : std::runtime_error("operation cancelled") {}
};

class CancelToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  void reset() { cancelled_.store(false, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  void throw_if_cancelled() const {
    if(cancelled()) throw OperationCancelled();
  }

private:
  std::atomic<bool> cancelled_{false};
};

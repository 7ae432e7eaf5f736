#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace loglens_core {

// Cooperative cancellation flag shared between a build and whoever may stop it.
class CancellationToken {
 public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool is_cancelled() const {
    return cancelled_.load();
  }

  // Sleeps for up to `duration`, returning early (true) if cancelled meanwhile.
  bool wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
  }

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace loglens_core

#pragma once

#include <condition_variable>
#include <mutex>

namespace loglens_core {

// Bounds the number of in-flight provider calls. Callers that find no free slot block.
class RequestLimiter {
 public:
  class Slot {
   public:
    explicit Slot(RequestLimiter &limiter) : limiter_(limiter) {
      limiter_.acquire();
    }
    ~Slot() {
      limiter_.release();
    }

    Slot(const Slot &) = delete;
    Slot &operator=(const Slot &) = delete;

   private:
    RequestLimiter &limiter_;
  };

  explicit RequestLimiter(int max_concurrent);

  int in_flight() const;
  int max_concurrent() const {
    return max_concurrent_;
  }

 private:
  void acquire();
  void release();

  const int max_concurrent_;
  int in_flight_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace loglens_core

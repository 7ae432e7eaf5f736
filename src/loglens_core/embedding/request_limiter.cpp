#include "loglens_core/embedding/request_limiter.hpp"

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

RequestLimiter::RequestLimiter(int max_concurrent) : max_concurrent_(max_concurrent) {
  if (max_concurrent <= 0) {
    throw ConfigurationError("max_concurrent_requests must be greater than 0");
  }
}

void RequestLimiter::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return in_flight_ < max_concurrent_; });
  ++in_flight_;
}

void RequestLimiter::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
  }
  cv_.notify_one();
}

int RequestLimiter::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

}  // namespace loglens_core

#include "runner/cancellation.hpp"

namespace ov_bench::runner {

void CancellationToken::request() {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    requested_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::requested() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return requested_;
}

bool CancellationToken::wait_for(const std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(mutex_);
  if (duration.count() <= 0) {
    return !requested_;
  }
  return !cv_.wait_for(lock, duration, [this] { return requested_; });
}

}  // namespace ov_bench::runner

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ov_bench::runner {

// One-shot stop flag shared by every worker of a run. Waits on it wake early
// once a stop is requested.
class CancellationToken {
 public:
  void request();
  bool requested() const;

  // Sleeps up to `duration`; returns false when woken by a stop request.
  bool wait_for(std::chrono::milliseconds duration) const;

 private:
  mutable std::mutex mutex_{};
  mutable std::condition_variable cv_{};
  bool requested_{false};
};

}  // namespace ov_bench::runner

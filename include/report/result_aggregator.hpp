#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "model/records.hpp"

namespace ov_bench::report {

// Append-only collector shared by the device workers.
class ResultAggregator {
 public:
  void append(model::result_record record);

  std::size_t size() const;

  // Records stably sorted by expansion index.
  std::vector<model::result_record> finalize() const;

 private:
  mutable std::mutex mutex_{};
  std::vector<model::result_record> records_{};
};

// Combines the pieces of one invocation and derives its terminal state and
// failure kind. Records of failed executions keep only the error line of
// their metrics.
model::result_record make_result_record(const model::invocation_spec& spec, model::execution_outcome outcome,
                                        model::metrics_record metrics, model::device_info device,
                                        std::uint64_t started_unix_ms, std::uint64_t finished_unix_ms);

}  // namespace ov_bench::report

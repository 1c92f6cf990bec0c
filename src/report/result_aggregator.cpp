#include "report/result_aggregator.hpp"

#include <algorithm>
#include <utility>

namespace ov_bench::report {

using model::execution_status;
using model::failure_kind;
using model::run_state;

void ResultAggregator::append(model::result_record record) {
  const std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(std::move(record));
}

std::size_t ResultAggregator::size() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::vector<model::result_record> ResultAggregator::finalize() const {
  std::vector<model::result_record> out;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    out = records_;
  }
  std::stable_sort(out.begin(), out.end(), [](const model::result_record& lhs, const model::result_record& rhs) {
    return lhs.spec.index < rhs.spec.index;
  });
  return out;
}

model::result_record make_result_record(const model::invocation_spec& spec, model::execution_outcome outcome,
                                        model::metrics_record metrics, model::device_info device,
                                        const std::uint64_t started_unix_ms, const std::uint64_t finished_unix_ms) {
  model::result_record record{};
  record.spec = spec;
  record.device = std::move(device);
  record.started_unix_ms = started_unix_ms;
  record.finished_unix_ms = finished_unix_ms;

  if (outcome.status == execution_status::SUCCESS && !metrics.error_line.empty()) {
    outcome.status = execution_status::PROCESS_ERROR;
    if (outcome.message.empty()) {
      outcome.message = metrics.error_line;
    }
  }

  switch (outcome.status) {
    case execution_status::SUCCESS:
      if (metrics.status == model::parse_status::FAILED) {
        record.state = run_state::FAILED;
        record.failure = failure_kind::PARSE_FAILURE;
        if (outcome.message.empty()) {
          outcome.message = "no throughput line in benchmark output";
        }
      } else {
        record.state = run_state::SUCCEEDED;
        record.failure = failure_kind::NONE;
      }
      break;
    case execution_status::TIMEOUT:
      record.state = run_state::TIMED_OUT;
      record.failure = failure_kind::TIMEOUT;
      break;
    case execution_status::PROCESS_ERROR:
      record.state = run_state::FAILED;
      record.failure = failure_kind::PROCESS_ERROR;
      break;
    case execution_status::DEVICE_UNREACHABLE:
      record.state = run_state::FAILED;
      record.failure = failure_kind::DEVICE_UNREACHABLE;
      break;
    case execution_status::DEVICE_NOT_FOUND:
      record.state = run_state::FAILED;
      record.failure = failure_kind::DEVICE_NOT_FOUND;
      break;
    case execution_status::CANCELLED:
      record.state = run_state::FAILED;
      record.failure = failure_kind::CANCELLED;
      break;
  }

  if (outcome.status != execution_status::SUCCESS) {
    model::metrics_record cleared{};
    cleared.error_line = std::move(metrics.error_line);
    metrics = std::move(cleared);
  }

  record.outcome = std::move(outcome);
  record.metrics = std::move(metrics);
  return record;
}

}  // namespace ov_bench::report

#include "sinks/stdout_report.hpp"

#include <limits>

namespace ov_bench::sinks {

namespace {

double or_nan(const std::optional<double>& value) { return value ? *value : std::numeric_limits<double>::quiet_NaN(); }

}  // namespace

void StdoutReportSink::publish(const std::vector<model::result_record>& records) const {
  for (const auto& record : records) {
    const auto& spec = record.spec;
    const auto& metrics = record.metrics;
    if (record.state == model::run_state::SUCCEEDED) {
      std::fprintf(out_, "[result] #%zu %s %s t=%u s=%u %s b=%u r=%u throughput_fps=%.2f latency_avg_ms=%.2f\n",
                   spec.index, spec.device_id.c_str(), spec.model_name.c_str(), spec.threads, spec.streams,
                   spec.precision.c_str(), spec.batch, spec.repeat_index, or_nan(metrics.throughput_fps),
                   or_nan(metrics.latency_avg_ms));
    } else {
      std::fprintf(out_, "[result] #%zu %s %s t=%u s=%u %s b=%u r=%u %s (%s) attempts=%u\n", spec.index,
                   spec.device_id.c_str(), spec.model_name.c_str(), spec.threads, spec.streams,
                   spec.precision.c_str(), spec.batch, spec.repeat_index, model::to_string(record.state),
                   model::to_string(record.failure), record.outcome.attempts);
    }
  }
  std::fflush(out_);
}

void StdoutReportSink::publish_summary(const std::vector<report::config_summary>& summaries) const {
  for (const auto& summary : summaries) {
    std::fprintf(out_,
                 "[summary] %s %s t=%u s=%u %s b=%u ok=%zu/%zu throughput_fps mean=%.2f median=%.2f min=%.2f "
                 "max=%.2f latency_avg_ms mean=%.2f\n",
                 summary.device_id.c_str(), summary.model_name.c_str(), summary.threads, summary.streams,
                 summary.precision.c_str(), summary.batch, summary.succeeded, summary.runs,
                 or_nan(summary.throughput_mean_fps), or_nan(summary.throughput_median_fps),
                 or_nan(summary.throughput_min_fps), or_nan(summary.throughput_max_fps),
                 or_nan(summary.latency_avg_mean_ms));
  }
  std::fflush(out_);
}

}  // namespace ov_bench::sinks

#include "report/summary.hpp"

#include <map>
#include <tuple>

#include "core/math.hpp"

namespace ov_bench::report {

namespace {

using GroupKey = std::tuple<std::string, std::string, std::uint32_t, std::uint32_t, std::string, std::uint32_t>;

GroupKey key_of(const model::invocation_spec& spec) {
  return {spec.device_id, spec.model_name, spec.threads, spec.streams, spec.precision, spec.batch};
}

struct Samples {
  std::vector<double> throughput{};
  std::vector<double> latency_avg{};
};

}  // namespace

std::vector<config_summary> summarize(const std::vector<model::result_record>& records) {
  std::vector<config_summary> out;
  std::vector<Samples> samples;
  std::map<GroupKey, std::size_t> positions;

  for (const auto& record : records) {
    const auto key = key_of(record.spec);
    auto it = positions.find(key);
    if (it == positions.end()) {
      config_summary summary{};
      summary.device_id = record.spec.device_id;
      summary.model_name = record.spec.model_name;
      summary.threads = record.spec.threads;
      summary.streams = record.spec.streams;
      summary.precision = record.spec.precision;
      summary.batch = record.spec.batch;
      out.push_back(summary);
      samples.emplace_back();
      it = positions.emplace(key, out.size() - 1).first;
    }

    auto& summary = out[it->second];
    auto& group = samples[it->second];
    ++summary.runs;
    if (record.state != model::run_state::SUCCEEDED) {
      ++summary.failed;
      continue;
    }

    ++summary.succeeded;
    if (record.metrics.throughput_fps) {
      group.throughput.push_back(*record.metrics.throughput_fps);
    }
    if (record.metrics.latency_avg_ms) {
      group.latency_avg.push_back(*record.metrics.latency_avg_ms);
    }
  }

  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i].throughput_mean_fps = core::mean(samples[i].throughput);
    out[i].throughput_median_fps = core::median(samples[i].throughput);
    out[i].throughput_min_fps = core::min_of(samples[i].throughput);
    out[i].throughput_max_fps = core::max_of(samples[i].throughput);
    out[i].latency_avg_mean_ms = core::mean(samples[i].latency_avg);
    out[i].latency_avg_median_ms = core::median(samples[i].latency_avg);
  }

  return out;
}

}  // namespace ov_bench::report

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/records.hpp"

namespace ov_bench::report {

// Statistics across the repeats of one matrix configuration.
struct config_summary {
  std::string device_id{};
  std::string model_name{};
  std::uint32_t threads{0};
  std::uint32_t streams{0};
  std::string precision{};
  std::uint32_t batch{0};
  std::size_t runs{0};
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::optional<double> throughput_mean_fps{};
  std::optional<double> throughput_median_fps{};
  std::optional<double> throughput_min_fps{};
  std::optional<double> throughput_max_fps{};
  std::optional<double> latency_avg_mean_ms{};
  std::optional<double> latency_avg_median_ms{};
};

// Groups by every spec field except index and repeat_index, in first-seen
// order. Only succeeded records contribute to the statistics.
std::vector<config_summary> summarize(const std::vector<model::result_record>& records);

}  // namespace ov_bench::report

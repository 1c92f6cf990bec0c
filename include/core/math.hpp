#pragma once

#include <algorithm>
#include <numeric>
#include <optional>
#include <vector>

namespace ov_bench::core {

inline std::optional<double> mean(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Even-sized inputs average the two middle values.
inline std::optional<double> median(std::vector<double> values) {
  if (values.empty()) {
    return std::nullopt;
  }
  std::sort(values.begin(), values.end());
  const auto mid = values.size() / 2;
  if (values.size() % 2 == 0) {
    return (values[mid - 1] + values[mid]) / 2.0;
  }
  return values[mid];
}

inline std::optional<double> min_of(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return *std::min_element(values.begin(), values.end());
}

inline std::optional<double> max_of(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return *std::max_element(values.begin(), values.end());
}

}  // namespace ov_bench::core

#include "parsers/benchmark_parser.hpp"

#include <cmath>
#include <cstdlib>
#include <optional>
#include <regex>
#include <sstream>
#include <string>

namespace ov_bench::parsers {

namespace {

std::optional<double> parse_double(const std::string& value) noexcept {
  const char* begin = value.c_str();
  char* end = nullptr;
  const double parsed = std::strtod(begin, &end);
  if (end == begin || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double>* latency_slot(model::metrics_record& metrics, const std::string& label) {
  if (label == "Average") {
    return &metrics.latency_avg_ms;
  }
  if (label == "Median") {
    return &metrics.latency_median_ms;
  }
  if (label == "Min") {
    return &metrics.latency_min_ms;
  }
  if (label == "Max") {
    return &metrics.latency_max_ms;
  }
  return nullptr;
}

void parse_line(const std::string& line, model::metrics_record& metrics, bool& in_latency_block) {
  static const std::regex throughput_re(R"(Throughput:\s*([0-9]+(?:\.[0-9]+)?)\s*FPS)");
  // Pre-2022 layout: "Average latency: 12.3 ms".
  static const std::regex legacy_latency_re(R"((Average|Median|Min|Max) latency:\s*([0-9]+(?:\.[0-9]+)?)\s*ms)");
  // Current layout: a "Latency:" header followed by indented figures.
  static const std::regex latency_header_re(R"(^(?:\[ INFO \])?\s*Latency:\s*$)");
  static const std::regex block_latency_re(R"(^(?:\[ INFO \])?\s+(Average|Median|Min|Max):\s*([0-9]+(?:\.[0-9]+)?)\s*ms)");
  static const std::regex count_re(R"(Count:\s*([0-9]+)\s*iterations)");
  static const std::regex duration_re(R"(Duration:\s*([0-9]+(?:\.[0-9]+)?)\s*ms)");
  static const std::regex max_rss_re(R"(Maximum resident set size \(kbytes\):\s*([0-9]+))");
  static const std::regex cpu_percent_re(R"(Percent of CPU this job got:\s*([0-9]+)%)");
  static const std::regex error_re(R"(^\s*\[ ERROR \]\s*(.*)$)");

  std::smatch match;

  if (std::regex_search(line, match, latency_header_re)) {
    in_latency_block = true;
    return;
  }

  // The block stays open across unrecognized noise; the next recognized
  // metric line closes it.
  if (in_latency_block && std::regex_search(line, match, block_latency_re) && match.size() >= 3) {
    if (auto* slot = latency_slot(metrics, match[1].str())) {
      *slot = parse_double(match[2].str());
    }
    return;
  }

  if (std::regex_search(line, match, throughput_re) && match.size() >= 2) {
    metrics.throughput_fps = parse_double(match[1].str());
    in_latency_block = false;
    return;
  }

  if (std::regex_search(line, match, legacy_latency_re) && match.size() >= 3) {
    if (auto* slot = latency_slot(metrics, match[1].str())) {
      *slot = parse_double(match[2].str());
    }
    in_latency_block = false;
    return;
  }

  if (std::regex_search(line, match, count_re) && match.size() >= 2) {
    metrics.iterations = std::strtoull(match[1].str().c_str(), nullptr, 10);
    in_latency_block = false;
    return;
  }

  if (std::regex_search(line, match, duration_re) && match.size() >= 2) {
    metrics.duration_ms = parse_double(match[1].str());
    in_latency_block = false;
    return;
  }

  if (std::regex_search(line, match, max_rss_re) && match.size() >= 2) {
    if (const auto kb = parse_double(match[1].str())) {
      metrics.peak_memory_mb = *kb / 1024.0;
    }
    return;
  }

  if (std::regex_search(line, match, cpu_percent_re) && match.size() >= 2) {
    metrics.cpu_utilization_pct = parse_double(match[1].str());
    return;
  }

  if (metrics.error_line.empty() && std::regex_search(line, match, error_re) && match.size() >= 2) {
    metrics.error_line = match[1].str();
  }
}

void parse_stream(const std::string& text, model::metrics_record& metrics) {
  std::istringstream input(text);
  std::string line;
  bool in_latency_block = false;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    parse_line(line, metrics, in_latency_block);
  }
}

}  // namespace

model::metrics_record parse_benchmark_output(const std::string& stdout_text, const std::string& stderr_text) {
  model::metrics_record metrics{};
  parse_stream(stdout_text, metrics);
  parse_stream(stderr_text, metrics);

  if (!metrics.throughput_fps.has_value()) {
    model::metrics_record failed{};
    failed.status = model::parse_status::FAILED;
    failed.error_line = metrics.error_line;
    return failed;
  }

  const bool all_latencies = metrics.latency_avg_ms.has_value() && metrics.latency_median_ms.has_value() &&
                             metrics.latency_min_ms.has_value() && metrics.latency_max_ms.has_value();
  metrics.status = all_latencies ? model::parse_status::OK : model::parse_status::PARTIAL;
  return metrics;
}

}  // namespace ov_bench::parsers

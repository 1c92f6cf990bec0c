#include "sinks/csv_report.hpp"

#include <cstdio>
#include <optional>
#include <sstream>
#include <utility>

#include "core/atomic_file.hpp"
#include "core/timestamp.hpp"

namespace ov_bench::sinks {

namespace {

std::string cell(const std::optional<double>& value) {
  if (!value) {
    return {};
  }
  char buffer[64]{};
  std::snprintf(buffer, sizeof(buffer), "%.3f", *value);
  return buffer;
}

std::string cell(const std::optional<std::uint64_t>& value) {
  return value ? std::to_string(*value) : std::string{};
}

}  // namespace

const std::vector<std::string>& csv_columns() {
  static const std::vector<std::string> kColumns = {
      "index",          "device_id",         "model_name",       "threads",
      "streams",        "precision",         "batch",            "repeat_index",
      "state",          "failure",           "status",           "exit_code",
      "attempts",       "duration_s",        "parse_status",     "throughput_fps",
      "latency_avg_ms", "latency_median_ms", "latency_min_ms",   "latency_max_ms",
      "iterations",     "duration_ms",       "cpu_utilization_pct", "peak_memory_mb",
      "device_model",   "device_os",         "device_os_version", "started_at",
      "finished_at",    "message",
  };
  return kColumns;
}

std::vector<std::string> csv_row(const model::result_record& record) {
  const auto& spec = record.spec;
  const auto& outcome = record.outcome;
  const auto& metrics = record.metrics;

  std::string message = outcome.message;
  if (message.empty()) {
    message = metrics.error_line;
  }

  return {
      std::to_string(spec.index),
      spec.device_id,
      spec.model_name,
      std::to_string(spec.threads),
      std::to_string(spec.streams),
      spec.precision,
      std::to_string(spec.batch),
      std::to_string(spec.repeat_index),
      model::to_string(record.state),
      model::to_string(record.failure),
      model::to_string(outcome.status),
      std::to_string(outcome.exit_code),
      std::to_string(outcome.attempts),
      cell(std::optional<double>(outcome.duration_s)),
      model::to_string(metrics.status),
      cell(metrics.throughput_fps),
      cell(metrics.latency_avg_ms),
      cell(metrics.latency_median_ms),
      cell(metrics.latency_min_ms),
      cell(metrics.latency_max_ms),
      cell(metrics.iterations),
      cell(metrics.duration_ms),
      cell(metrics.cpu_utilization_pct),
      cell(metrics.peak_memory_mb),
      record.device.model,
      record.device.os,
      record.device.os_version,
      core::format_utc_iso8601(record.started_unix_ms),
      core::format_utc_iso8601(record.finished_unix_ms),
      message,
  };
}

std::string csv_escape(const std::string& cell) {
  if (cell.find_first_of(",\"\r\n") == std::string::npos) {
    return cell;
  }
  std::string out = "\"";
  for (const char c : cell) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

CsvReportSink::CsvReportSink(std::string path, core::Logger& logger) : path_(std::move(path)), logger_(logger) {}

void CsvReportSink::write(const std::vector<model::result_record>& records) const {
  std::ostringstream out;
  const auto write_line = [&out](const std::vector<std::string>& cells) {
    for (std::size_t i = 0; i < cells.size(); ++i) {
      if (i != 0) {
        out << ',';
      }
      out << csv_escape(cells[i]);
    }
    out << '\n';
  };

  write_line(csv_columns());
  for (const auto& record : records) {
    write_line(csv_row(record));
  }

  core::write_file_atomic(path_, out.str());
  logger_.info("csv", "wrote " + std::to_string(records.size()) + " rows to " + path_);
}

}  // namespace ov_bench::sinks

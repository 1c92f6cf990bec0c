#include "sinks/json_report.hpp"

#include <optional>
#include <utility>

#include "core/atomic_file.hpp"
#include "core/timestamp.hpp"

namespace ov_bench::sinks {

namespace {

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

nlohmann::json device_to_json(const model::device_info& device) {
  nlohmann::json out{{"id", device.id},
                     {"address", device.address},
                     {"os", device.os},
                     {"os_version", device.os_version},
                     {"model", device.model},
                     {"abi", device.abi},
                     {"cpu", device.cpu},
                     {"memory_gb", optional_value(device.memory_gb)},
                     {"temperature_c", optional_value(device.temperature_c)}};
  out["properties"] = nlohmann::json::object();
  for (const auto& [key, value] : device.properties) {
    out["properties"][key] = value;
  }
  return out;
}

}  // namespace

nlohmann::json record_to_json(const model::result_record& record, const bool include_raw) {
  const auto& spec = record.spec;
  const auto& outcome = record.outcome;
  const auto& metrics = record.metrics;

  nlohmann::json attempts = nlohmann::json::array();
  for (const auto& attempt : outcome.prior_attempts) {
    attempts.push_back({{"status", model::to_string(attempt.status)},
                        {"exit_code", attempt.exit_code},
                        {"duration_s", attempt.duration_s},
                        {"message", attempt.message}});
  }

  nlohmann::json execution{{"status", model::to_string(outcome.status)},
                           {"exit_code", outcome.exit_code},
                           {"duration_s", outcome.duration_s},
                           {"attempts", outcome.attempts},
                           {"command", outcome.command},
                           {"message", outcome.message},
                           {"prior_attempts", attempts}};
  if (include_raw) {
    execution["stdout"] = outcome.stdout_text;
    execution["stderr"] = outcome.stderr_text;
  }

  return nlohmann::json{
      {"index", spec.index},
      {"state", model::to_string(record.state)},
      {"failure", model::to_string(record.failure)},
      {"spec",
       {{"device_id", spec.device_id},
        {"model_name", spec.model_name},
        {"model_path", spec.model_path},
        {"threads", spec.threads},
        {"streams", spec.streams},
        {"precision", spec.precision},
        {"batch", spec.batch},
        {"repeat_index", spec.repeat_index}}},
      {"execution", execution},
      {"metrics",
       {{"parse_status", model::to_string(metrics.status)},
        {"throughput_fps", optional_value(metrics.throughput_fps)},
        {"latency_avg_ms", optional_value(metrics.latency_avg_ms)},
        {"latency_median_ms", optional_value(metrics.latency_median_ms)},
        {"latency_min_ms", optional_value(metrics.latency_min_ms)},
        {"latency_max_ms", optional_value(metrics.latency_max_ms)},
        {"iterations", optional_value(metrics.iterations)},
        {"duration_ms", optional_value(metrics.duration_ms)},
        {"cpu_utilization_pct", optional_value(metrics.cpu_utilization_pct)},
        {"peak_memory_mb", optional_value(metrics.peak_memory_mb)},
        {"error_line", metrics.error_line}}},
      {"device", device_to_json(record.device)},
      {"started_at", core::format_utc_iso8601(record.started_unix_ms)},
      {"finished_at", core::format_utc_iso8601(record.finished_unix_ms)},
  };
}

nlohmann::json manifest_to_json(const model::run_manifest& manifest) {
  nlohmann::json devices = nlohmann::json::object();
  for (const auto& [id, health] : manifest.devices) {
    devices[id] = model::to_string(health);
  }

  return nlohmann::json{{"tool_version", manifest.tool_version},
                        {"project", manifest.project_name},
                        {"run_id", manifest.run_id},
                        {"bundle_root", manifest.bundle_root},
                        {"started_at", core::format_utc_iso8601(manifest.started_unix_ms)},
                        {"finished_at", core::format_utc_iso8601(manifest.finished_unix_ms)},
                        {"planned_invocations", manifest.planned_invocations},
                        {"recorded_invocations", manifest.recorded_invocations},
                        {"succeeded", manifest.succeeded},
                        {"failed", manifest.failed},
                        {"timed_out", manifest.timed_out},
                        {"cancelled", manifest.cancelled},
                        {"devices", devices}};
}

nlohmann::json summary_to_json(const std::vector<report::config_summary>& summaries) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& summary : summaries) {
    out.push_back({{"device_id", summary.device_id},
                   {"model_name", summary.model_name},
                   {"threads", summary.threads},
                   {"streams", summary.streams},
                   {"precision", summary.precision},
                   {"batch", summary.batch},
                   {"runs", summary.runs},
                   {"succeeded", summary.succeeded},
                   {"failed", summary.failed},
                   {"throughput_fps",
                    {{"mean", optional_value(summary.throughput_mean_fps)},
                     {"median", optional_value(summary.throughput_median_fps)},
                     {"min", optional_value(summary.throughput_min_fps)},
                     {"max", optional_value(summary.throughput_max_fps)}}},
                   {"latency_avg_ms",
                    {{"mean", optional_value(summary.latency_avg_mean_ms)},
                     {"median", optional_value(summary.latency_avg_median_ms)}}}});
  }
  return out;
}

JsonReportSink::JsonReportSink(JsonReportOptions options, core::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

void JsonReportSink::write(const std::vector<model::result_record>& records,
                           const model::run_manifest& manifest) const {
  nlohmann::json document{{"manifest", manifest_to_json(manifest)}};
  document["records"] = nlohmann::json::array();
  for (const auto& record : records) {
    document["records"].push_back(record_to_json(record, options_.include_raw));
  }
  if (options_.include_summary) {
    document["summary"] = summary_to_json(report::summarize(records));
  }

  core::write_file_atomic(options_.path, document.dump(2) + "\n");
  logger_.info("json", "wrote " + std::to_string(records.size()) + " records to " + options_.path);
}

}  // namespace ov_bench::sinks

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ov_bench::model {

enum class device_kind : std::uint8_t {
  ADB = 0,
  SSH = 1,
};

struct device_target {
  std::string id{};
  device_kind kind{device_kind::ADB};
  std::string serial{};
  std::string host{};
  std::string user{};
  std::uint16_t port{22};
  std::string key_path{};
  std::string push_dir{};
  bool use_root{false};

  // adb serial, or user@host:port for ssh targets.
  std::string address() const;
};

struct device_info {
  std::string id{};
  std::string address{};
  std::string os{};
  std::string os_version{};
  std::string model{};
  std::string abi{};
  std::string cpu{};
  std::optional<double> memory_gb{};
  std::optional<double> temperature_c{};
  std::map<std::string, std::string> properties{};
};

struct invocation_spec {
  std::size_t index{0};
  std::string device_id{};
  std::string model_name{};
  std::string model_path{};
  std::uint32_t threads{0};
  std::uint32_t streams{0};
  std::string precision{};
  std::uint32_t batch{0};
  std::uint32_t repeat_index{0};
};

bool operator==(const invocation_spec& lhs, const invocation_spec& rhs);

enum class execution_status : std::uint8_t {
  SUCCESS = 0,
  TIMEOUT = 1,
  PROCESS_ERROR = 2,
  DEVICE_UNREACHABLE = 3,
  DEVICE_NOT_FOUND = 4,
  CANCELLED = 5,
};

struct attempt_record {
  execution_status status{execution_status::PROCESS_ERROR};
  int exit_code{-1};
  double duration_s{0.0};
  std::string message{};
};

struct execution_outcome {
  execution_status status{execution_status::PROCESS_ERROR};
  int exit_code{-1};
  std::string stdout_text{};
  std::string stderr_text{};
  double duration_s{0.0};
  std::uint32_t attempts{0};
  std::string command{};
  std::string message{};
  std::vector<attempt_record> prior_attempts{};
};

enum class parse_status : std::uint8_t {
  OK = 0,
  PARTIAL = 1,
  FAILED = 2,
};

struct metrics_record {
  parse_status status{parse_status::FAILED};
  std::optional<double> throughput_fps{};
  std::optional<double> latency_avg_ms{};
  std::optional<double> latency_median_ms{};
  std::optional<double> latency_min_ms{};
  std::optional<double> latency_max_ms{};
  std::optional<std::uint64_t> iterations{};
  std::optional<double> duration_ms{};
  std::optional<double> cpu_utilization_pct{};
  std::optional<double> peak_memory_mb{};
  // First "[ ERROR ]" line the tool printed, if any.
  std::string error_line{};
};

enum class run_state : std::uint8_t {
  PENDING = 0,
  PREPARING = 1,
  RUNNING = 2,
  SUCCEEDED = 3,
  FAILED = 4,
  TIMED_OUT = 5,
  RECORDED = 6,
};

enum class failure_kind : std::uint8_t {
  NONE = 0,
  DEVICE_NOT_FOUND = 1,
  DEVICE_UNREACHABLE = 2,
  TIMEOUT = 3,
  PROCESS_ERROR = 4,
  PARSE_FAILURE = 5,
  CANCELLED = 6,
};

struct result_record {
  invocation_spec spec{};
  execution_outcome outcome{};
  metrics_record metrics{};
  device_info device{};
  run_state state{run_state::PENDING};
  failure_kind failure{failure_kind::NONE};
  std::uint64_t started_unix_ms{0};
  std::uint64_t finished_unix_ms{0};
};

enum class device_health : std::uint8_t {
  UNKNOWN = 0,
  REACHABLE = 1,
  UNREACHABLE = 2,
};

struct run_manifest {
  std::string tool_version{};
  std::string project_name{};
  std::string run_id{};
  std::string bundle_root{};
  std::uint64_t started_unix_ms{0};
  std::uint64_t finished_unix_ms{0};
  std::size_t planned_invocations{0};
  std::size_t recorded_invocations{0};
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::size_t timed_out{0};
  bool cancelled{false};
  std::map<std::string, device_health> devices{};
};

const char* to_string(device_kind kind) noexcept;
const char* to_string(execution_status status) noexcept;
const char* to_string(parse_status status) noexcept;
const char* to_string(run_state state) noexcept;
const char* to_string(failure_kind kind) noexcept;
const char* to_string(device_health health) noexcept;

}  // namespace ov_bench::model

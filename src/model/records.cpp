#include "model/records.hpp"

#include <string>

namespace ov_bench::model {

std::string device_target::address() const {
  if (kind == device_kind::ADB) {
    return serial;
  }

  std::string out;
  if (!user.empty()) {
    out += user + "@";
  }
  out += host + ":" + std::to_string(port);
  return out;
}

bool operator==(const invocation_spec& lhs, const invocation_spec& rhs) {
  return lhs.index == rhs.index && lhs.device_id == rhs.device_id && lhs.model_name == rhs.model_name &&
         lhs.model_path == rhs.model_path && lhs.threads == rhs.threads && lhs.streams == rhs.streams &&
         lhs.precision == rhs.precision && lhs.batch == rhs.batch && lhs.repeat_index == rhs.repeat_index;
}

const char* to_string(const device_kind kind) noexcept {
  switch (kind) {
    case device_kind::ADB:
      return "adb";
    case device_kind::SSH:
      return "ssh";
  }
  return "unknown";
}

const char* to_string(const execution_status status) noexcept {
  switch (status) {
    case execution_status::SUCCESS:
      return "success";
    case execution_status::TIMEOUT:
      return "timeout";
    case execution_status::PROCESS_ERROR:
      return "process_error";
    case execution_status::DEVICE_UNREACHABLE:
      return "device_unreachable";
    case execution_status::DEVICE_NOT_FOUND:
      return "device_not_found";
    case execution_status::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

const char* to_string(const parse_status status) noexcept {
  switch (status) {
    case parse_status::OK:
      return "ok";
    case parse_status::PARTIAL:
      return "partial";
    case parse_status::FAILED:
      return "failed";
  }
  return "unknown";
}

const char* to_string(const run_state state) noexcept {
  switch (state) {
    case run_state::PENDING:
      return "pending";
    case run_state::PREPARING:
      return "preparing";
    case run_state::RUNNING:
      return "running";
    case run_state::SUCCEEDED:
      return "succeeded";
    case run_state::FAILED:
      return "failed";
    case run_state::TIMED_OUT:
      return "timed_out";
    case run_state::RECORDED:
      return "recorded";
  }
  return "unknown";
}

const char* to_string(const failure_kind kind) noexcept {
  switch (kind) {
    case failure_kind::NONE:
      return "none";
    case failure_kind::DEVICE_NOT_FOUND:
      return "device_not_found";
    case failure_kind::DEVICE_UNREACHABLE:
      return "device_unreachable";
    case failure_kind::TIMEOUT:
      return "timeout";
    case failure_kind::PROCESS_ERROR:
      return "process_error";
    case failure_kind::PARSE_FAILURE:
      return "parse_failure";
    case failure_kind::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

const char* to_string(const device_health health) noexcept {
  switch (health) {
    case device_health::UNKNOWN:
      return "unknown";
    case device_health::REACHABLE:
      return "reachable";
    case device_health::UNREACHABLE:
      return "unreachable";
  }
  return "unknown";
}

}  // namespace ov_bench::model

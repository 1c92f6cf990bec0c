#include "core/errors.hpp"

namespace ov_bench::core {

const char* to_string(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::DeviceNotFound:
      return "DeviceNotFound";
    case ErrorKind::DeviceUnreachable:
      return "DeviceUnreachable";
    case ErrorKind::Timeout:
      return "Timeout";
    case ErrorKind::ProcessError:
      return "ProcessError";
    case ErrorKind::ParseFailure:
      return "ParseFailure";
    case ErrorKind::InvalidMatrix:
      return "InvalidMatrix";
  }
  return "Unknown";
}

BenchError::BenchError(const ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

}  // namespace ov_bench::core

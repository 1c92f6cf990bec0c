#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ov_bench::core {

enum class ErrorKind : std::uint8_t {
  DeviceNotFound = 0,
  DeviceUnreachable = 1,
  Timeout = 2,
  ProcessError = 3,
  ParseFailure = 4,
  InvalidMatrix = 5,
};

const char* to_string(ErrorKind kind) noexcept;

class BenchError : public std::runtime_error {
 public:
  BenchError(ErrorKind kind, const std::string& message);

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace ov_bench::core

#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/log.hpp"
#include "devices/device_pool.hpp"
#include "matrix/matrix_expander.hpp"
#include "model/records.hpp"
#include "runner/cancellation.hpp"
#include "runner/execution_driver.hpp"

namespace ov_bench::core {

inline constexpr const char* kToolVersion = "0.1.0";

struct RunOutcome {
  std::vector<model::result_record> records{};
  model::run_manifest manifest{};
};

struct PlannedInvocation {
  model::invocation_spec spec{};
  std::string command{};
};

runner::DriverOptions make_driver_options(const BenchConfig& config);

// Wires configuration, device pool, matrix and driver together for one run.
// Throws core::BenchError{InvalidMatrix} from the constructor when the matrix
// cannot be built.
class Pipeline {
 public:
  // Without a factory, real adb/ssh handles are built from the config.
  Pipeline(BenchConfig config, Logger& logger, devices::DevicePool::Factory factory = {});

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Expanded matrix with the command each invocation would run. Touches no
  // device.
  std::vector<PlannedInvocation> plan() const;

  RunOutcome run(const runner::CancellationToken& cancel);

  // Hands the outcome to every configured sink. Returns false when any sink
  // failed; the others still run.
  bool publish(const RunOutcome& outcome);

  const BenchConfig& config() const noexcept { return config_; }
  const matrix::MatrixExpander& matrix() const noexcept { return matrix_; }
  runner::ExecutionDriver& driver() noexcept { return driver_; }

 private:
  BenchConfig config_;
  Logger& logger_;
  matrix::MatrixExpander matrix_;
  devices::DevicePool pool_;
  runner::ExecutionDriver driver_;
};

}  // namespace ov_bench::core

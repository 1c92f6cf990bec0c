#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/log.hpp"
#include "devices/device_pool.hpp"
#include "matrix/matrix_expander.hpp"
#include "model/records.hpp"
#include "report/result_aggregator.hpp"
#include "runner/cancellation.hpp"
#include "runner/command_builder.hpp"

namespace ov_bench::runner {

struct DriverOptions {
  std::chrono::milliseconds timeout{std::chrono::minutes(10)};
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds backoff_initial{std::chrono::seconds(2)};
  std::chrono::milliseconds backoff_max{std::chrono::seconds(60)};
  std::chrono::milliseconds cooldown{0};
  std::chrono::milliseconds control_timeout{std::chrono::seconds(30)};
  std::size_t max_concurrency{0};
  bool tune_devices{true};
  bool warmup{false};
  bool collect_device_reports{false};
  // Local packaged bundle holding bin/ and lib/. Relative model and input
  // paths resolve against it.
  std::string bundle_root{};
  std::string artifacts_dir{"artifacts"};
  CommandOptions command{};
  // Local input files per model name.
  std::map<std::string, std::vector<std::string>> model_inputs{};
};

// Runs invocations against leased devices: prepares the deploy root, runs
// benchmark_app with retry/backoff, and turns whatever happened into a
// classified result_record. Never throws out of run_invocation().
class ExecutionDriver {
 public:
  using TransitionObserver = std::function<void(const model::invocation_spec&, model::run_state)>;

  ExecutionDriver(devices::DevicePool& pool, DriverOptions options, core::Logger& logger);

  ExecutionDriver(const ExecutionDriver&) = delete;
  ExecutionDriver& operator=(const ExecutionDriver&) = delete;

  // Called from worker threads; the observer synchronizes itself.
  void set_transition_observer(TransitionObserver observer);

  model::result_record run_invocation(const model::invocation_spec& spec, const CancellationToken& cancel);

  // One worker per device, at most max_concurrency at a time. Each worker
  // walks its device's slice in expansion order. Returns the records sorted
  // by index; after cancellation the sequence may be shorter than the matrix.
  std::vector<model::result_record> run(const matrix::MatrixExpander& matrix, const CancellationToken& cancel);

  [[nodiscard]] const DriverOptions& options() const noexcept { return options_; }

 private:
  struct AttemptResult {
    model::execution_status status{model::execution_status::PROCESS_ERROR};
    int exit_code{-1};
    std::string stdout_text{};
    std::string stderr_text{};
    double duration_s{0.0};
    std::string command{};
    std::string message{};
  };

  AttemptResult attempt(devices::DevicePool::Lease& lease, const model::invocation_spec& spec, model::run_state& state);

  void prepare_root(devices::Device& device, const std::string& root) const;
  void ensure_bundle(devices::Device& device, const std::string& root) const;
  std::string ensure_model(devices::Device& device, const std::string& root, const model::invocation_spec& spec) const;
  std::vector<std::string> push_inputs(devices::Device& device, const std::string& scratch,
                                       const model::invocation_spec& spec) const;
  void tune_once(devices::Device& device);
  void warmup_once(devices::Device& device, const std::string& root, const model::invocation_spec& spec,
                   const std::string& remote_model);
  void collect_report(devices::Device& device, const model::invocation_spec& spec, const std::string& scratch) const;

  void run_device(const matrix::MatrixExpander& matrix, std::size_t device_position, const CancellationToken& cancel,
                  report::ResultAggregator& aggregator);

  void transition(const model::invocation_spec& spec, model::run_state& current, model::run_state next) const;
  std::string resolve_local(const std::string& path) const;

  devices::DevicePool& pool_;
  DriverOptions options_;
  CommandBuilder builder_;
  core::Logger& logger_;
  TransitionObserver observer_{};

  std::mutex bookkeeping_mutex_{};
  std::set<std::string> tuned_{};
  std::set<std::pair<std::string, std::string>> warmed_{};
};

// Deploy root of a target: its push_dir, or the platform default.
std::string deploy_root(const model::device_target& target);

}  // namespace ov_bench::runner

#include "runner/execution_driver.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <sstream>
#include <system_error>
#include <thread>

#include "core/errors.hpp"
#include "core/timestamp.hpp"
#include "parsers/benchmark_parser.hpp"

namespace ov_bench::runner {

namespace fs = std::filesystem;

using core::BenchError;
using core::ErrorKind;
using model::execution_status;
using model::run_state;

namespace {

constexpr std::chrono::seconds kWarmupTimeout{30};

bool is_retryable(const execution_status status) {
  return status == execution_status::TIMEOUT || status == execution_status::DEVICE_UNREACHABLE;
}

execution_status status_for(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DeviceNotFound:
      return execution_status::DEVICE_NOT_FOUND;
    case ErrorKind::DeviceUnreachable:
      return execution_status::DEVICE_UNREACHABLE;
    case ErrorKind::Timeout:
      return execution_status::TIMEOUT;
    case ErrorKind::ProcessError:
    case ErrorKind::ParseFailure:
    case ErrorKind::InvalidMatrix:
      return execution_status::PROCESS_ERROR;
  }
  return execution_status::PROCESS_ERROR;
}

std::string first_line(const std::string& text) {
  const auto end = text.find('\n');
  return text.substr(0, end);
}

std::string describe(const model::invocation_spec& spec) {
  std::ostringstream out;
  out << '#' << spec.index << ' ' << spec.device_id << '/' << spec.model_name << " t=" << spec.threads
      << " s=" << spec.streams << " p=" << spec.precision << " b=" << spec.batch << " r=" << spec.repeat_index;
  return out.str();
}

// Removes the scratch directory when the attempt unwinds, however it ends.
class ScratchGuard {
 public:
  ScratchGuard(devices::Device& device, std::string path, core::Logger& logger)
      : device_(device), path_(std::move(path)), logger_(logger) {}

  ScratchGuard(const ScratchGuard&) = delete;
  ScratchGuard& operator=(const ScratchGuard&) = delete;

  ~ScratchGuard() {
    try {
      device_.remove(path_);
    } catch (const std::exception& ex) {
      logger_.warn("driver", "failed to remove " + path_ + " on " + device_.id() + ": " + ex.what());
    }
  }

 private:
  devices::Device& device_;
  std::string path_;
  core::Logger& logger_;
};

}  // namespace

std::string deploy_root(const model::device_target& target) {
  if (!target.push_dir.empty()) {
    return target.push_dir;
  }
  return devices::default_push_dir(target.kind);
}

ExecutionDriver::ExecutionDriver(devices::DevicePool& pool, DriverOptions options, core::Logger& logger)
    : pool_(pool), options_(std::move(options)), builder_(options_.command), logger_(logger) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

void ExecutionDriver::set_transition_observer(TransitionObserver observer) { observer_ = std::move(observer); }

void ExecutionDriver::transition(const model::invocation_spec& spec, run_state& current, const run_state next) const {
  if (current == next) {
    return;
  }
  current = next;
  if (observer_) {
    observer_(spec, next);
  }
}

std::string ExecutionDriver::resolve_local(const std::string& path) const {
  const fs::path local(path);
  if (local.is_absolute() || options_.bundle_root.empty()) {
    return local.string();
  }
  return (fs::path(options_.bundle_root) / local).string();
}

void ExecutionDriver::prepare_root(devices::Device& device, const std::string& root) const {
  if (!device.exists(root)) {
    device.mkdir(root);
  }
  const auto probe = device.shell({"test", "-w", root}, options_.control_timeout);
  if (probe.exit_code != 0) {
    throw BenchError(ErrorKind::ProcessError, "deploy root " + root + " is not writable on " + device.id());
  }
}

void ExecutionDriver::ensure_bundle(devices::Device& device, const std::string& root) const {
  const std::string remote_bin = bundle_bin_dir(root);
  if (!device.exists(remote_bin)) {
    logger_.info("driver", "pushing runtime bundle to " + device.id() + ":" + root);
    device.push((fs::path(options_.bundle_root) / "bin").string(), remote_bin);
  }

  const std::string remote_lib = bundle_lib_dir(root);
  if (!device.exists(remote_lib)) {
    device.push((fs::path(options_.bundle_root) / "lib").string(), remote_lib);
  }
}

std::string ExecutionDriver::ensure_model(devices::Device& device, const std::string& root,
                                          const model::invocation_spec& spec) const {
  const std::string remote_dir = models_dir(root);
  if (!device.exists(remote_dir)) {
    device.mkdir(remote_dir);
  }

  const fs::path local_xml(resolve_local(spec.model_path));
  const std::string remote_xml = remote_dir + "/" + local_xml.filename().string();
  if (!device.exists(remote_xml)) {
    logger_.debug("driver", "pushing model " + local_xml.string() + " to " + device.id());
    device.push(local_xml.string(), remote_xml);
  }

  fs::path local_bin = local_xml;
  local_bin.replace_extension(".bin");
  std::error_code ec;
  if (fs::exists(local_bin, ec)) {
    const std::string remote_bin = remote_dir + "/" + local_bin.filename().string();
    if (!device.exists(remote_bin)) {
      device.push(local_bin.string(), remote_bin);
    }
  }

  return remote_xml;
}

std::vector<std::string> ExecutionDriver::push_inputs(devices::Device& device, const std::string& scratch,
                                                      const model::invocation_spec& spec) const {
  std::vector<std::string> remote;
  const auto it = options_.model_inputs.find(spec.model_name);
  if (it == options_.model_inputs.end()) {
    return remote;
  }

  for (const auto& input : it->second) {
    const fs::path local(resolve_local(input));
    const std::string target = scratch + "/" + local.filename().string();
    device.push(local.string(), target);
    remote.push_back(target);
  }
  return remote;
}

void ExecutionDriver::tune_once(devices::Device& device) {
  if (!options_.tune_devices) {
    return;
  }
  {
    const std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    if (!tuned_.insert(device.id()).second) {
      return;
    }
  }

  for (const auto& command : device.tuning_commands()) {
    try {
      const auto result = device.shell(command, options_.control_timeout);
      if (result.exit_code != 0) {
        logger_.warn("driver", "tuning command '" + format_command(command) + "' on " + device.id() + " exited with " +
                                   std::to_string(result.exit_code));
      }
    } catch (const std::exception& ex) {
      logger_.warn("driver", "tuning command '" + format_command(command) + "' on " + device.id() + " failed: " +
                                 ex.what());
    }
  }
}

void ExecutionDriver::warmup_once(devices::Device& device, const std::string& root,
                                  const model::invocation_spec& spec, const std::string& remote_model) {
  if (!options_.warmup) {
    return;
  }
  {
    const std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    if (!warmed_.emplace(device.id(), spec.model_name).second) {
      return;
    }
  }

  const auto argv = builder_.build_warmup(root, remote_model);
  try {
    const auto result = device.shell(argv, kWarmupTimeout);
    if (result.exit_code != 0) {
      logger_.warn("driver", "warmup of " + spec.model_name + " on " + device.id() + " exited with " +
                                 std::to_string(result.exit_code));
    }
  } catch (const std::exception& ex) {
    logger_.warn("driver", "warmup of " + spec.model_name + " on " + device.id() + " failed: " + ex.what());
  }
}

void ExecutionDriver::collect_report(devices::Device& device, const model::invocation_spec& spec,
                                     const std::string& scratch) const {
  const fs::path local = fs::path(options_.artifacts_dir) / "device_reports" / spec.device_id;
  try {
    fs::create_directories(local);
    device.pull(scratch, local.string());
  } catch (const std::exception& ex) {
    logger_.warn("driver", "could not collect report for " + describe(spec) + ": " + ex.what());
  }
}

ExecutionDriver::AttemptResult ExecutionDriver::attempt(devices::DevicePool::Lease& lease,
                                                        const model::invocation_spec& spec, run_state& state) {
  AttemptResult result{};
  transition(spec, state, run_state::PREPARING);

  try {
    devices::Device& device = lease.device();
    const std::string root = deploy_root(lease.target());

    prepare_root(device, root);
    ensure_bundle(device, root);
    const std::string remote_model = ensure_model(device, root, spec);
    tune_once(device);

    InvocationPaths paths{};
    paths.deploy_root = root;
    paths.model = remote_model;
    paths.scratch_dir = scratch_dir(root, spec.index);
    paths.write_report = options_.collect_device_reports;

    ScratchGuard guard(device, paths.scratch_dir, logger_);
    device.mkdir(paths.scratch_dir);
    paths.inputs = push_inputs(device, paths.scratch_dir, spec);
    warmup_once(device, root, spec, remote_model);

    const auto argv = builder_.build(spec, paths);
    result.command = format_command(argv);
    logger_.debug("driver", describe(spec) + ": " + result.command);

    transition(spec, state, run_state::RUNNING);
    const auto started = std::chrono::steady_clock::now();
    auto shell = device.shell(argv, options_.timeout);
    result.duration_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    result.exit_code = shell.exit_code;
    result.stdout_text = std::move(shell.stdout_text);
    result.stderr_text = std::move(shell.stderr_text);
    if (result.exit_code == 0) {
      result.status = execution_status::SUCCESS;
    } else {
      result.status = execution_status::PROCESS_ERROR;
      result.message = "benchmark exited with code " + std::to_string(result.exit_code);
      const std::string detail = first_line(result.stderr_text);
      if (!detail.empty()) {
        result.message += ": " + detail;
      }
    }

    if (options_.collect_device_reports) {
      collect_report(device, spec, paths.scratch_dir);
    }
  } catch (const BenchError& ex) {
    result.status = status_for(ex.kind());
    result.message = ex.what();
  } catch (const std::exception& ex) {
    result.status = execution_status::PROCESS_ERROR;
    result.message = ex.what();
  }

  return result;
}

model::result_record ExecutionDriver::run_invocation(const model::invocation_spec& spec,
                                                     const CancellationToken& cancel) {
  const std::uint64_t started_ms = core::unix_timestamp_now_ms();
  run_state state = run_state::PENDING;
  if (observer_) {
    observer_(spec, state);
  }

  const auto finish = [&](model::execution_outcome outcome, const model::device_info& device) {
    auto metrics = parsers::parse_benchmark_output(outcome.stdout_text, outcome.stderr_text);
    auto record = report::make_result_record(spec, std::move(outcome), std::move(metrics), device, started_ms,
                                             core::unix_timestamp_now_ms());
    transition(spec, state, record.state);

    if (record.state == run_state::SUCCEEDED) {
      std::ostringstream line;
      line << describe(spec) << ": " << *record.metrics.throughput_fps << " FPS";
      logger_.info("driver", line.str());
    } else {
      logger_.warn("driver", describe(spec) + ": " + model::to_string(record.failure) + " after " +
                                 std::to_string(record.outcome.attempts) + " attempt(s): " + record.outcome.message);
    }

    transition(spec, state, run_state::RECORDED);
    return record;
  };

  model::device_info fallback{};
  fallback.id = spec.device_id;

  if (cancel.requested()) {
    model::execution_outcome outcome{};
    outcome.status = execution_status::CANCELLED;
    outcome.message = "cancelled before start";
    return finish(std::move(outcome), fallback);
  }

  std::optional<devices::DevicePool::Lease> lease;
  try {
    lease.emplace(pool_.acquire(spec.device_id));
  } catch (const BenchError& ex) {
    model::execution_outcome outcome{};
    outcome.status = status_for(ex.kind());
    outcome.attempts = 1;
    outcome.message = ex.what();
    return finish(std::move(outcome), fallback);
  }

  model::execution_outcome outcome{};
  auto backoff = options_.backoff_initial;
  for (std::uint32_t attempt_no = 1;; ++attempt_no) {
    AttemptResult result = attempt(*lease, spec, state);

    if (is_retryable(result.status) && attempt_no < options_.max_attempts && !cancel.requested()) {
      logger_.warn("driver", describe(spec) + ": attempt " + std::to_string(attempt_no) + "/" +
                                 std::to_string(options_.max_attempts) + " " + model::to_string(result.status) +
                                 ", retrying in " + std::to_string(backoff.count()) + " ms");
      if (cancel.wait_for(backoff)) {
        outcome.prior_attempts.push_back(
            model::attempt_record{result.status, result.exit_code, result.duration_s, result.message});
        backoff = std::min(backoff * 2, options_.backoff_max);
        continue;
      }
    }

    outcome.status = result.status;
    outcome.exit_code = result.exit_code;
    outcome.stdout_text = std::move(result.stdout_text);
    outcome.stderr_text = std::move(result.stderr_text);
    outcome.duration_s = result.duration_s;
    outcome.attempts = attempt_no;
    outcome.command = std::move(result.command);
    outcome.message = std::move(result.message);
    break;
  }

  return finish(std::move(outcome), lease->info());
}

void ExecutionDriver::run_device(const matrix::MatrixExpander& matrix, const std::size_t device_position,
                                 const CancellationToken& cancel, report::ResultAggregator& aggregator) {
  auto cursor = matrix.device_cursor(device_position);
  const std::size_t total = matrix.per_device();
  std::size_t done = 0;

  while (!cancel.requested()) {
    const auto spec = cursor.next();
    if (!spec) {
      break;
    }
    aggregator.append(run_invocation(*spec, cancel));
    ++done;

    if (done < total && options_.cooldown.count() > 0 && !cancel.wait_for(options_.cooldown)) {
      break;
    }
  }
}

std::vector<model::result_record> ExecutionDriver::run(const matrix::MatrixExpander& matrix,
                                                       const CancellationToken& cancel) {
  report::ResultAggregator aggregator;
  const std::size_t device_count = matrix.axes().devices.size();
  std::size_t workers = options_.max_concurrency == 0 ? device_count : options_.max_concurrency;
  workers = std::min(workers, device_count);

  logger_.info("driver", "dispatching " + std::to_string(matrix.size()) + " invocations across " +
                             std::to_string(device_count) + " device(s) with " + std::to_string(workers) +
                             " worker(s)");

  std::atomic<std::size_t> next_device{0};
  const auto work = [&]() {
    for (;;) {
      const std::size_t position = next_device.fetch_add(1);
      if (position >= device_count) {
        return;
      }
      try {
        run_device(matrix, position, cancel, aggregator);
      } catch (const std::exception& ex) {
        logger_.warn("driver", "worker for " + matrix.axes().devices[position] + " stopped: " + ex.what());
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(work);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  if (cancel.requested()) {
    logger_.warn("driver", "run cancelled after " + std::to_string(aggregator.size()) + " of " +
                               std::to_string(matrix.size()) + " invocations");
  }
  return aggregator.finalize();
}

}  // namespace ov_bench::runner

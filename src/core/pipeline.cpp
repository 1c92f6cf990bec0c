#include "core/pipeline.hpp"

#include <filesystem>
#include <utility>

#include "core/timestamp.hpp"
#include "report/summary.hpp"
#include "runner/command_builder.hpp"
#include "sinks/csv_report.hpp"
#include "sinks/json_report.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_report.hpp"

namespace ov_bench::core {

namespace {

devices::DevicePool::Factory default_factory(const BenchConfig& config) {
  devices::DeviceOptions options{};
  options.transfer_timeout = config.run.transfer_timeout;
  return [options](const model::device_target& target) { return devices::make_device(target, options); };
}

std::string redis_address(const RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ":" + std::to_string(redis.port);
}

}  // namespace

runner::DriverOptions make_driver_options(const BenchConfig& config) {
  runner::DriverOptions options{};
  options.timeout = config.run.timeout;
  options.max_attempts = config.run.max_attempts;
  options.backoff_initial = config.run.backoff_initial;
  options.backoff_max = config.run.backoff_max;
  options.cooldown = config.run.cooldown;
  options.max_concurrency = config.run.max_concurrency;
  options.tune_devices = config.run.tune_devices;
  options.warmup = config.run.warmup;
  options.collect_device_reports = config.run.collect_device_reports;
  options.bundle_root = config.bundle_root;
  options.artifacts_dir = config.artifacts_dir;

  options.command.executable = config.executable;
  options.command.api = config.run.api;
  options.command.niter = config.run.niter;
  options.command.nireq = config.run.nireq;
  options.command.inference_device = config.run.inference_device;
  options.command.measure_resources = config.run.measure_resources;
  options.command.time_binary = config.run.time_binary;

  for (const auto& model : config.models) {
    if (!model.inputs.empty()) {
      options.model_inputs[model.name] = model.inputs;
    }
  }
  return options;
}

Pipeline::Pipeline(BenchConfig config, Logger& logger, devices::DevicePool::Factory factory)
    : config_(std::move(config)),
      logger_(logger),
      matrix_(matrix::MatrixExpander::from_config(config_)),
      pool_(config_.devices, factory ? std::move(factory) : default_factory(config_), logger_),
      driver_(pool_, make_driver_options(config_), logger_) {}

std::vector<PlannedInvocation> Pipeline::plan() const {
  const runner::CommandBuilder builder(driver_.options().command);
  std::vector<PlannedInvocation> out;
  out.reserve(matrix_.size());

  auto cursor = matrix_.cursor();
  while (auto spec = cursor.next()) {
    const std::string root = runner::deploy_root(pool_.target(spec->device_id));

    runner::InvocationPaths paths{};
    paths.deploy_root = root;
    paths.model = runner::models_dir(root) + "/" + runner::remote_basename(spec->model_path);
    paths.scratch_dir = runner::scratch_dir(root, spec->index);
    paths.write_report = config_.run.collect_device_reports;
    const auto inputs = driver_.options().model_inputs.find(spec->model_name);
    if (inputs != driver_.options().model_inputs.end()) {
      for (const auto& input : inputs->second) {
        paths.inputs.push_back(paths.scratch_dir + "/" + runner::remote_basename(input));
      }
    }

    out.push_back(PlannedInvocation{*spec, runner::format_command(builder.build(*spec, paths))});
  }
  return out;
}

RunOutcome Pipeline::run(const runner::CancellationToken& cancel) {
  RunOutcome outcome{};
  auto& manifest = outcome.manifest;
  manifest.tool_version = kToolVersion;
  manifest.project_name = config_.project_name;
  manifest.run_id = config_.run_id;
  manifest.bundle_root = config_.bundle_root;
  manifest.planned_invocations = matrix_.size();
  manifest.started_unix_ms = unix_timestamp_now_ms();

  logger_.info("pipeline", "run " + config_.run_id + ": " + std::to_string(matrix_.size()) + " invocations on " +
                               std::to_string(config_.devices.size()) + " device(s)");

  outcome.records = driver_.run(matrix_, cancel);

  manifest.finished_unix_ms = unix_timestamp_now_ms();
  manifest.recorded_invocations = outcome.records.size();
  manifest.cancelled = cancel.requested();
  manifest.devices = pool_.health_snapshot();
  for (const auto& record : outcome.records) {
    switch (record.state) {
      case model::run_state::SUCCEEDED:
        ++manifest.succeeded;
        break;
      case model::run_state::TIMED_OUT:
        ++manifest.timed_out;
        break;
      default:
        ++manifest.failed;
        break;
    }
  }

  logger_.info("pipeline", "finished: " + std::to_string(manifest.succeeded) + " succeeded, " +
                               std::to_string(manifest.failed) + " failed, " + std::to_string(manifest.timed_out) +
                               " timed out");
  return outcome;
}

bool Pipeline::publish(const RunOutcome& outcome) {
  bool ok = true;
  const auto& report = config_.report;

  if (report.stdout_summary) {
    const sinks::StdoutReportSink sink{};
    sink.publish(outcome.records);
    if (report.summary) {
      sink.publish_summary(report::summarize(outcome.records));
    }
  }

  if (!report.json_path.empty()) {
    sinks::JsonReportOptions options{};
    options.path = report.json_path;
    options.include_summary = report.summary;
    options.include_raw = report.include_raw;
    try {
      sinks::JsonReportSink(options, logger_).write(outcome.records, outcome.manifest);
    } catch (const std::exception& ex) {
      logger_.warn("json", ex.what());
      ok = false;
    }
  }

  if (!report.csv_path.empty()) {
    try {
      sinks::CsvReportSink(report.csv_path, logger_).write(outcome.records);
    } catch (const std::exception& ex) {
      logger_.warn("csv", ex.what());
      ok = false;
    }
  }

  if (report.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = report.redis.host;
    options.port = report.redis.port;
    options.unix_socket = report.redis.unix_socket;
    options.key_prefix = report.redis.key_prefix;

    sinks::RedisTsSink sink(options, logger_);
    if (!sink.publish(outcome.records, outcome.manifest)) {
      logger_.warn("pipeline", "redis publish to " + redis_address(report.redis) + " failed");
      ok = false;
    }
  }

  return ok;
}

}  // namespace ov_bench::core

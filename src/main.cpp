#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/pipeline.hpp"
#include "runner/cancellation.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitSinkFailure = 3;

void print_usage(std::ostream& out) {
  out << "usage: ov-bench <config.yaml> [--dry-run] [--verbose]\n";
}

std::string format_config_settings(const ov_bench::core::BenchConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "loaded config from " << config_path << " | project=" << config.project_name
         << " | run_id=" << config.run_id << " | bundle=" << config.bundle_root
         << " | devices=" << config.devices.size() << " | models=" << config.models.size()
         << " | timeout_s=" << std::chrono::duration_cast<std::chrono::seconds>(config.run.timeout).count()
         << " | max_attempts=" << config.run.max_attempts
         << " | redis_enabled=" << (config.report.redis.enabled ? "true" : "false");
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool dry_run = false;
  bool verbose = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--dry-run") {
      dry_run = true;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return kExitOk;
    } else if (!arg.empty() && arg.front() == '-') {
      std::cerr << "unknown option: " << arg << '\n';
      print_usage(std::cerr);
      return kExitUsage;
    } else if (config_path.empty()) {
      config_path = arg;
    } else {
      std::cerr << "unexpected argument: " << arg << '\n';
      print_usage(std::cerr);
      return kExitUsage;
    }
  }
  if (config_path.empty()) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  ov_bench::core::Logger logger(std::cerr, verbose);

  ov_bench::core::BenchConfig config{};
  try {
    config = ov_bench::core::load_bench_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return kExitConfigError;
  }
  logger.info("ov-bench", format_config_settings(config, config_path));

  std::unique_ptr<ov_bench::core::Pipeline> pipeline;
  try {
    pipeline = std::make_unique<ov_bench::core::Pipeline>(config, logger);
  } catch (const ov_bench::core::BenchError& ex) {
    std::cerr << "matrix error: " << ex.what() << '\n';
    return kExitConfigError;
  } catch (const std::invalid_argument& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return kExitConfigError;
  }

  if (dry_run) {
    for (const auto& planned : pipeline->plan()) {
      std::cout << '#' << planned.spec.index << ' ' << planned.spec.device_id << ": " << planned.command << '\n';
    }
    return kExitOk;
  }

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  ov_bench::runner::CancellationToken cancel;
  std::atomic<bool> finished{false};
  std::thread watcher([&]() {
    while (!finished.load()) {
      if (g_shutdown_requested != 0) {
        logger.warn("ov-bench", "shutdown signal received; finishing in-flight invocations");
        cancel.request();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  const auto outcome = pipeline->run(cancel);
  finished.store(true);
  watcher.join();

  if (!pipeline->publish(outcome)) {
    return kExitSinkFailure;
  }
  return kExitOk;
}

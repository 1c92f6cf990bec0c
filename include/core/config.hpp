#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "model/records.hpp"

namespace ov_bench::core {

struct ModelConfig {
  std::string name{};
  // Relative to the bundle root, or absolute.
  std::string path{};
  std::vector<std::string> inputs{};
};

struct MatrixConfig {
  // Empty device/model lists mean "every configured one".
  std::vector<std::string> devices{};
  std::vector<std::string> models{};
  std::vector<std::uint32_t> threads{4};
  std::vector<std::uint32_t> streams{1};
  std::vector<std::string> precisions{"FP16"};
  std::vector<std::uint32_t> batches{1};
  std::uint32_t repeats{3};
};

struct RunConfig {
  std::chrono::milliseconds timeout{std::chrono::minutes(10)};
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds backoff_initial{std::chrono::seconds(2)};
  std::chrono::milliseconds backoff_max{std::chrono::seconds(60)};
  std::chrono::milliseconds cooldown{0};
  std::size_t max_concurrency{0};
  bool tune_devices{true};
  bool warmup{false};
  std::string api{"sync"};
  std::uint32_t niter{200};
  std::uint32_t nireq{1};
  std::string inference_device{"CPU"};
  bool measure_resources{false};
  std::string time_binary{"/usr/bin/time"};
  bool collect_device_reports{false};
  std::chrono::milliseconds transfer_timeout{std::chrono::minutes(10)};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"ov-bench"};
  bool enabled{false};
};

struct ReportConfig {
  std::string json_path{};
  std::string csv_path{};
  bool stdout_summary{true};
  bool summary{true};
  bool include_raw{false};
  RedisConfig redis{};
};

struct BenchConfig {
  std::string project_name{"ov-bench"};
  std::string run_id{"local"};
  std::string bundle_root{};
  std::string executable{"benchmark_app"};
  std::string artifacts_dir{"artifacts"};
  std::vector<model::device_target> devices{};
  std::vector<ModelConfig> models{};
  MatrixConfig matrix{};
  RunConfig run{};
  ReportConfig report{};
};

// Parses the YAML subset used by ov-bench configs: two-space indented
// sections, scalar values, inline [a, b] lists and # comments. Throws
// std::runtime_error naming the offending key.
BenchConfig load_bench_config(const std::string& path);

BenchConfig parse_bench_config(const std::string& text);

}  // namespace ov_bench::core

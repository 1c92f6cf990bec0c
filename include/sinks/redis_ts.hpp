#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/log.hpp"
#include "model/records.hpp"

struct redisContext;

namespace ov_bench::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"ov-bench"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes throughput and average latency of succeeded records to
// RedisTimeSeries, one series per (run, configuration, metric). Series are
// created with labels on first use; samples go out in a single TS.MADD.
class RedisTsSink {
 public:
  RedisTsSink(RedisTsOptions options, core::Logger& logger);
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;

  bool check_connectivity();
  bool publish(const std::vector<model::result_record>& records, const model::run_manifest& manifest);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  struct Series {
    std::string key{};
    std::vector<std::pair<std::string, std::string>> labels{};
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_series(const Series& series);
  bool publish_impl(const std::vector<model::result_record>& records, const model::run_manifest& manifest);
  Series series_for(const model::result_record& record, const model::run_manifest& manifest,
                                  const char* metric) const;
  redisContext* context() const noexcept { return context_.get(); }

  RedisTsOptions options_;
  core::Logger& logger_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::set<std::string> created_keys_{};
  bool timeseries_available_{true};
};

}  // namespace ov_bench::sinks

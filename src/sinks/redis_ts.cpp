#include "sinks/redis_ts.hpp"

#include <cstdio>
#include <cstring>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace ov_bench::sinks {
namespace {

constexpr const char* kThroughputMetric = "throughput_fps";
constexpr const char* kLatencyMetric = "latency_avg_ms";

std::string format_value(const double value) {
  char buffer[64]{};
  std::snprintf(buffer, sizeof(buffer), "%.6f", value);
  return buffer;
}

bool reply_contains(const redisReply* reply, const char* needle) {
  return reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, needle) != nullptr;
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options, core::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

RedisTsSink::~RedisTsSink() = default;

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();
  created_keys_.clear();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      logger_.warn("redis", std::string("connect failed: ") + raw->errstr);
      redisFree(raw);
    } else {
      logger_.warn("redis", "connect failed: out of memory");
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    logger_.warn("redis", "AUTH rejected");
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

RedisTsSink::Series RedisTsSink::series_for(const model::result_record& record, const model::run_manifest& manifest,
                                            const char* metric) const {
  const auto& spec = record.spec;
  Series series{};
  series.key = options_.key_prefix + ":" + manifest.run_id + ":" + spec.device_id + ":" + spec.model_name + ":t" +
               std::to_string(spec.threads) + ":s" + std::to_string(spec.streams) + ":" + spec.precision + ":b" +
               std::to_string(spec.batch) + ":" + metric;
  series.labels = {
      {"project", manifest.project_name},
      {"run_id", manifest.run_id},
      {"device", spec.device_id},
      {"model", spec.model_name},
      {"threads", std::to_string(spec.threads)},
      {"streams", std::to_string(spec.streams)},
      {"precision", spec.precision},
      {"batch", std::to_string(spec.batch)},
      {"metric", metric},
  };
  return series;
}

bool RedisTsSink::ensure_series(const Series& series) {
  if (created_keys_.count(series.key) != 0) {
    return true;
  }

  std::vector<std::string> args = {"TS.CREATE", series.key, "DUPLICATE_POLICY", "LAST", "LABELS"};
  for (const auto& [name, value] : series.labels) {
    args.push_back(name);
    args.push_back(value.empty() ? "-" : value);
  }
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context(), static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool already_exists = reply_contains(reply, "already exists");
  const bool unknown_command = reply_contains(reply, "unknown command");
  const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
  const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
  freeReplyObject(reply);

  if (unknown_command) {
    logger_.warn("redis", "RedisTimeSeries module not available (TS.CREATE unknown command)");
    timeseries_available_ = false;
    return false;
  }
  if (!ok) {
    logger_.warn("redis", "schema error on TS.CREATE " + series.key + ": " + reply_message);
    return false;
  }

  created_keys_.insert(series.key);
  return true;
}

bool RedisTsSink::publish(const std::vector<model::result_record>& records, const model::run_manifest& manifest) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(records, manifest)) {
    return true;
  }

  if (!timeseries_available_ || !reconnect()) {
    return false;
  }
  return publish_impl(records, manifest);
}

bool RedisTsSink::publish_impl(const std::vector<model::result_record>& records, const model::run_manifest& manifest) {
  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  // Repeats share a series; DUPLICATE_POLICY LAST would fold repeats that
  // finished in the same millisecond, so later ones move forward by 1 ms.
  std::map<std::string, std::uint64_t> last_timestamp;
  const auto append_sample = [&](const model::result_record& record, const char* metric, const double value) {
    const Series series = series_for(record, manifest, metric);
    if (!ensure_series(series)) {
      return false;
    }
    std::uint64_t timestamp = record.finished_unix_ms;
    const auto previous = last_timestamp.find(series.key);
    if (previous != last_timestamp.end() && timestamp <= previous->second) {
      timestamp = previous->second + 1;
    }
    last_timestamp[series.key] = timestamp;
    command_args_.push_back(series.key);
    command_args_.push_back(std::to_string(timestamp));
    command_args_.push_back(format_value(value));
    return true;
  };

  for (const auto& record : records) {
    if (record.state != model::run_state::SUCCEEDED) {
      continue;
    }
    if (record.metrics.throughput_fps && !append_sample(record, kThroughputMetric, *record.metrics.throughput_fps)) {
      return false;
    }
    if (record.metrics.latency_avg_ms && !append_sample(record, kLatencyMetric, *record.metrics.latency_avg_ms)) {
      return false;
    }
  }

  if (command_args_.size() == 1) {
    logger_.info("redis", "no succeeded records to publish");
    return true;
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    logger_.warn("redis", std::string("TS.MADD rejected: ") + (reply->str != nullptr ? reply->str : "unknown"));
  } else {
    logger_.info("redis", "published " + std::to_string((command_args_.size() - 1) / 3) + " samples");
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace ov_bench::sinks

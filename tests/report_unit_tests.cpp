#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "core/log.hpp"
#include "model/records.hpp"
#include "report/result_aggregator.hpp"
#include "report/summary.hpp"
#include "sinks/csv_report.hpp"
#include "sinks/json_report.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_report.hpp"

using ov_bench::core::Logger;
using ov_bench::model::device_info;
using ov_bench::model::execution_outcome;
using ov_bench::model::execution_status;
using ov_bench::model::failure_kind;
using ov_bench::model::invocation_spec;
using ov_bench::model::metrics_record;
using ov_bench::model::parse_status;
using ov_bench::model::result_record;
using ov_bench::model::run_manifest;
using ov_bench::model::run_state;
using ov_bench::report::make_result_record;
using ov_bench::report::ResultAggregator;
using ov_bench::report::summarize;
using ov_bench::sinks::csv_columns;
using ov_bench::sinks::csv_escape;
using ov_bench::sinks::csv_row;
using ov_bench::sinks::CsvReportSink;
using ov_bench::sinks::JsonReportOptions;
using ov_bench::sinks::JsonReportSink;
using ov_bench::sinks::RedisTsOptions;
using ov_bench::sinks::RedisTsSink;

namespace {

struct RedisMockState {
  std::vector<std::vector<std::string>> argv_calls{};
  // Error text returned for every TS.CREATE, empty for success.
  const char* create_error{nullptr};
};

RedisMockState g_redis_mock{};

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char*, ...) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  std::vector<std::string> call;
  for (int i = 0; i < argc; ++i) {
    call.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_ARRAY;
  if (call.front() == "TS.CREATE" && g_redis_mock.create_error != nullptr) {
    reply->type = REDIS_REPLY_ERROR;
    reply->str = const_cast<char*>(g_redis_mock.create_error);
  }
  g_redis_mock.argv_calls.push_back(std::move(call));
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool almost_equal(const double a, const double b, const double eps = 1e-9) { return std::fabs(a - b) <= eps; }

std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / ("ov_bench_" + std::to_string(::getpid()) + "_" + name)).string();
}

std::string read_file(const std::string& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

invocation_spec make_spec(const std::size_t index, const std::uint32_t threads, const std::uint32_t repeat) {
  invocation_spec spec{};
  spec.index = index;
  spec.device_id = "pixel";
  spec.model_name = "resnet";
  spec.model_path = "models/resnet50.xml";
  spec.threads = threads;
  spec.streams = 1;
  spec.precision = "FP16";
  spec.batch = 1;
  spec.repeat_index = repeat;
  return spec;
}

metrics_record full_metrics(const double fps, const double latency) {
  metrics_record metrics{};
  metrics.status = parse_status::OK;
  metrics.throughput_fps = fps;
  metrics.latency_avg_ms = latency;
  metrics.latency_median_ms = latency;
  metrics.latency_min_ms = latency / 2.0;
  metrics.latency_max_ms = latency * 2.0;
  metrics.iterations = 200;
  metrics.duration_ms = 10000.0;
  return metrics;
}

execution_outcome outcome_with(const execution_status status, const int exit_code) {
  execution_outcome outcome{};
  outcome.status = status;
  outcome.exit_code = exit_code;
  outcome.attempts = 1;
  outcome.stdout_text = "Throughput: 1.0 FPS\n";
  outcome.command = "'benchmark_app' '-m' 'model.xml'";
  return outcome;
}

result_record succeeded(const std::size_t index, const std::uint32_t threads, const std::uint32_t repeat,
                        const double fps, const double latency) {
  device_info device{};
  device.id = "pixel";
  device.model = "Pixel 8";
  device.os = "Android";
  device.os_version = "14";
  return make_result_record(make_spec(index, threads, repeat), outcome_with(execution_status::SUCCESS, 0),
                            full_metrics(fps, latency), device, 1714566600000ULL, 1714566600250ULL + index);
}

result_record failed_process(const std::size_t index, const std::uint32_t threads, const std::uint32_t repeat) {
  auto metrics = full_metrics(99.0, 1.0);
  metrics.error_line = "Failed to compile model, \"FP16\" unsupported";
  auto outcome = outcome_with(execution_status::PROCESS_ERROR, 1);
  outcome.message = "benchmark exited with code 1";
  return make_result_record(make_spec(index, threads, repeat), outcome, metrics, device_info{}, 1714566600000ULL,
                            1714566600500ULL);
}

run_manifest sample_manifest() {
  run_manifest manifest{};
  manifest.tool_version = "0.1.0";
  manifest.project_name = "ov-bench";
  manifest.run_id = "ci-42";
  manifest.bundle_root = "/opt/ov-bundle";
  manifest.planned_invocations = 4;
  manifest.recorded_invocations = 3;
  manifest.succeeded = 2;
  manifest.failed = 1;
  manifest.devices["pixel"] = ov_bench::model::device_health::REACHABLE;
  return manifest;
}

int test_make_result_record_classification() {
  const auto ok = succeeded(0, 4, 0, 20.0, 50.0);
  if (ok.state != run_state::SUCCEEDED || ok.failure != failure_kind::NONE || !ok.metrics.throughput_fps) {
    return fail("test_make_result_record_classification", "clean run should succeed with metrics");
  }

  const auto process = failed_process(1, 4, 0);
  if (process.state != run_state::FAILED || process.failure != failure_kind::PROCESS_ERROR ||
      process.metrics.throughput_fps || process.metrics.status != parse_status::FAILED ||
      process.metrics.error_line.empty()) {
    return fail("test_make_result_record_classification", "process error should drop metrics but keep error line");
  }

  auto error_metrics = full_metrics(10.0, 1.0);
  error_metrics.error_line = "Exception from core.cpp";
  const auto error_on_zero = make_result_record(make_spec(2, 4, 0), outcome_with(execution_status::SUCCESS, 0),
                                                error_metrics, device_info{}, 0, 0);
  if (error_on_zero.failure != failure_kind::PROCESS_ERROR ||
      error_on_zero.outcome.status != execution_status::PROCESS_ERROR ||
      error_on_zero.outcome.message != "Exception from core.cpp") {
    return fail("test_make_result_record_classification", "error line on exit 0 should be a process error");
  }

  const auto parse = make_result_record(make_spec(3, 4, 0), outcome_with(execution_status::SUCCESS, 0),
                                        metrics_record{}, device_info{}, 0, 0);
  if (parse.state != run_state::FAILED || parse.failure != failure_kind::PARSE_FAILURE ||
      parse.outcome.message != "no throughput line in benchmark output") {
    return fail("test_make_result_record_classification", "missing throughput should be a parse failure");
  }

  const auto timeout = make_result_record(make_spec(4, 4, 0), outcome_with(execution_status::TIMEOUT, -1),
                                          full_metrics(1.0, 1.0), device_info{}, 0, 0);
  if (timeout.state != run_state::TIMED_OUT || timeout.failure != failure_kind::TIMEOUT ||
      timeout.metrics.throughput_fps) {
    return fail("test_make_result_record_classification", "timeout should be timed out without metrics");
  }

  const auto unreachable = make_result_record(
      make_spec(5, 4, 0), outcome_with(execution_status::DEVICE_UNREACHABLE, -1), metrics_record{}, device_info{}, 0, 0);
  const auto cancelled = make_result_record(make_spec(6, 4, 0), outcome_with(execution_status::CANCELLED, -1),
                                            metrics_record{}, device_info{}, 0, 0);
  if (unreachable.failure != failure_kind::DEVICE_UNREACHABLE || cancelled.failure != failure_kind::CANCELLED ||
      cancelled.state != run_state::FAILED) {
    return fail("test_make_result_record_classification", "device and cancel statuses should map 1:1");
  }
  return 0;
}

int test_aggregator_orders_by_index() {
  ResultAggregator aggregator;
  aggregator.append(succeeded(5, 4, 1, 1.0, 1.0));
  aggregator.append(succeeded(0, 4, 0, 1.0, 1.0));
  aggregator.append(succeeded(3, 1, 1, 1.0, 1.0));

  const auto records = aggregator.finalize();
  if (aggregator.size() != 3 || records.size() != 3 || records[0].spec.index != 0 || records[1].spec.index != 3 ||
      records[2].spec.index != 5) {
    return fail("test_aggregator_orders_by_index", "records should come back sorted by index");
  }
  return 0;
}

int test_summary_statistics() {
  const std::vector<result_record> records = {
      succeeded(0, 1, 0, 10.0, 100.0), succeeded(1, 1, 1, 20.0, 50.0), succeeded(2, 1, 2, 60.0, 30.0),
      succeeded(3, 4, 0, 40.0, 25.0),  failed_process(4, 4, 1),
  };

  const auto summaries = summarize(records);
  if (summaries.size() != 2 || summaries[0].threads != 1 || summaries[1].threads != 4) {
    return fail("test_summary_statistics", "groups should follow first-seen order");
  }

  const auto& first = summaries[0];
  if (first.runs != 3 || first.succeeded != 3 || first.failed != 0 || !almost_equal(*first.throughput_mean_fps, 30.0) ||
      !almost_equal(*first.throughput_median_fps, 20.0) || !almost_equal(*first.throughput_min_fps, 10.0) ||
      !almost_equal(*first.throughput_max_fps, 60.0) || !almost_equal(*first.latency_avg_median_ms, 50.0)) {
    return fail("test_summary_statistics", "throughput and latency statistics are wrong");
  }

  const auto& second = summaries[1];
  if (second.runs != 2 || second.succeeded != 1 || second.failed != 1 ||
      !almost_equal(*second.throughput_mean_fps, 40.0)) {
    return fail("test_summary_statistics", "failed records should count but not contribute statistics");
  }

  const auto only_failed = summarize({failed_process(0, 2, 0)});
  if (only_failed.size() != 1 || only_failed[0].throughput_mean_fps || only_failed[0].latency_avg_median_ms) {
    return fail("test_summary_statistics", "groups without successes should have absent statistics");
  }
  return 0;
}

int test_json_sink_document() {
  std::ostringstream log;
  Logger logger(log);
  const std::vector<result_record> records = {succeeded(0, 4, 0, 19.97, 50.02), failed_process(1, 4, 1)};

  JsonReportOptions options{};
  options.path = temp_path("nested/report.json");
  options.include_raw = false;
  JsonReportSink(options, logger).write(records, sample_manifest());

  const auto document = nlohmann::json::parse(read_file(options.path));
  if (document["manifest"]["run_id"] != "ci-42" || document["manifest"]["devices"]["pixel"] != "REACHABLE" ||
      document["records"].size() != 2 || document["summary"].size() != 1) {
    return fail("test_json_sink_document", "manifest, records and summary should be present");
  }

  const auto& ok = document["records"][0];
  if (ok["state"] != "SUCCEEDED" || ok["spec"]["threads"] != 4 || ok["metrics"]["throughput_fps"] != 19.97 ||
      ok["device"]["model"] != "Pixel 8" || ok["finished_at"] != "2024-05-01T12:30:00.250Z") {
    return fail("test_json_sink_document", "succeeded record fields are wrong");
  }
  if (ok["execution"].contains("stdout") || ok["metrics"]["cpu_utilization_pct"] != nullptr) {
    return fail("test_json_sink_document", "raw output should be omitted and absent metrics null");
  }

  const auto& bad = document["records"][1];
  if (bad["failure"] != "PROCESS_ERROR" || bad["metrics"]["throughput_fps"] != nullptr ||
      bad["metrics"]["error_line"].get<std::string>().find("Failed to compile") == std::string::npos) {
    return fail("test_json_sink_document", "failed record should carry null metrics and the error line");
  }

  options.include_raw = true;
  options.include_summary = false;
  JsonReportSink(options, logger).write(records, sample_manifest());
  const auto raw = nlohmann::json::parse(read_file(options.path));
  std::filesystem::remove_all(std::filesystem::path(options.path).parent_path());
  if (raw["records"][0]["execution"]["stdout"] != "Throughput: 1.0 FPS\n" || raw.contains("summary")) {
    return fail("test_json_sink_document", "include_raw should keep stdout, summary can be disabled");
  }
  return 0;
}

int test_csv_sink_rows_and_escaping() {
  if (csv_escape("plain") != "plain" || csv_escape("a,b") != "\"a,b\"" ||
      csv_escape("say \"hi\"") != "\"say \"\"hi\"\"\"" || csv_escape("two\nlines") != "\"two\nlines\"") {
    return fail("test_csv_sink_rows_and_escaping", "RFC 4180 quoting is wrong");
  }

  const auto& columns = csv_columns();
  const auto ok_row = csv_row(succeeded(0, 4, 2, 19.97, 50.02));
  const auto bad_row = csv_row(failed_process(1, 4, 0));
  if (ok_row.size() != columns.size() || bad_row.size() != columns.size() || columns.front() != "index" ||
      columns.back() != "message") {
    return fail("test_csv_sink_rows_and_escaping", "every row should have one cell per column");
  }

  const auto column = [&columns](const std::string& name) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (columns[i] == name) {
        return i;
      }
    }
    return columns.size();
  };
  if (ok_row[column("throughput_fps")] != "19.970" || ok_row[column("repeat_index")] != "2" ||
      ok_row[column("state")] != "SUCCEEDED" || !bad_row[column("throughput_fps")].empty() ||
      bad_row[column("message")] != "benchmark exited with code 1") {
    return fail("test_csv_sink_rows_and_escaping", "cells should flatten spec, outcome and metrics");
  }

  std::ostringstream log;
  Logger logger(log);
  const std::string path = temp_path("results.csv");
  CsvReportSink(path, logger).write({succeeded(0, 4, 0, 19.97, 50.02), failed_process(1, 4, 1)});
  const std::string text = read_file(path);
  std::filesystem::remove(path);

  std::istringstream lines(text);
  std::string header;
  std::getline(lines, header);
  std::size_t rows = 0;
  for (std::string line; std::getline(lines, line);) {
    ++rows;
  }
  if (header.rfind("index,device_id,model_name,threads", 0) != 0 || rows != 2) {
    return fail("test_csv_sink_rows_and_escaping", "file should hold a header and one line per record");
  }
  if (text.find("\"Failed") != std::string::npos || text.find("benchmark exited with code 1") == std::string::npos) {
    return fail("test_csv_sink_rows_and_escaping", "message column should prefer the outcome message");
  }
  return 0;
}

int test_stdout_sink_lines() {
  std::FILE* out = std::tmpfile();
  if (out == nullptr) {
    return fail("test_stdout_sink_lines", "tmpfile failed");
  }
  const std::vector<result_record> records = {succeeded(0, 4, 0, 19.97, 50.02), failed_process(1, 4, 1)};
  const ov_bench::sinks::StdoutReportSink sink(out);
  sink.publish(records);
  sink.publish_summary(summarize(records));

  std::fflush(out);
  std::rewind(out);
  std::string text;
  char buffer[512];
  while (std::fgets(buffer, sizeof(buffer), out) != nullptr) {
    text += buffer;
  }
  std::fclose(out);

  if (text.find("[result] #0") == std::string::npos || text.find("[result] #1") == std::string::npos ||
      text.find("[summary]") == std::string::npos) {
    return fail("test_stdout_sink_lines", "every record and summary should get a line");
  }
  return 0;
}

int test_redis_sink_creates_series_then_madd() {
  g_redis_mock = RedisMockState{};
  std::ostringstream log;
  Logger logger(log);
  RedisTsOptions options{};
  options.key_prefix = "bench";
  RedisTsSink sink(options, logger);

  const std::vector<result_record> records = {succeeded(0, 4, 0, 19.97, 50.02), failed_process(1, 4, 1),
                                              succeeded(2, 4, 1, 21.0, 48.0)};
  if (!sink.publish(records, sample_manifest())) {
    return fail("test_redis_sink_creates_series_then_madd", "publish should succeed against the mock");
  }

  const auto& calls = g_redis_mock.argv_calls;
  if (calls.size() != 3) {
    return fail("test_redis_sink_creates_series_then_madd", "two TS.CREATE and one TS.MADD expected");
  }

  const std::string throughput_key = "bench:ci-42:pixel:resnet:t4:s1:FP16:b1:throughput_fps";
  const auto& create = calls[0];
  if (create[0] != "TS.CREATE" || create[1] != throughput_key || create[2] != "DUPLICATE_POLICY" ||
      create[3] != "LAST" || create[4] != "LABELS" || create.size() != 5 + 2 * 9 || create[5] != "project" ||
      create[6] != "ov-bench" || create.back() != "throughput_fps") {
    return fail("test_redis_sink_creates_series_then_madd", "TS.CREATE should carry labels for the configuration");
  }
  if (calls[1][0] != "TS.CREATE" || calls[1][1] != "bench:ci-42:pixel:resnet:t4:s1:FP16:b1:latency_avg_ms") {
    return fail("test_redis_sink_creates_series_then_madd", "latency series should be created once");
  }

  const auto& madd = calls[2];
  const std::vector<std::string> expected = {
      "TS.MADD",
      throughput_key, "1714566600250", "19.970000",
      "bench:ci-42:pixel:resnet:t4:s1:FP16:b1:latency_avg_ms", "1714566600250", "50.020000",
      throughput_key, "1714566600252", "21.000000",
      "bench:ci-42:pixel:resnet:t4:s1:FP16:b1:latency_avg_ms", "1714566600252", "48.000000",
  };
  if (madd != expected) {
    return fail("test_redis_sink_creates_series_then_madd", "TS.MADD should batch every succeeded sample");
  }

  g_redis_mock.argv_calls.clear();
  if (!sink.publish({failed_process(0, 4, 0)}, sample_manifest()) || !g_redis_mock.argv_calls.empty()) {
    return fail("test_redis_sink_creates_series_then_madd", "nothing should be sent without succeeded records");
  }
  return 0;
}

int test_redis_sink_keeps_repeats_finishing_together() {
  g_redis_mock = RedisMockState{};
  std::ostringstream log;
  Logger logger(log);
  RedisTsSink sink(RedisTsOptions{}, logger);

  auto first = succeeded(0, 4, 0, 10.0, 5.0);
  auto second = succeeded(1, 4, 1, 12.0, 4.0);
  auto third = succeeded(2, 4, 2, 14.0, 3.0);
  first.finished_unix_ms = 1714566600250ULL;
  second.finished_unix_ms = 1714566600250ULL;
  third.finished_unix_ms = 1714566600251ULL;
  if (!sink.publish({first, second, third}, sample_manifest())) {
    return fail("test_redis_sink_keeps_repeats_finishing_together", "publish should succeed");
  }

  const auto& madd = g_redis_mock.argv_calls.back();
  const std::string key = "ov-bench:ci-42:pixel:resnet:t4:s1:FP16:b1:throughput_fps";
  std::vector<std::string> throughput_stamps;
  for (std::size_t i = 1; i + 2 < madd.size(); i += 3) {
    if (madd[i] == key) {
      throughput_stamps.push_back(madd[i + 1]);
    }
  }
  const std::vector<std::string> expected = {"1714566600250", "1714566600251", "1714566600252"};
  if (madd.front() != "TS.MADD" || throughput_stamps != expected) {
    return fail("test_redis_sink_keeps_repeats_finishing_together", "every repeat needs its own timestamp");
  }
  return 0;
}

int test_redis_sink_schema_errors() {
  g_redis_mock = RedisMockState{};
  g_redis_mock.create_error = "ERR TSDB: key already exists";
  std::ostringstream log;
  Logger logger(log);
  RedisTsSink existing(RedisTsOptions{}, logger);
  if (!existing.publish({succeeded(0, 4, 0, 1.0, 1.0)}, sample_manifest()) ||
      g_redis_mock.argv_calls.back()[0] != "TS.MADD") {
    return fail("test_redis_sink_schema_errors", "existing series should be reused");
  }

  g_redis_mock = RedisMockState{};
  g_redis_mock.create_error = "ERR unknown command 'TS.CREATE'";
  RedisTsSink missing_module(RedisTsOptions{}, logger);
  if (missing_module.publish({succeeded(0, 4, 0, 1.0, 1.0)}, sample_manifest()) ||
      g_redis_mock.argv_calls.size() != 1 || missing_module.check_connectivity()) {
    return fail("test_redis_sink_schema_errors", "missing module should fail once and disable the sink");
  }
  if (log.str().find("RedisTimeSeries module not available") == std::string::npos) {
    return fail("test_redis_sink_schema_errors", "missing module should be logged");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_make_result_record_classification(); rc != 0) return rc;
  if (int rc = test_aggregator_orders_by_index(); rc != 0) return rc;
  if (int rc = test_summary_statistics(); rc != 0) return rc;
  if (int rc = test_json_sink_document(); rc != 0) return rc;
  if (int rc = test_csv_sink_rows_and_escaping(); rc != 0) return rc;
  if (int rc = test_stdout_sink_lines(); rc != 0) return rc;
  if (int rc = test_redis_sink_creates_series_then_madd(); rc != 0) return rc;
  if (int rc = test_redis_sink_keeps_repeats_finishing_together(); rc != 0) return rc;
  if (int rc = test_redis_sink_schema_errors(); rc != 0) return rc;

  std::cout << "[PASS] report unit tests\n";
  return 0;
}

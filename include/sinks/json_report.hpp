#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/log.hpp"
#include "model/records.hpp"
#include "report/summary.hpp"

namespace ov_bench::sinks {

struct JsonReportOptions {
  std::string path{};
  bool include_summary{true};
  // Keep full benchmark stdout/stderr per record.
  bool include_raw{false};
};

nlohmann::json record_to_json(const model::result_record& record, bool include_raw);
nlohmann::json manifest_to_json(const model::run_manifest& manifest);
nlohmann::json summary_to_json(const std::vector<report::config_summary>& summaries);

// {"manifest": {...}, "records": [...], "summary": [...]} written atomically.
class JsonReportSink {
 public:
  JsonReportSink(JsonReportOptions options, core::Logger& logger);

  // Throws std::runtime_error when the file cannot be written.
  void write(const std::vector<model::result_record>& records, const model::run_manifest& manifest) const;

 private:
  JsonReportOptions options_;
  core::Logger& logger_;
};

}  // namespace ov_bench::sinks

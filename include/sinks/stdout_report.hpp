#pragma once

#include <cstdio>
#include <vector>

#include "model/records.hpp"
#include "report/summary.hpp"

namespace ov_bench::sinks {

// Human-readable table on a FILE stream, one line per record.
class StdoutReportSink {
 public:
  explicit StdoutReportSink(std::FILE* out = stdout) : out_(out) {}

  void publish(const std::vector<model::result_record>& records) const;
  void publish_summary(const std::vector<report::config_summary>& summaries) const;

 private:
  std::FILE* out_;
};

}  // namespace ov_bench::sinks

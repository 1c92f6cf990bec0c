#pragma once

#include <string>
#include <vector>

#include "core/log.hpp"
#include "model/records.hpp"

namespace ov_bench::sinks {

// Column names in output order.
const std::vector<std::string>& csv_columns();

// One flat row per record; absent metrics become empty cells.
std::vector<std::string> csv_row(const model::result_record& record);

std::string csv_escape(const std::string& cell);

class CsvReportSink {
 public:
  CsvReportSink(std::string path, core::Logger& logger);

  // Throws std::runtime_error when the file cannot be written.
  void write(const std::vector<model::result_record>& records) const;

 private:
  std::string path_;
  core::Logger& logger_;
};

}  // namespace ov_bench::sinks

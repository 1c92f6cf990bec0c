#pragma once

#include <string>

#include "model/records.hpp"

namespace ov_bench::parsers {

// Extracts benchmark_app metrics from raw tool output. Unrecognized lines are
// ignored. Without a "Throughput: <x> FPS" line the result is FAILED and every
// numeric field stays unset; with throughput and all four latency figures it
// is OK, otherwise PARTIAL.
model::metrics_record parse_benchmark_output(const std::string& stdout_text, const std::string& stderr_text = {});

}  // namespace ov_bench::parsers

#pragma once

#include <map>
#include <optional>
#include <string>

namespace ov_bench::devices {

// Parsers for the text a device prints while being probed by info().

// "[ro.product.model]: [Pixel 7]" lines from Android getprop.
std::map<std::string, std::string> parse_getprop(const std::string& text);

// MemTotal from /proc/meminfo, in GiB.
std::optional<double> parse_meminfo_total_gb(const std::string& text);

// "Hardware", "model name" or "Model" line from /proc/cpuinfo.
std::string parse_cpuinfo_model(const std::string& text);

// thermal_zone*/temp reports millidegrees Celsius.
std::optional<double> parse_thermal_zone_c(const std::string& text);

std::string trim(const std::string& value);

}  // namespace ov_bench::devices

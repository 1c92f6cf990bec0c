#include "devices/probe.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace ov_bench::devices {

std::string trim(const std::string& value) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0 || c == '\0'; };
  const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::map<std::string, std::string> parse_getprop(const std::string& text) {
  static const std::regex prop_re(R"(^\[([^\]]+)\]:\s*\[(.*)\]\s*$)");

  std::map<std::string, std::string> props;
  std::istringstream input(text);
  std::string line;
  std::smatch match;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (std::regex_match(line, match, prop_re) && match.size() >= 3) {
      props[match[1].str()] = match[2].str();
    }
  }
  return props;
}

std::optional<double> parse_meminfo_total_gb(const std::string& text) {
  static const std::regex total_re(R"(MemTotal:\s+(\d+)\s*kB)");

  std::smatch match;
  if (!std::regex_search(text, match, total_re) || match.size() < 2) {
    return std::nullopt;
  }

  const double kb = std::strtod(match[1].str().c_str(), nullptr);
  return std::round(kb / 1024.0 / 1024.0 * 100.0) / 100.0;
}

std::string parse_cpuinfo_model(const std::string& text) {
  static const std::regex model_re(R"(^(Hardware|model name|Model)\s*:\s*(.+)$)");

  std::istringstream input(text);
  std::string line;
  std::smatch match;
  while (std::getline(input, line)) {
    if (std::regex_match(line, match, model_re) && match.size() >= 3) {
      return trim(match[2].str());
    }
  }
  return {};
}

std::optional<double> parse_thermal_zone_c(const std::string& text) {
  const std::string value = trim(text);
  if (value.empty()) {
    return std::nullopt;
  }

  char* end = nullptr;
  const double milli = std::strtod(value.c_str(), &end);
  if (end == value.c_str() || !std::isfinite(milli)) {
    return std::nullopt;
  }
  return milli / 1000.0;
}

}  // namespace ov_bench::devices

#include "core/log.hpp"

#include <ostream>

namespace ov_bench::core {

Logger::Logger(std::ostream& out, const bool verbose) : out_(out), verbose_(verbose) {}

void Logger::info(const std::string_view tag, const std::string& message) { write(tag, {}, message); }

void Logger::warn(const std::string_view tag, const std::string& message) { write(tag, "warning: ", message); }

void Logger::debug(const std::string_view tag, const std::string& message) {
  if (!verbose_) {
    return;
  }
  write(tag, {}, message);
}

void Logger::write(const std::string_view tag, const std::string_view prefix, const std::string& message) {
  const std::lock_guard<std::mutex> lock(mutex_);
  out_ << '[' << tag << "] " << prefix << message << '\n';
  out_.flush();
}

}  // namespace ov_bench::core

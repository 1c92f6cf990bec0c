#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace ov_bench::core {

// Line-oriented component logger: "[tag] message". Passed explicitly to each
// component so independent pipelines can log to different streams.
class Logger {
 public:
  explicit Logger(std::ostream& out, bool verbose = false);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void info(std::string_view tag, const std::string& message);
  void warn(std::string_view tag, const std::string& message);
  void debug(std::string_view tag, const std::string& message);

  [[nodiscard]] bool verbose() const noexcept { return verbose_; }

 private:
  void write(std::string_view tag, std::string_view prefix, const std::string& message);

  std::ostream& out_;
  bool verbose_{false};
  std::mutex mutex_{};
};

}  // namespace ov_bench::core

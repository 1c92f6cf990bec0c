#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace ov_bench::core {

struct ProcessResult {
  int exit_code{-1};
  std::string stdout_text{};
  std::string stderr_text{};
  bool timed_out{false};
  double duration_s{0.0};
};

// Runs argv[0] from PATH with stdin bound to /dev/null and both output
// streams captured. A non-positive timeout waits indefinitely. On timeout the
// whole process group is killed and timed_out is set. exec failure reports
// exit code 127. Throws std::system_error when the child cannot be spawned.
ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

// POSIX sh single-quote escaping: the result is always one word.
std::string shell_quote(const std::string& value);

// Quotes every element and joins with spaces, for handing to a remote sh.
std::string join_shell_command(const std::vector<std::string>& argv);

}  // namespace ov_bench::core

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "model/records.hpp"

namespace ov_bench::runner {

struct CommandOptions {
  std::string executable{"benchmark_app"};
  std::string api{"sync"};
  std::uint32_t niter{200};
  std::uint32_t nireq{1};
  std::string inference_device{"CPU"};
  bool measure_resources{false};
  std::string time_binary{"/usr/bin/time"};
};

// Device-side locations for one invocation, all absolute.
struct InvocationPaths {
  std::string deploy_root{};
  std::string model{};
  std::string scratch_dir{};
  std::vector<std::string> inputs{};
  bool write_report{false};
};

// Device-side layout under a deploy root.
std::string bundle_bin_dir(const std::string& deploy_root);
std::string bundle_lib_dir(const std::string& deploy_root);
std::string models_dir(const std::string& deploy_root);
std::string scratch_dir(const std::string& deploy_root, std::size_t invocation_index);
std::string remote_basename(const std::string& path);

class CommandBuilder {
 public:
  explicit CommandBuilder(CommandOptions options);

  // benchmark_app argv for one invocation; every spec field maps to exactly
  // one flag.
  std::vector<std::string> build(const model::invocation_spec& spec, const InvocationPaths& paths) const;

  // Short latency-hinted run used to warm caches before measuring a model.
  std::vector<std::string> build_warmup(const std::string& deploy_root, const std::string& model_path) const;

  const CommandOptions& options() const noexcept { return options_; }

 private:
  std::vector<std::string> launcher(const std::string& deploy_root) const;

  CommandOptions options_;
};

std::string format_command(const std::vector<std::string>& argv);

}  // namespace ov_bench::runner

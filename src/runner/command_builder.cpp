#include "runner/command_builder.hpp"

#include <utility>

#include "core/process.hpp"

namespace ov_bench::runner {

namespace {

constexpr std::uint32_t kWarmupIterations = 10;

std::string join_path(const std::string& base, const std::string& leaf) {
  if (!base.empty() && base.back() == '/') {
    return base + leaf;
  }
  return base + "/" + leaf;
}

}  // namespace

std::string bundle_bin_dir(const std::string& deploy_root) { return join_path(deploy_root, "bin"); }

std::string bundle_lib_dir(const std::string& deploy_root) { return join_path(deploy_root, "lib"); }

std::string models_dir(const std::string& deploy_root) { return join_path(deploy_root, "models"); }

std::string scratch_dir(const std::string& deploy_root, const std::size_t invocation_index) {
  return join_path(join_path(deploy_root, "scratch"), std::to_string(invocation_index));
}

std::string remote_basename(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

CommandBuilder::CommandBuilder(CommandOptions options) : options_(std::move(options)) {}

std::vector<std::string> CommandBuilder::launcher(const std::string& deploy_root) const {
  std::vector<std::string> argv;
  if (options_.measure_resources) {
    argv.push_back(options_.time_binary);
    argv.emplace_back("-v");
  }
  argv.emplace_back("env");
  argv.push_back("LD_LIBRARY_PATH=" + bundle_lib_dir(deploy_root));
  argv.push_back(join_path(bundle_bin_dir(deploy_root), options_.executable));
  return argv;
}

std::vector<std::string> CommandBuilder::build(const model::invocation_spec& spec, const InvocationPaths& paths) const {
  std::vector<std::string> argv = launcher(paths.deploy_root);

  const auto flag = [&argv](const char* name, std::string value) {
    argv.emplace_back(name);
    argv.push_back(std::move(value));
  };

  flag("-m", paths.model);
  flag("-d", options_.inference_device);
  flag("-api", options_.api);
  flag("-niter", std::to_string(options_.niter));
  flag("-nireq", std::to_string(options_.nireq));
  // Explicit threads/streams only take effect without a performance hint.
  flag("-hint", "none");
  flag("-nthreads", std::to_string(spec.threads));
  flag("-nstreams", std::to_string(spec.streams));
  flag("-infer_precision", spec.precision);
  flag("-b", std::to_string(spec.batch));

  if (!paths.inputs.empty()) {
    std::string joined;
    for (const auto& input : paths.inputs) {
      if (!joined.empty()) {
        joined.push_back(',');
      }
      joined += input;
    }
    flag("-i", joined);
  }

  if (paths.write_report) {
    flag("-report_type", "no_counters");
    flag("-report_folder", paths.scratch_dir);
  }

  return argv;
}

std::vector<std::string> CommandBuilder::build_warmup(const std::string& deploy_root, const std::string& model_path) const {
  std::vector<std::string> argv = launcher(deploy_root);
  argv.emplace_back("-m");
  argv.push_back(model_path);
  argv.emplace_back("-d");
  argv.push_back(options_.inference_device);
  argv.emplace_back("-api");
  argv.emplace_back("sync");
  argv.emplace_back("-niter");
  argv.push_back(std::to_string(kWarmupIterations));
  argv.emplace_back("-hint");
  argv.emplace_back("latency");
  return argv;
}

std::string format_command(const std::vector<std::string>& argv) { return core::join_shell_command(argv); }

}  // namespace ov_bench::runner

#include "devices/ssh_device.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"
#include "devices/probe.hpp"

namespace ov_bench::devices {

using core::BenchError;
using core::ErrorKind;

namespace {

// OpenSSH exits with 255 when the connection itself failed.
constexpr int kSshTransportExit = 255;

}  // namespace

bool is_safe_remote_path(const std::string& path) {
  if (path.empty()) {
    return false;
  }
  for (const char c : path) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '/' || c == '.' || c == '_' ||
                    c == '-' || c == '+' || c == '@' || c == ',';
    if (!ok) {
      return false;
    }
  }
  return true;
}

SshDevice::SshDevice(model::device_target target, DeviceOptions options)
    : target_(std::move(target)), options_(std::move(options)) {}

const std::string& SshDevice::id() const { return target_.id; }

std::string SshDevice::destination() const {
  return target_.user.empty() ? target_.host : target_.user + "@" + target_.host;
}

std::vector<std::string> SshDevice::shell_argv(const std::vector<std::string>& argv) const {
  std::vector<std::string> remote_argv;
  if (target_.use_root) {
    remote_argv = {"sudo", "-n"};
  }
  remote_argv.insert(remote_argv.end(), argv.begin(), argv.end());

  std::vector<std::string> full{options_.ssh_executable,
                                "-p",
                                std::to_string(target_.port),
                                "-o",
                                "BatchMode=yes",
                                "-o",
                                "ConnectTimeout=" + std::to_string(options_.ssh_connect_timeout.count()),
                                "-o",
                                "StrictHostKeyChecking=accept-new"};
  if (!target_.key_path.empty()) {
    full.emplace_back("-i");
    full.push_back(target_.key_path);
  }
  full.push_back(destination());
  full.push_back(core::join_shell_command(remote_argv));
  return full;
}

std::vector<std::string> SshDevice::scp_argv(const std::string& from, const std::string& to) const {
  std::vector<std::string> full{options_.scp_executable,
                                "-P",
                                std::to_string(target_.port),
                                "-B",
                                "-q",
                                "-r",
                                "-o",
                                "ConnectTimeout=" + std::to_string(options_.ssh_connect_timeout.count()),
                                "-o",
                                "StrictHostKeyChecking=accept-new"};
  if (!target_.key_path.empty()) {
    full.emplace_back("-i");
    full.push_back(target_.key_path);
  }
  full.push_back(from);
  full.push_back(to);
  return full;
}

void SshDevice::check_transport(const core::ProcessResult& result, const std::string& operation) const {
  if (result.timed_out) {
    throw BenchError(ErrorKind::Timeout, target_.id + ": " + operation + " timed out");
  }
  // 127 alone may be the remote shell's "command not found"; only a local
  // exec failure of the ssh client is a transport problem.
  const bool client_missing = result.exit_code == 127 && result.stderr_text.rfind("exec failed:", 0) == 0;
  if (result.exit_code == kSshTransportExit || client_missing) {
    throw BenchError(ErrorKind::DeviceUnreachable,
                     target_.id + ": " + operation + " failed (rc=" + std::to_string(result.exit_code) +
                         "): " + trim(result.stderr_text));
  }
}

void SshDevice::push(const std::string& local, const std::string& remote) {
  if (!is_safe_remote_path(remote)) {
    throw std::invalid_argument("unsafe remote path for scp: " + remote);
  }

  const auto result = core::run_process(scp_argv(local, destination() + ":" + remote), options_.transfer_timeout);
  check_transport(result, "push " + local);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::DeviceUnreachable, target_.id + ": push " + local + " -> " + remote +
                                                       " failed: " + trim(result.stderr_text));
  }
}

void SshDevice::pull(const std::string& remote, const std::string& local) {
  if (!is_safe_remote_path(remote)) {
    throw std::invalid_argument("unsafe remote path for scp: " + remote);
  }

  const auto result = core::run_process(scp_argv(destination() + ":" + remote, local), options_.transfer_timeout);
  check_transport(result, "pull " + remote);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::DeviceUnreachable, target_.id + ": pull " + remote + " -> " + local +
                                                       " failed: " + trim(result.stderr_text));
  }
}

ShellResult SshDevice::shell(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  const auto result = core::run_process(shell_argv(argv), timeout);
  check_transport(result, "shell");
  return ShellResult{result.exit_code, result.stdout_text, result.stderr_text};
}

bool SshDevice::exists(const std::string& path) {
  const auto result = shell({"test", "-e", path}, options_.control_timeout);
  if (result.exit_code == 0) {
    return true;
  }
  if (result.exit_code == 1) {
    return false;
  }
  throw BenchError(ErrorKind::ProcessError, target_.id + ": test -e " + path + " returned " + std::to_string(result.exit_code));
}

void SshDevice::mkdir(const std::string& path) {
  const auto result = shell({"mkdir", "-p", path}, options_.control_timeout);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::ProcessError, target_.id + ": mkdir " + path + " failed: " + trim(result.stderr_text));
  }
}

void SshDevice::remove(const std::string& path) {
  const auto result = shell({"rm", "-rf", path}, options_.control_timeout);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::ProcessError, target_.id + ": rm " + path + " failed: " + trim(result.stderr_text));
  }
}

model::device_info SshDevice::info() {
  model::device_info info{};
  info.id = target_.id;
  info.address = target_.address();

  const auto uname = shell({"uname", "-s", "-r", "-m"}, options_.control_timeout);
  if (uname.exit_code != 0) {
    throw BenchError(ErrorKind::DeviceUnreachable, target_.id + ": uname failed: " + trim(uname.stderr_text));
  }

  std::istringstream fields(uname.stdout_text);
  fields >> info.os >> info.os_version >> info.abi;

  const auto cpuinfo = shell({"cat", "/proc/cpuinfo"}, options_.control_timeout);
  if (cpuinfo.exit_code == 0) {
    info.cpu = parse_cpuinfo_model(cpuinfo.stdout_text);
  }

  const auto board = shell({"cat", "/proc/device-tree/model"}, options_.control_timeout);
  if (board.exit_code == 0) {
    info.model = trim(board.stdout_text);
  }

  const auto meminfo = shell({"cat", "/proc/meminfo"}, options_.control_timeout);
  if (meminfo.exit_code == 0) {
    info.memory_gb = parse_meminfo_total_gb(meminfo.stdout_text);
  }

  const auto thermal = shell({"cat", "/sys/class/thermal/thermal_zone0/temp"}, options_.control_timeout);
  if (thermal.exit_code == 0) {
    info.temperature_c = parse_thermal_zone_c(thermal.stdout_text);
  }

  return info;
}

}  // namespace ov_bench::devices

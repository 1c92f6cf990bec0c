#include "devices/adb_device.hpp"

#include <array>
#include <utility>

#include "core/errors.hpp"
#include "devices/probe.hpp"

namespace ov_bench::devices {

using core::BenchError;
using core::ErrorKind;

namespace {

std::string describe(const core::ProcessResult& result) {
  const std::string detail = trim(!result.stderr_text.empty() ? result.stderr_text : result.stdout_text);
  return "rc=" + std::to_string(result.exit_code) + (detail.empty() ? "" : ": " + detail);
}

}  // namespace

bool is_adb_transport_error(const std::string& stderr_text) {
  static const std::array<const char*, 8> kPatterns = {
      "error: device",        "no devices/emulators found", "device offline",  "device unauthorized",
      "error: closed",        "cannot connect to daemon",   "exec failed:",    "error: protocol fault",
  };

  for (const char* pattern : kPatterns) {
    if (stderr_text.find(pattern) != std::string::npos) {
      return true;
    }
  }
  return false;
}

AdbDevice::AdbDevice(model::device_target target, DeviceOptions options)
    : target_(std::move(target)), options_(std::move(options)) {}

const std::string& AdbDevice::id() const { return target_.id; }

std::vector<std::string> AdbDevice::shell_argv(const std::vector<std::string>& argv) const {
  std::string remote = core::join_shell_command(argv);
  if (target_.use_root) {
    remote = "su -c " + core::shell_quote(remote);
  }
  return {options_.adb_executable, "-s", target_.serial, "shell", remote};
}

core::ProcessResult AdbDevice::run_adb(std::vector<std::string> args, const std::chrono::milliseconds timeout) const {
  std::vector<std::string> full{options_.adb_executable, "-s", target_.serial};
  full.insert(full.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
  return core::run_process(full, timeout);
}

void AdbDevice::check_transport(const core::ProcessResult& result, const std::string& operation) const {
  if (result.timed_out) {
    throw BenchError(ErrorKind::Timeout, target_.id + ": " + operation + " timed out");
  }
  if (result.exit_code != 0 && is_adb_transport_error(result.stderr_text)) {
    throw BenchError(ErrorKind::DeviceUnreachable, target_.id + ": " + operation + " failed, " + describe(result));
  }
}

void AdbDevice::push(const std::string& local, const std::string& remote) {
  const auto result = run_adb({"push", local, remote}, options_.transfer_timeout);
  check_transport(result, "push " + local);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::DeviceUnreachable, target_.id + ": push " + local + " -> " + remote + " failed, " + describe(result));
  }
}

void AdbDevice::pull(const std::string& remote, const std::string& local) {
  const auto result = run_adb({"pull", remote, local}, options_.transfer_timeout);
  check_transport(result, "pull " + remote);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::DeviceUnreachable, target_.id + ": pull " + remote + " -> " + local + " failed, " + describe(result));
  }
}

ShellResult AdbDevice::shell(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  const auto result = core::run_process(shell_argv(argv), timeout);
  check_transport(result, "shell");
  return ShellResult{result.exit_code, result.stdout_text, result.stderr_text};
}

bool AdbDevice::exists(const std::string& path) {
  const auto result = shell({"test", "-e", path}, options_.control_timeout);
  if (result.exit_code == 0) {
    return true;
  }
  if (result.exit_code == 1) {
    return false;
  }
  throw BenchError(ErrorKind::ProcessError, target_.id + ": test -e " + path + " returned " + std::to_string(result.exit_code));
}

void AdbDevice::mkdir(const std::string& path) {
  const auto result = shell({"mkdir", "-p", path}, options_.control_timeout);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::ProcessError, target_.id + ": mkdir " + path + " failed: " + trim(result.stderr_text));
  }
}

void AdbDevice::remove(const std::string& path) {
  const auto result = shell({"rm", "-rf", path}, options_.control_timeout);
  if (result.exit_code != 0) {
    throw BenchError(ErrorKind::ProcessError, target_.id + ": rm " + path + " failed: " + trim(result.stderr_text));
  }
}

model::device_info AdbDevice::info() {
  model::device_info info{};
  info.id = target_.id;
  info.address = target_.address();
  info.os = "Android";

  const auto props_result = shell({"getprop"}, options_.control_timeout);
  if (props_result.exit_code != 0) {
    throw BenchError(ErrorKind::DeviceUnreachable, target_.id + ": getprop failed: " + trim(props_result.stderr_text));
  }

  const auto props = parse_getprop(props_result.stdout_text);
  const auto prop = [&props](const char* key) -> std::string {
    const auto it = props.find(key);
    return it == props.end() ? std::string{} : it->second;
  };
  info.os_version = prop("ro.build.version.release");
  info.model = prop("ro.product.model");
  info.abi = prop("ro.product.cpu.abi");
  for (const char* key : {"ro.build.version.sdk", "ro.product.manufacturer", "ro.hardware", "ro.board.platform"}) {
    const std::string value = prop(key);
    if (!value.empty()) {
      info.properties[key] = value;
    }
  }

  const auto cpuinfo = shell({"cat", "/proc/cpuinfo"}, options_.control_timeout);
  if (cpuinfo.exit_code == 0) {
    info.cpu = parse_cpuinfo_model(cpuinfo.stdout_text);
  }
  if (info.cpu.empty()) {
    info.cpu = prop("ro.hardware");
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

std::vector<std::vector<std::string>> AdbDevice::tuning_commands() const {
  return {
      {"settings", "put", "global", "window_animation_scale", "0"},
      {"settings", "put", "global", "transition_animation_scale", "0"},
      {"settings", "put", "global", "animator_duration_scale", "0"},
      {"input", "keyevent", "KEYCODE_SLEEP"},
  };
}

}  // namespace ov_bench::devices

#pragma once

#include <string>
#include <vector>

#include "core/process.hpp"
#include "devices/device.hpp"

namespace ov_bench::devices {

// Android target driven through the adb client binary.
class AdbDevice final : public Device {
 public:
  AdbDevice(model::device_target target, DeviceOptions options);

  const std::string& id() const override;

  void push(const std::string& local, const std::string& remote) override;
  void pull(const std::string& remote, const std::string& local) override;
  ShellResult shell(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
  bool exists(const std::string& path) override;
  void mkdir(const std::string& path) override;
  void remove(const std::string& path) override;
  model::device_info info() override;

  std::vector<std::vector<std::string>> tuning_commands() const override;

  // Local argv that runs `argv` on the device through `adb shell`.
  std::vector<std::string> shell_argv(const std::vector<std::string>& argv) const;

 private:
  core::ProcessResult run_adb(std::vector<std::string> args, std::chrono::milliseconds timeout) const;
  void check_transport(const core::ProcessResult& result, const std::string& operation) const;

  model::device_target target_;
  DeviceOptions options_;
};

// adb reports lost/offline/unauthorized targets on stderr with a non-zero
// exit status; these are transport failures rather than remote exit codes.
bool is_adb_transport_error(const std::string& stderr_text);

}  // namespace ov_bench::devices

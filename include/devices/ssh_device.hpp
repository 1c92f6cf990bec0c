#pragma once

#include <string>
#include <vector>

#include "core/process.hpp"
#include "devices/device.hpp"

namespace ov_bench::devices {

// Linux host reachable over OpenSSH; file transfer goes through scp.
class SshDevice final : public Device {
 public:
  SshDevice(model::device_target target, DeviceOptions options);

  const std::string& id() const override;

  void push(const std::string& local, const std::string& remote) override;
  void pull(const std::string& remote, const std::string& local) override;
  ShellResult shell(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
  bool exists(const std::string& path) override;
  void mkdir(const std::string& path) override;
  void remove(const std::string& path) override;
  model::device_info info() override;

  std::vector<std::string> shell_argv(const std::vector<std::string>& argv) const;
  std::vector<std::string> scp_argv(const std::string& from, const std::string& to) const;
  std::string destination() const;

 private:
  void check_transport(const core::ProcessResult& result, const std::string& operation) const;

  model::device_target target_;
  DeviceOptions options_;
};

// scp may hand the remote path to a shell on the far side, so only a
// conservative character set is accepted there.
bool is_safe_remote_path(const std::string& path);

}  // namespace ov_bench::devices

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "model/records.hpp"

namespace ov_bench::devices {

struct ShellResult {
  int exit_code{-1};
  std::string stdout_text{};
  std::string stderr_text{};
};

struct DeviceOptions {
  std::string adb_executable{"adb"};
  std::string ssh_executable{"ssh"};
  std::string scp_executable{"scp"};
  std::chrono::milliseconds transfer_timeout{std::chrono::minutes(10)};
  std::chrono::milliseconds control_timeout{std::chrono::seconds(30)};
  std::chrono::seconds ssh_connect_timeout{10};
};

// Capability surface over one remote target. Every call blocks until the
// operation completes, fails, or times out.
//
// Failure contract:
//   - transport failures throw core::BenchError{DeviceUnreachable};
//   - shell() throws core::BenchError{Timeout} once its bound expires, leaving
//     the remote process in an indeterminate state;
//   - mkdir()/remove() rejected by a reachable device throw ProcessError.
// Remote commands are argv vectors; implementations escape every element.
class Device {
 public:
  virtual ~Device() = default;

  virtual const std::string& id() const = 0;

  virtual void push(const std::string& local, const std::string& remote) = 0;
  virtual void pull(const std::string& remote, const std::string& local) = 0;
  virtual ShellResult shell(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
  virtual bool exists(const std::string& path) = 0;
  virtual void mkdir(const std::string& path) = 0;
  virtual void remove(const std::string& path) = 0;
  virtual model::device_info info() = 0;

  // Best-effort benchmarking hygiene commands (animations, screen, ...).
  virtual std::vector<std::vector<std::string>> tuning_commands() const { return {}; }
};

std::unique_ptr<Device> make_device(const model::device_target& target, const DeviceOptions& options);

// Default deploy root per platform when the target sets no push_dir.
std::string default_push_dir(model::device_kind kind);

}  // namespace ov_bench::devices

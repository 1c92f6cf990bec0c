#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "devices/device.hpp"

namespace ov_bench::devices {

// In-memory device: a path set stands in for the remote filesystem and shell
// commands are answered by a scripted handler. Thread-safe.
class StubDevice final : public Device {
 public:
  using ShellHandler = std::function<ShellResult(const std::vector<std::string>&, std::chrono::milliseconds)>;

  explicit StubDevice(std::string id);

  const std::string& id() const override;

  void push(const std::string& local, const std::string& remote) override;
  void pull(const std::string& remote, const std::string& local) override;
  ShellResult shell(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
  bool exists(const std::string& path) override;
  void mkdir(const std::string& path) override;
  void remove(const std::string& path) override;
  model::device_info info() override;

  std::vector<std::vector<std::string>> tuning_commands() const override;

  void set_shell_handler(ShellHandler handler);
  void set_reachable(bool reachable);
  void set_read_only(bool read_only);
  void set_tuning_commands(std::vector<std::vector<std::string>> commands);

  bool has_path(const std::string& path) const;
  std::vector<std::string> paths() const;
  std::vector<std::string> pushes() const;
  std::vector<std::string> pulls() const;
  std::vector<std::vector<std::string>> commands() const;
  std::size_t info_calls() const;

 private:
  void ensure_reachable(const char* operation) const;
  bool exists_locked(const std::string& path) const;

  std::string id_;
  mutable std::mutex mutex_{};
  ShellHandler handler_{};
  bool reachable_{true};
  bool read_only_{false};
  std::set<std::string> paths_{};
  std::vector<std::string> pushes_{};
  std::vector<std::string> pulls_{};
  std::vector<std::vector<std::string>> commands_{};
  std::vector<std::vector<std::string>> tuning_{};
  std::size_t info_calls_{0};
};

}  // namespace ov_bench::devices

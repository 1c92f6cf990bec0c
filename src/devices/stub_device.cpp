#include "devices/stub_device.hpp"

#include <utility>

#include "core/errors.hpp"

namespace ov_bench::devices {

using core::BenchError;
using core::ErrorKind;

namespace {

bool is_under(const std::string& candidate, const std::string& dir) {
  return candidate.size() > dir.size() && candidate.compare(0, dir.size(), dir) == 0 && candidate[dir.size()] == '/';
}

}  // namespace

StubDevice::StubDevice(std::string id) : id_(std::move(id)) {}

const std::string& StubDevice::id() const { return id_; }

void StubDevice::ensure_reachable(const char* operation) const {
  if (!reachable_) {
    throw BenchError(ErrorKind::DeviceUnreachable, id_ + ": " + operation + " on unreachable stub");
  }
}

bool StubDevice::exists_locked(const std::string& path) const {
  if (paths_.count(path) != 0) {
    return true;
  }
  const auto it = paths_.lower_bound(path + "/");
  return it != paths_.end() && is_under(*it, path);
}

void StubDevice::push(const std::string& local, const std::string& remote) {
  const std::lock_guard<std::mutex> lock(mutex_);
  ensure_reachable("push");
  if (read_only_) {
    throw BenchError(ErrorKind::DeviceUnreachable, id_ + ": push " + local + " rejected, read-only filesystem");
  }
  pushes_.push_back(remote);
  paths_.insert(remote);
}

void StubDevice::pull(const std::string& remote, const std::string& local) {
  const std::lock_guard<std::mutex> lock(mutex_);
  ensure_reachable("pull");
  if (!exists_locked(remote)) {
    throw BenchError(ErrorKind::DeviceUnreachable, id_ + ": pull " + remote + " -> " + local + ", no such file");
  }
  pulls_.push_back(remote);
}

ShellResult StubDevice::shell(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  ShellHandler handler;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    ensure_reachable("shell");
    commands_.push_back(argv);
    handler = handler_;
  }

  if (!handler) {
    return ShellResult{0, {}, {}};
  }
  return handler(argv, timeout);
}

bool StubDevice::exists(const std::string& path) {
  const std::lock_guard<std::mutex> lock(mutex_);
  ensure_reachable("exists");
  return exists_locked(path);
}

void StubDevice::mkdir(const std::string& path) {
  const std::lock_guard<std::mutex> lock(mutex_);
  ensure_reachable("mkdir");
  if (read_only_) {
    throw BenchError(ErrorKind::ProcessError, id_ + ": mkdir " + path + " rejected, read-only filesystem");
  }
  paths_.insert(path);
}

void StubDevice::remove(const std::string& path) {
  const std::lock_guard<std::mutex> lock(mutex_);
  ensure_reachable("remove");
  for (auto it = paths_.begin(); it != paths_.end();) {
    if (*it == path || is_under(*it, path)) {
      it = paths_.erase(it);
    } else {
      ++it;
    }
  }
}

model::device_info StubDevice::info() {
  const std::lock_guard<std::mutex> lock(mutex_);
  ++info_calls_;
  ensure_reachable("info");

  model::device_info info{};
  info.id = id_;
  info.address = "stub:" + id_;
  info.os = "Stub";
  info.model = "stub-device";
  return info;
}

std::vector<std::vector<std::string>> StubDevice::tuning_commands() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return tuning_;
}

void StubDevice::set_shell_handler(ShellHandler handler) {
  const std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void StubDevice::set_reachable(const bool reachable) {
  const std::lock_guard<std::mutex> lock(mutex_);
  reachable_ = reachable;
}

void StubDevice::set_read_only(const bool read_only) {
  const std::lock_guard<std::mutex> lock(mutex_);
  read_only_ = read_only;
}

void StubDevice::set_tuning_commands(std::vector<std::vector<std::string>> commands) {
  const std::lock_guard<std::mutex> lock(mutex_);
  tuning_ = std::move(commands);
}

bool StubDevice::has_path(const std::string& path) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return exists_locked(path);
}

std::vector<std::string> StubDevice::paths() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return {paths_.begin(), paths_.end()};
}

std::vector<std::string> StubDevice::pushes() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return pushes_;
}

std::vector<std::string> StubDevice::pulls() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return pulls_;
}

std::vector<std::vector<std::string>> StubDevice::commands() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return commands_;
}

std::size_t StubDevice::info_calls() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return info_calls_;
}

}  // namespace ov_bench::devices

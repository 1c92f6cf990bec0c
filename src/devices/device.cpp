#include "devices/device.hpp"

#include "devices/adb_device.hpp"
#include "devices/ssh_device.hpp"

namespace ov_bench::devices {

std::unique_ptr<Device> make_device(const model::device_target& target, const DeviceOptions& options) {
  switch (target.kind) {
    case model::device_kind::ADB:
      return std::make_unique<AdbDevice>(target, options);
    case model::device_kind::SSH:
      return std::make_unique<SshDevice>(target, options);
  }
  return nullptr;
}

std::string default_push_dir(const model::device_kind kind) {
  switch (kind) {
    case model::device_kind::ADB:
      return "/data/local/tmp/ov-bench";
    case model::device_kind::SSH:
      return "/tmp/ov-bench";
  }
  return "/tmp/ov-bench";
}

}  // namespace ov_bench::devices

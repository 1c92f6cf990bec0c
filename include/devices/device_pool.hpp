#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/log.hpp"
#include "devices/device.hpp"
#include "model/records.hpp"

namespace ov_bench::devices {

// One lazily constructed handle per configured target. Probing is a single
// info() call; the pool never reconnects or retries on its own.
class DevicePool {
 private:
  struct Slot {
    model::device_target target{};
    std::mutex op_mutex{};
    std::unique_ptr<Device> handle{};
    model::device_health health{model::device_health::UNKNOWN};
    model::device_info info{};
  };

 public:
  using Factory = std::function<std::unique_ptr<Device>(const model::device_target&)>;

  // Exclusive access to one device for the lifetime of the lease.
  class Lease {
   public:
    Lease(Lease&&) noexcept = default;
    Lease& operator=(Lease&&) noexcept = default;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    // Resolves and probes on first use; throws DeviceUnreachable.
    Device& device();
    const model::device_target& target() const;
    model::device_info info() const;

   private:
    friend class DevicePool;
    Lease(DevicePool& pool, Slot& slot);

    DevicePool* pool_;
    Slot* slot_;
    std::unique_lock<std::mutex> lock_;
    Device* device_{nullptr};
  };

  DevicePool(std::vector<model::device_target> targets, Factory factory, core::Logger& logger);

  DevicePool(const DevicePool&) = delete;
  DevicePool& operator=(const DevicePool&) = delete;

  // Throws DeviceNotFound for unknown ids and DeviceUnreachable when the
  // probe fails.
  Device& resolve(const std::string& id);

  // Blocks until no other lease for `id` is alive. Throws DeviceNotFound.
  Lease acquire(const std::string& id);

  bool contains(const std::string& id) const;
  const model::device_target& target(const std::string& id) const;
  model::device_health health(const std::string& id) const;
  // Snapshot from the last successful probe; only id and address before one.
  model::device_info last_info(const std::string& id) const;
  std::map<std::string, model::device_health> health_snapshot() const;
  std::vector<std::string> ids() const;

 private:
  Slot& slot(const std::string& id) const;
  Device& resolve_locked(Slot& slot);

  std::vector<std::unique_ptr<Slot>> slots_{};
  std::unordered_map<std::string, Slot*> index_{};
  Factory factory_;
  core::Logger& logger_;
  mutable std::mutex state_mutex_{};
};

}  // namespace ov_bench::devices

#include "devices/device_pool.hpp"

#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace ov_bench::devices {

using core::BenchError;
using core::ErrorKind;

DevicePool::Lease::Lease(DevicePool& pool, Slot& slot) : pool_(&pool), slot_(&slot), lock_(slot.op_mutex) {}

Device& DevicePool::Lease::device() {
  if (device_ == nullptr) {
    device_ = &pool_->resolve_locked(*slot_);
  }
  return *device_;
}

const model::device_target& DevicePool::Lease::target() const { return slot_->target; }

model::device_info DevicePool::Lease::info() const {
  const std::lock_guard<std::mutex> lock(pool_->state_mutex_);
  return slot_->info;
}

DevicePool::DevicePool(std::vector<model::device_target> targets, Factory factory, core::Logger& logger)
    : factory_(std::move(factory)), logger_(logger) {
  slots_.reserve(targets.size());
  for (auto& target : targets) {
    if (index_.count(target.id) != 0) {
      throw std::invalid_argument("duplicate device id: " + target.id);
    }

    auto slot = std::make_unique<Slot>();
    slot->target = std::move(target);
    slot->info.id = slot->target.id;
    slot->info.address = slot->target.address();
    index_[slot->target.id] = slot.get();
    slots_.push_back(std::move(slot));
  }
}

DevicePool::Slot& DevicePool::slot(const std::string& id) const {
  const auto it = index_.find(id);
  if (it == index_.end()) {
    throw BenchError(ErrorKind::DeviceNotFound, "device '" + id + "' is not configured");
  }
  return *it->second;
}

Device& DevicePool::resolve(const std::string& id) {
  Slot& target_slot = slot(id);
  const std::lock_guard<std::mutex> lock(target_slot.op_mutex);
  return resolve_locked(target_slot);
}

DevicePool::Lease DevicePool::acquire(const std::string& id) { return Lease(*this, slot(id)); }

Device& DevicePool::resolve_locked(Slot& target_slot) {
  const std::string& id = target_slot.target.id;

  if (target_slot.handle == nullptr) {
    target_slot.handle = factory_(target_slot.target);
    if (target_slot.handle == nullptr) {
      throw BenchError(ErrorKind::DeviceNotFound, "no device handle available for '" + id + "'");
    }
  }

  model::device_info probed{};
  try {
    probed = target_slot.handle->info();
  } catch (const std::exception& ex) {
    bool was_reachable = false;
    {
      const std::lock_guard<std::mutex> lock(state_mutex_);
      was_reachable = target_slot.health != model::device_health::UNREACHABLE;
      target_slot.health = model::device_health::UNREACHABLE;
    }
    if (was_reachable) {
      logger_.warn("pool", "device " + id + " unreachable: " + ex.what());
    }
    throw BenchError(ErrorKind::DeviceUnreachable, "probe of '" + id + "' failed: " + ex.what());
  }

  bool recovered = false;
  {
    const std::lock_guard<std::mutex> lock(state_mutex_);
    recovered = target_slot.health != model::device_health::REACHABLE;
    target_slot.health = model::device_health::REACHABLE;
    target_slot.info = std::move(probed);
  }
  if (recovered) {
    logger_.info("pool", "device " + id + " reachable at " + target_slot.target.address());
  }

  return *target_slot.handle;
}

bool DevicePool::contains(const std::string& id) const { return index_.count(id) != 0; }

const model::device_target& DevicePool::target(const std::string& id) const { return slot(id).target; }

model::device_health DevicePool::health(const std::string& id) const {
  const Slot& target_slot = slot(id);
  const std::lock_guard<std::mutex> lock(state_mutex_);
  return target_slot.health;
}

model::device_info DevicePool::last_info(const std::string& id) const {
  const Slot& target_slot = slot(id);
  const std::lock_guard<std::mutex> lock(state_mutex_);
  return target_slot.info;
}

std::map<std::string, model::device_health> DevicePool::health_snapshot() const {
  std::map<std::string, model::device_health> out;
  const std::lock_guard<std::mutex> lock(state_mutex_);
  for (const auto& target_slot : slots_) {
    out[target_slot->target.id] = target_slot->health;
  }
  return out;
}

std::vector<std::string> DevicePool::ids() const {
  std::vector<std::string> out;
  out.reserve(slots_.size());
  for (const auto& target_slot : slots_) {
    out.push_back(target_slot->target.id);
  }
  return out;
}

}  // namespace ov_bench::devices

#include "matrix/matrix_expander.hpp"

#include <limits>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "core/errors.hpp"

namespace ov_bench::matrix {

using core::BenchError;
using core::ErrorKind;

namespace {

template <typename T>
void require_non_empty(const std::vector<T>& values, const char* axis) {
  if (values.empty()) {
    throw BenchError(ErrorKind::InvalidMatrix, std::string("matrix axis '") + axis + "' is empty");
  }
}

std::size_t checked_multiply(const std::size_t lhs, const std::size_t rhs) {
  if (rhs != 0 && lhs > std::numeric_limits<std::size_t>::max() / rhs) {
    throw BenchError(ErrorKind::InvalidMatrix, "matrix size overflows");
  }
  return lhs * rhs;
}

}  // namespace

MatrixExpander::MatrixExpander(MatrixAxes axes) : axes_(std::move(axes)) {
  require_non_empty(axes_.devices, "devices");
  require_non_empty(axes_.models, "models");
  require_non_empty(axes_.threads, "threads");
  require_non_empty(axes_.streams, "streams");
  require_non_empty(axes_.precisions, "precisions");
  require_non_empty(axes_.batches, "batches");
  if (axes_.repeats == 0) {
    throw BenchError(ErrorKind::InvalidMatrix, "matrix repeats must be at least 1");
  }

  std::size_t combos = axes_.models.size();
  combos = checked_multiply(combos, axes_.threads.size());
  combos = checked_multiply(combos, axes_.streams.size());
  combos = checked_multiply(combos, axes_.precisions.size());
  combos = checked_multiply(combos, axes_.batches.size());
  per_device_ = checked_multiply(combos, axes_.repeats);
  size_ = checked_multiply(per_device_, axes_.devices.size());
}

MatrixExpander MatrixExpander::from_config(const core::BenchConfig& config) {
  MatrixAxes axes{};

  std::unordered_set<std::string> known_devices;
  for (const auto& device : config.devices) {
    known_devices.insert(device.id);
  }
  if (config.matrix.devices.empty()) {
    for (const auto& device : config.devices) {
      axes.devices.push_back(device.id);
    }
  } else {
    std::unordered_set<std::string> listed;
    for (const auto& id : config.matrix.devices) {
      if (known_devices.count(id) == 0) {
        throw BenchError(ErrorKind::InvalidMatrix, "matrix references unknown device '" + id + "'");
      }
      if (!listed.insert(id).second) {
        throw BenchError(ErrorKind::InvalidMatrix, "matrix lists device '" + id + "' twice");
      }
      axes.devices.push_back(id);
    }
  }

  if (config.matrix.models.empty()) {
    for (const auto& model : config.models) {
      axes.models.push_back(ModelRef{model.name, model.path});
    }
  } else {
    for (const auto& name : config.matrix.models) {
      const core::ModelConfig* found = nullptr;
      for (const auto& model : config.models) {
        if (model.name == name) {
          found = &model;
          break;
        }
      }
      if (found == nullptr) {
        throw BenchError(ErrorKind::InvalidMatrix, "matrix references unknown model '" + name + "'");
      }
      axes.models.push_back(ModelRef{found->name, found->path});
    }
  }

  axes.threads = config.matrix.threads;
  axes.streams = config.matrix.streams;
  axes.precisions = config.matrix.precisions;
  axes.batches = config.matrix.batches;
  axes.repeats = config.matrix.repeats;
  return MatrixExpander(std::move(axes));
}

model::invocation_spec MatrixExpander::at(const std::size_t index) const {
  if (index >= size_) {
    throw std::out_of_range("matrix index " + std::to_string(index) + " out of range");
  }

  // Mixed-radix decode, innermost axis first.
  std::size_t rest = index;
  const auto take = [&rest](const std::size_t radix) {
    const std::size_t digit = rest % radix;
    rest /= radix;
    return digit;
  };

  const std::size_t repeat = take(axes_.repeats);
  const std::size_t batch = take(axes_.batches.size());
  const std::size_t precision = take(axes_.precisions.size());
  const std::size_t stream = take(axes_.streams.size());
  const std::size_t thread = take(axes_.threads.size());
  const std::size_t model_pos = take(axes_.models.size());
  const std::size_t device = rest;

  model::invocation_spec spec{};
  spec.index = index;
  spec.device_id = axes_.devices[device];
  spec.model_name = axes_.models[model_pos].name;
  spec.model_path = axes_.models[model_pos].path;
  spec.threads = axes_.threads[thread];
  spec.streams = axes_.streams[stream];
  spec.precision = axes_.precisions[precision];
  spec.batch = axes_.batches[batch];
  spec.repeat_index = static_cast<std::uint32_t>(repeat);
  return spec;
}

MatrixExpander::Cursor::Cursor(const MatrixExpander& matrix, const std::size_t begin, const std::size_t end) noexcept
    : matrix_(&matrix), begin_(begin), end_(end), position_(begin) {}

std::optional<model::invocation_spec> MatrixExpander::Cursor::next() {
  if (position_ >= end_) {
    return std::nullopt;
  }
  return matrix_->at(position_++);
}

void MatrixExpander::Cursor::reset() noexcept { position_ = begin_; }

MatrixExpander::Cursor MatrixExpander::cursor() const noexcept { return Cursor(*this, 0, size_); }

MatrixExpander::Cursor MatrixExpander::device_cursor(const std::size_t device_position) const {
  if (device_position >= axes_.devices.size()) {
    throw std::out_of_range("device position " + std::to_string(device_position) + " out of range");
  }
  const std::size_t begin = device_position * per_device_;
  return Cursor(*this, begin, begin + per_device_);
}

std::vector<model::invocation_spec> MatrixExpander::expand() const {
  std::vector<model::invocation_spec> specs;
  specs.reserve(size_);
  auto walker = cursor();
  while (auto spec = walker.next()) {
    specs.push_back(std::move(*spec));
  }
  return specs;
}

}  // namespace ov_bench::matrix

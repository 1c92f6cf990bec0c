#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/records.hpp"

namespace ov_bench::matrix {

struct ModelRef {
  std::string name{};
  std::string path{};
};

struct MatrixAxes {
  std::vector<std::string> devices{};
  std::vector<ModelRef> models{};
  std::vector<std::uint32_t> threads{};
  std::vector<std::uint32_t> streams{};
  std::vector<std::string> precisions{};
  std::vector<std::uint32_t> batches{};
  std::uint32_t repeats{1};
};

// Ordered cartesian product:
//   devices x models x threads x streams x precisions x batches x repeats
// with devices outermost and the repeat index innermost. Positions are
// decoded on demand, so the matrix is never materialized unless expand() is
// called.
class MatrixExpander {
 public:
  // Throws core::BenchError{InvalidMatrix} on an empty axis or zero repeats.
  explicit MatrixExpander(MatrixAxes axes);

  // Resolves matrix.devices/matrix.models against the configured devices and
  // models; unknown references throw InvalidMatrix.
  static MatrixExpander from_config(const core::BenchConfig& config);

  class Cursor {
   public:
    std::optional<model::invocation_spec> next();
    void reset() noexcept;
    std::size_t position() const noexcept { return position_; }

   private:
    friend class MatrixExpander;
    Cursor(const MatrixExpander& matrix, std::size_t begin, std::size_t end) noexcept;

    const MatrixExpander* matrix_;
    std::size_t begin_;
    std::size_t end_;
    std::size_t position_;
  };

  std::size_t size() const noexcept { return size_; }
  std::size_t per_device() const noexcept { return per_device_; }
  const MatrixAxes& axes() const noexcept { return axes_; }

  model::invocation_spec at(std::size_t index) const;

  Cursor cursor() const noexcept;
  // Contiguous slice holding every invocation of one device.
  Cursor device_cursor(std::size_t device_position) const;

  std::vector<model::invocation_spec> expand() const;

 private:
  MatrixAxes axes_;
  std::size_t per_device_{0};
  std::size_t size_{0};
};

}  // namespace ov_bench::matrix

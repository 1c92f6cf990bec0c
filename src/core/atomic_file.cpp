#include "core/atomic_file.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace ov_bench::core {

void write_file_atomic(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  std::filesystem::path temp = path;
  temp += ".tmp." + std::to_string(::getpid());

  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + temp.string() + " for writing");
    }
    out << content;
    out.flush();
    if (!out) {
      out.close();
      std::filesystem::remove(temp, ec);
      throw std::runtime_error("failed writing " + temp.string());
    }
  }

  std::filesystem::rename(temp, path, ec);
  if (ec) {
    std::error_code cleanup;
    std::filesystem::remove(temp, cleanup);
    throw std::runtime_error("cannot replace " + path.string() + ": " + ec.message());
  }
}

}  // namespace ov_bench::core

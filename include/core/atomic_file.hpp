#pragma once

#include <filesystem>
#include <string>

namespace ov_bench::core {

// Writes `content` to a sibling temp file and renames it over `path`, so
// readers see either the old file or the complete new one. Creates missing
// parent directories. Throws std::runtime_error on failure.
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

}  // namespace ov_bench::core

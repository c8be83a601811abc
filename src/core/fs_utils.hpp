#ifndef PICAMD_CORE_FS_UTILS_HPP_
#define PICAMD_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace picamd::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  return EnsureDirectory(output_path.parent_path(), error);
}

// Regular-file existence check that treats filesystem errors as "missing".
inline bool RegularFileExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

inline bool ReadFileSize(const std::filesystem::path& path, std::uintmax_t& size,
                         std::string& error) {
  std::error_code ec;
  const std::uintmax_t read_size = std::filesystem::file_size(path, ec);
  if (ec) {
    error = "failed to read size of '" + path.string() + "': " + ec.message();
    return false;
  }
  size = read_size;
  return true;
}

// Removes `path` when present. Missing files are not an error.
inline bool RemoveFileIfExists(const std::filesystem::path& path, std::string& error) {
  std::error_code ec;
  (void)std::filesystem::remove(path, ec);
  if (ec) {
    error = "failed to remove '" + path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Best-effort atomic binary write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// Readers never observe a partially written file.
inline bool WriteBinaryFileAtomic(const std::filesystem::path& output_path,
                                  const std::vector<std::uint8_t>& bytes, std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace picamd::core

#endif // PICAMD_CORE_FS_UTILS_HPP_

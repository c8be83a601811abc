#include "capture/file_stability.hpp"

#include "core/fs_utils.hpp"

#include <optional>

namespace picamd::capture {

StabilityResult WaitForStableSize(const FileSizeProbe& probe, core::IClock& clock,
                                  const StabilityOptions& options) {
  StabilityResult result;
  std::optional<std::uintmax_t> last_size;
  int equal_samples = 0;

  while (result.checks < options.max_checks) {
    std::uintmax_t size = 0;
    std::string error;
    const bool read_ok = probe(size, error);
    ++result.checks;

    if (read_ok && last_size.has_value() && *last_size == size) {
      ++equal_samples;
      if (equal_samples >= options.required_equal_samples) {
        result.stable = true;
        result.size_bytes = size;
        return result;
      }
    } else if (read_ok) {
      last_size = size;
      equal_samples = 1;
    } else {
      last_size.reset();
      equal_samples = 0;
    }

    clock.SleepFor(options.poll_interval);
  }

  result.size_bytes = last_size.value_or(0);
  return result;
}

FileSizeProbe MakeFileSizeProbe(const std::filesystem::path& path) {
  return [path](std::uintmax_t& size, std::string& error) {
    return core::ReadFileSize(path, size, error);
  };
}

} // namespace picamd::capture

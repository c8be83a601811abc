#pragma once

#include "core/clock.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace picamd::capture {

struct StabilityOptions {
  std::chrono::milliseconds poll_interval{500};
  int max_checks = 20;
  // Equal consecutive samples, the first sample of a new size included.
  int required_equal_samples = 3;
};

struct StabilityResult {
  bool stable = false;
  int checks = 0;
  std::uintmax_t size_bytes = 0;
};

// Returns the current size of the watched file; false when unreadable.
using FileSizeProbe = std::function<bool(std::uintmax_t& size, std::string& error)>;

// Samples `probe` every `poll_interval` until the size has been identical for
// `required_equal_samples` consecutive samples or `max_checks` samples were
// taken. Exhausting the checks is not an error: the last size is reported
// with `stable == false`. An unreadable sample counts as a size change.
StabilityResult WaitForStableSize(const FileSizeProbe& probe, core::IClock& clock,
                                  const StabilityOptions& options = {});

FileSizeProbe MakeFileSizeProbe(const std::filesystem::path& path);

} // namespace picamd::capture

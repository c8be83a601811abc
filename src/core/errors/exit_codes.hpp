#pragma once

namespace picamd::core::errors {

// Process-exit contract for the `picamd` CLI.
//
// The first three values keep their conventional meanings for scripts and
// service managers:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDeviceFailed = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace picamd::core::errors

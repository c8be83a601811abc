#pragma once

#include <chrono>

namespace picamd::core {

// Time source for polling loops and fixed delays.
//
// Workers measure elapsed time on the steady clock and report wall time for
// humans. Routing every sleep through this interface lets tests replace
// warm-up and stability delays with virtual time.
class IClock {
public:
  using SteadyTimePoint = std::chrono::steady_clock::time_point;
  using WallTimePoint = std::chrono::system_clock::time_point;

  virtual ~IClock() = default;

  virtual WallTimePoint WallNow() const = 0;
  virtual SteadyTimePoint SteadyNow() const = 0;
  virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public IClock {
public:
  WallTimePoint WallNow() const override;
  SteadyTimePoint SteadyNow() const override;
  void SleepFor(std::chrono::milliseconds duration) override;
};

// Process-wide real clock for callers that do not inject one.
IClock& DefaultClock();

} // namespace picamd::core

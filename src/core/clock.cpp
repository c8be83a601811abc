#include "core/clock.hpp"

#include <thread>

namespace picamd::core {

IClock::WallTimePoint SystemClock::WallNow() const {
  return std::chrono::system_clock::now();
}

IClock::SteadyTimePoint SystemClock::SteadyNow() const {
  return std::chrono::steady_clock::now();
}

void SystemClock::SleepFor(const std::chrono::milliseconds duration) {
  if (duration <= std::chrono::milliseconds::zero()) {
    return;
  }
  std::this_thread::sleep_for(duration);
}

IClock& DefaultClock() {
  static SystemClock clock;
  return clock;
}

} // namespace picamd::core

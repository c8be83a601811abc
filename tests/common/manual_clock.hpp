#ifndef PICAMD_TESTS_COMMON_MANUAL_CLOCK_HPP_
#define PICAMD_TESTS_COMMON_MANUAL_CLOCK_HPP_

#include "core/clock.hpp"

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace picamd::tests::common {

// Virtual-time clock: `SleepFor` advances both time lines instantly and
// records the requested delay, so warm-up and polling loops run at full
// speed while tests still see the intervals the code asked for.
class ManualClock final : public core::IClock {
public:
  ManualClock()
      : wall_(std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000))),
        steady_(std::chrono::steady_clock::time_point(std::chrono::seconds(1'000))) {}

  WallTimePoint WallNow() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return wall_;
  }

  SteadyTimePoint SteadyNow() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return steady_;
  }

  void SleepFor(std::chrono::milliseconds duration) override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      wall_ += duration;
      steady_ += duration;
      sleeps_.push_back(duration);
    }
    // Lets other workers run between virtual sleeps.
    std::this_thread::yield();
  }

  void Advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mu_);
    wall_ += duration;
    steady_ += duration;
  }

  std::vector<std::chrono::milliseconds> Sleeps() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sleeps_;
  }

private:
  mutable std::mutex mu_;
  WallTimePoint wall_;
  SteadyTimePoint steady_;
  std::vector<std::chrono::milliseconds> sleeps_;
};

} // namespace picamd::tests::common

#endif // PICAMD_TESTS_COMMON_MANUAL_CLOCK_HPP_

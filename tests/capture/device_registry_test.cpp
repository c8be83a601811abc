#include "backends/sim/sim_capture_device.hpp"
#include "capture/device_registry.hpp"
#include "core/logging/logger.hpp"

#include "../common/manual_clock.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using picamd::capture::AcquireResult;
using picamd::capture::AcquireStatus;
using picamd::capture::CaptureMode;
using picamd::capture::DeviceToken;
using picamd::core::errors::CaptureErrorCode;

namespace {

struct RegistryFixture {
  explicit RegistryFixture(picamd::capture::RegistryOptions options = {})
      : logger(picamd::core::logging::LogLevel::kDebug, log_sink),
        registry(std::make_unique<picamd::backends::sim::SimCaptureDevice>(clock), logger,
                 options) {}

  picamd::tests::common::ManualClock clock;
  std::ostringstream log_sink;
  picamd::core::logging::Logger logger;
  picamd::capture::DeviceRegistry registry;
};

picamd::capture::RegistryOptions ShortJoinTimeout() {
  return picamd::capture::RegistryOptions{.join_timeout = std::chrono::milliseconds(60),
                                          .join_poll_interval = std::chrono::milliseconds(5)};
}

} // namespace

TEST_CASE("Exclusive modes fail fast while the camera is held", "[capture][registry]") {
  RegistryFixture fixture;
  auto& registry = fixture.registry;

  const AcquireResult recording = registry.Acquire(CaptureMode::kRecording);
  REQUIRE(recording.status == AcquireStatus::kAcquired);
  REQUIRE(recording.token.valid());
  REQUIRE(registry.CurrentMode() == CaptureMode::kRecording);

  const AcquireResult again = registry.Acquire(CaptureMode::kRecording);
  REQUIRE(again.status == AcquireStatus::kBusy);
  REQUIRE(again.holder == CaptureMode::kRecording);
  REQUIRE(again.error.code == CaptureErrorCode::kAlreadyActive);

  const AcquireResult still = registry.Acquire(CaptureMode::kStill);
  REQUIRE(still.status == AcquireStatus::kBusy);
  REQUIRE(still.error.code == CaptureErrorCode::kDeviceBusy);
  REQUIRE(still.error.message == "camera is held by recording");

  const auto before = std::chrono::steady_clock::now();
  const AcquireResult stream = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(stream.status == AcquireStatus::kBusy);
  REQUIRE(stream.error.code == CaptureErrorCode::kDeviceBusy);
  // Busy under another mode never waits for the join timeout.
  REQUIRE(std::chrono::steady_clock::now() - before < std::chrono::seconds(1));

  REQUIRE(registry.Release(recording.token));
  REQUIRE(registry.CurrentMode() == CaptureMode::kIdle);
}

TEST_CASE("Idle and converting cannot be requested directly", "[capture][registry]") {
  RegistryFixture fixture;
  for (const CaptureMode mode : {CaptureMode::kIdle, CaptureMode::kConverting}) {
    const AcquireResult result = fixture.registry.Acquire(mode);
    REQUIRE_FALSE(result.granted());
    REQUIRE(result.error.code == CaptureErrorCode::kInternal);
  }
  REQUIRE(fixture.registry.CurrentMode() == CaptureMode::kIdle);
}

TEST_CASE("Released tokens go stale", "[capture][registry]") {
  RegistryFixture fixture;
  auto& registry = fixture.registry;

  const DeviceToken first = registry.Acquire(CaptureMode::kStill).token;
  REQUIRE(registry.Borrow(first) != nullptr);
  REQUIRE(registry.Release(first));
  REQUIRE_FALSE(registry.Release(first));
  REQUIRE(registry.Borrow(first) == nullptr);

  const DeviceToken second = registry.Acquire(CaptureMode::kRecording).token;
  REQUIRE(second.id != first.id);
  REQUIRE_FALSE(registry.IsCurrent(first));
  REQUIRE_FALSE(registry.Release(first));
  REQUIRE(registry.CurrentMode() == CaptureMode::kRecording);
  REQUIRE(registry.Release(second));
}

TEST_CASE("Hand-off moves recording to converting without an idle gap",
          "[capture][registry]") {
  RegistryFixture fixture;
  auto& registry = fixture.registry;

  const DeviceToken recording = registry.Acquire(CaptureMode::kRecording).token;
  DeviceToken converting;
  REQUIRE(registry.HandOff(recording, CaptureMode::kConverting, converting));
  REQUIRE(converting.mode == CaptureMode::kConverting);
  REQUIRE(registry.CurrentMode() == CaptureMode::kConverting);
  REQUIRE_FALSE(registry.IsCurrent(recording));

  const AcquireResult blocked = registry.Acquire(CaptureMode::kRecording);
  REQUIRE(blocked.error.code == CaptureErrorCode::kDeviceBusy);
  REQUIRE(blocked.holder == CaptureMode::kConverting);

  DeviceToken ignored;
  REQUIRE_FALSE(registry.HandOff(recording, CaptureMode::kConverting, ignored));
  REQUIRE(registry.Release(converting));
  REQUIRE(registry.WaitForIdle(std::chrono::milliseconds(10)));
}

TEST_CASE("Streaming subscribers share one grant", "[capture][registry]") {
  RegistryFixture fixture;
  auto& registry = fixture.registry;

  const AcquireResult first = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(first.status == AcquireStatus::kAcquired);
  REQUIRE(registry.Streaming().init_in_progress);
  REQUIRE(registry.Streaming().subscriber_count == 1);
  REQUIRE(registry.MarkStreamReady(first.token));

  const AcquireResult second = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(second.status == AcquireStatus::kJoined);
  REQUIRE(second.token.id == first.token.id);
  REQUIRE(registry.Streaming().subscriber_count == 2);
  REQUIRE(registry.Streaming().device_open);

  REQUIRE(registry.Acquire(CaptureMode::kRecording).error.code == CaptureErrorCode::kDeviceBusy);

  REQUIRE(registry.LeaveStream(second.token) == 1);
  REQUIRE_FALSE(registry.Streaming().closing);
  REQUIRE(registry.LeaveStream(first.token) == 0);
  REQUIRE(registry.Streaming().closing);
  REQUIRE(registry.Release(first.token));
  REQUIRE(registry.LeaveStream(first.token) == -1);
  REQUIRE(registry.Streaming().subscriber_count == 0);
}

TEST_CASE("A joiner waits for stream initialization to finish", "[capture][registry]") {
  RegistryFixture fixture;
  auto& registry = fixture.registry;

  const AcquireResult first = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(first.status == AcquireStatus::kAcquired);

  AcquireResult joined;
  std::thread joiner([&]() { joined = registry.Acquire(CaptureMode::kStreaming); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(registry.MarkStreamReady(first.token));
  joiner.join();

  REQUIRE(joined.status == AcquireStatus::kJoined);
  REQUIRE(joined.token.id == first.token.id);
  REQUIRE(registry.Streaming().subscriber_count == 2);
}

TEST_CASE("A joiner gives up when initialization stalls", "[capture][registry]") {
  RegistryFixture fixture(ShortJoinTimeout());
  auto& registry = fixture.registry;

  const AcquireResult first = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(first.status == AcquireStatus::kAcquired);

  const AcquireResult stalled = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(stalled.status == AcquireStatus::kUnavailable);
  REQUIRE(stalled.error.code == CaptureErrorCode::kUnavailable);
  REQUIRE(registry.Streaming().subscriber_count == 1);
}

TEST_CASE("A closing stream is not joined; the next subscriber reopens",
          "[capture][registry]") {
  RegistryFixture fixture(ShortJoinTimeout());
  auto& registry = fixture.registry;

  const AcquireResult first = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(registry.MarkStreamReady(first.token));
  REQUIRE(registry.LeaveStream(first.token) == 0);

  REQUIRE(registry.Acquire(CaptureMode::kStreaming).status == AcquireStatus::kUnavailable);

  REQUIRE(registry.Release(first.token));
  const AcquireResult fresh = registry.Acquire(CaptureMode::kStreaming);
  REQUIRE(fresh.status == AcquireStatus::kAcquired);
  REQUIRE(fresh.token.id != first.token.id);
}

TEST_CASE("Force close shuts a lingering device without changing the mode",
          "[capture][registry]") {
  picamd::tests::common::ManualClock clock;
  std::ostringstream log_sink;
  picamd::core::logging::Logger logger(picamd::core::logging::LogLevel::kInfo, log_sink);
  auto device = std::make_unique<picamd::backends::sim::SimCaptureDevice>(clock);
  picamd::backends::sim::SimCaptureDevice* sim = device.get();
  picamd::capture::DeviceRegistry registry(std::move(device), logger);

  const DeviceToken token = registry.Acquire(CaptureMode::kStreaming).token;
  std::string error;
  REQUIRE(registry.Borrow(token)->Open(error));
  REQUIRE(sim->IsOpen());

  registry.ForceCloseDevice("test");
  REQUIRE_FALSE(sim->IsOpen());
  REQUIRE(registry.CurrentMode() == CaptureMode::kStreaming);
  REQUIRE_FALSE(registry.Streaming().device_open);
  REQUIRE(log_sink.str().find("msg=\"force closing camera\" reason=\"test\"") !=
          std::string::npos);
}

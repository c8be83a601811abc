#include "backends/sim/sim_capture_device.hpp"
#include "capture/capture_config.hpp"
#include "capture/device_registry.hpp"
#include "capture/finalization_pipeline.hpp"
#include "capture/recording_session.hpp"
#include "core/logging/logger.hpp"

#include "../common/assertions.hpp"
#include "../common/manual_clock.hpp"
#include "../common/scripted_transcoder.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

using picamd::capture::CaptureMode;
using picamd::core::errors::CaptureError;
using picamd::core::errors::CaptureErrorCode;
using picamd::tests::common::Fail;

struct SessionFixture {
  explicit SessionFixture(const std::filesystem::path& dir)
      : logger(picamd::core::logging::LogLevel::kDebug, log_sink),
        registry(MakeDevice(), logger), config(registry, logger),
        finalization(registry, transcoder, clock, logger,
                     picamd::capture::FinalizationOptions{.output_path =
                                                              dir / "camera_video.mp4"}),
        session(registry, config, finalization, clock, logger,
                picamd::capture::RecordingOptions{.raw_path = dir / "camera_video.h264",
                                                  .stop_poll_interval =
                                                      std::chrono::milliseconds(10)}) {}

  std::unique_ptr<picamd::backends::sim::SimCaptureDevice> MakeDevice() {
    auto device = std::make_unique<picamd::backends::sim::SimCaptureDevice>(clock);
    sim = device.get();
    return device;
  }

  // Stops the worker and the finalization job it hands off to.
  void Drain() {
    session.Wait();
    finalization.Wait();
  }

  picamd::tests::common::ManualClock clock;
  std::ostringstream log_sink;
  picamd::core::logging::Logger logger;
  picamd::backends::sim::SimCaptureDevice* sim = nullptr;
  picamd::capture::DeviceRegistry registry;
  picamd::capture::ConfigStore config;
  picamd::tests::common::ScriptedTranscoder transcoder;
  picamd::capture::FinalizationPipeline finalization;
  picamd::capture::RecordingSession session;
};

void RecordStopAndFinalize(const std::filesystem::path& dir) {
  SessionFixture fixture(dir);
  auto& session = fixture.session;

  picamd::capture::RecordingStart started;
  CaptureError error;
  if (!session.Start(started, error)) {
    Fail("start failed: " + error.message);
  }
  if (started.config.width != 1280U || started.config.fps != 30U ||
      started.started_at < started.requested_at) {
    Fail("start should report the stored config and ordered timestamps");
  }
  if (!session.active() || fixture.registry.CurrentMode() != CaptureMode::kRecording ||
      !fixture.sim->DebugSnapshot().recording) {
    Fail("device should be recording");
  }

  fixture.clock.Advance(std::chrono::milliseconds(2'500));
  if (session.Duration() != std::chrono::milliseconds(2'500)) {
    Fail("duration should follow the steady clock");
  }

  picamd::capture::RecordingStart again;
  if (session.Start(again, error) || error.code != CaptureErrorCode::kAlreadyActive) {
    Fail("second start should be rejected as already active");
  }

  double elapsed = 0.0;
  if (!session.RequestStop(elapsed, error) || elapsed != 2.5) {
    Fail("stop should report 2.5 seconds elapsed");
  }
  double ignored = 0.0;
  if (session.RequestStop(ignored, error) || error.code != CaptureErrorCode::kNotActive) {
    Fail("a stop already in flight should be rejected");
  }

  fixture.Drain();
  if (session.active() || session.Duration() != std::chrono::milliseconds::zero() ||
      session.StartedAt().has_value()) {
    Fail("session should be inactive after the worker finished");
  }
  if (fixture.registry.CurrentMode() != CaptureMode::kIdle || fixture.sim->IsOpen()) {
    Fail("device should be closed and idle after finalization");
  }
  if (fixture.finalization.LastJob().state != picamd::capture::JobState::kSucceeded) {
    Fail("finalization should have run on the raw recording");
  }

  std::uintmax_t raw_size = std::filesystem::file_size(session.raw_path());
  const std::uintmax_t expected = (5U + 16U) + (5U + 4U) + 75U * (5U + 4096U);
  if (raw_size != expected) {
    Fail("unexpected raw size " + std::to_string(raw_size));
  }
  picamd::tests::common::AssertContains(fixture.log_sink.str(),
                                        "msg=\"recording stop requested\" elapsed_s=\"2.50\"");

  // The session is reusable once idle.
  if (!session.Start(started, error)) {
    Fail("restart failed: " + error.message);
  }
  if (!session.RequestStop(elapsed, error)) {
    Fail("second stop failed: " + error.message);
  }
  fixture.Drain();
  if (fixture.sim->DebugSnapshot().recordings_stopped != 2U) {
    Fail("expected two completed recordings");
  }
}

void StopWithoutRecording(const std::filesystem::path& dir) {
  SessionFixture fixture(dir);
  double elapsed = -1.0;
  CaptureError error;
  if (fixture.session.RequestStop(elapsed, error)) {
    Fail("stop while idle should fail");
  }
  if (error.code != CaptureErrorCode::kNotActive || error.message != "not recording") {
    Fail("stop while idle should be NOT_ACTIVE");
  }
}

void FailedOpenReleasesTheDevice(const std::filesystem::path& dir) {
  SessionFixture fixture(dir);
  std::string param_error;
  if (!fixture.sim->SetParam("open_error", "VIDIOC_S_FMT: Device or resource busy",
                             param_error)) {
    Fail(param_error);
  }

  picamd::capture::RecordingStart started;
  CaptureError error;
  if (fixture.session.Start(started, error)) {
    Fail("start should fail when open fails");
  }
  if (error.code != CaptureErrorCode::kDeviceBusy) {
    Fail("busy open should map to DEVICE_BUSY, got " +
         picamd::core::errors::FormatCaptureError(error));
  }
  if (fixture.registry.CurrentMode() != CaptureMode::kIdle || fixture.session.active()) {
    Fail("failed start must leave the device idle");
  }

  if (!fixture.sim->SetParam("open_error", "", param_error) ||
      !fixture.sim->SetParam("start_error", "sensor fault", param_error)) {
    Fail(param_error);
  }
  if (fixture.session.Start(started, error) || error.code != CaptureErrorCode::kInternal) {
    Fail("unclassified start failure should map to INTERNAL");
  }
  picamd::tests::common::AssertContains(error.message, "camera start failed: sensor fault");
  if (fixture.sim->IsOpen() || fixture.registry.CurrentMode() != CaptureMode::kIdle) {
    Fail("failed start must close and release the device");
  }
}

} // namespace

int main() {
  const picamd::tests::common::ScopedTempDir temp("picamd-recording-smoke");
  RecordStopAndFinalize(temp.path() / "record");
  StopWithoutRecording(temp.path() / "idle");
  FailedOpenReleasesTheDevice(temp.path() / "failed_open");
  std::cout << "recording_session_smoke: ok\n";
  return 0;
}

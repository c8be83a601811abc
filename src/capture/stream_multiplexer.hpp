#pragma once

#include "capture/capture_config.hpp"
#include "capture/device_registry.hpp"
#include "core/clock.hpp"
#include "core/errors/capture_error.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace picamd::capture {

inline constexpr const char* kStreamBoundary = "frame";

struct StreamOptions {
  // Settling time after a fresh device start before frames are served.
  std::chrono::milliseconds warm_up{1000};
  // Pause after force-closing on a busy device so the OS can free it.
  std::chrono::milliseconds busy_recovery_delay{1000};
  std::chrono::milliseconds frame_error_backoff{50};
  // Back-to-back frame failures a subscriber tolerates before its sequence
  // ends with FRAME_CAPTURE_ERROR.
  int max_consecutive_frame_errors = 100;
};

class StreamMultiplexer;

// One subscriber's lazy, endless frame sequence over the shared device.
//
// Destroying the subscription is the unsubscribe: it only drops this
// subscriber; the last one out closes the device. Must not outlive the
// multiplexer that created it.
class Subscription {
public:
  ~Subscription();

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Blocks until the next multipart chunk is ready. Transient capture errors
  // are logged and retried. Returns false when the sequence has ended: the
  // stream was force-stopped (`error.ok()`), the device went away or reported
  // busy (every subscriber ends), or too many frames failed in a row.
  bool Next(std::string& chunk, core::errors::CaptureError& error);

  std::uint64_t frames() const {
    return frames_;
  }

private:
  friend class StreamMultiplexer;
  Subscription(StreamMultiplexer& owner, DeviceToken token, std::uint64_t generation);

  StreamMultiplexer& owner_;
  DeviceToken token_;
  std::uint64_t generation_ = 0;
  std::uint64_t frames_ = 0;
  int consecutive_errors_ = 0;
};

// Fans one camera out to any number of live-view clients.
//
// The first subscriber opens the device with the stream profile and warms it
// up while later subscribers wait in the registry; every other subscriber
// reuses the open device. Frame captures from all subscribers are serialized
// on the device.
class StreamMultiplexer {
public:
  StreamMultiplexer(DeviceRegistry& registry, ConfigStore& config, core::IClock& clock,
                    core::logging::Logger& logger, StreamOptions options = {});

  StreamMultiplexer(const StreamMultiplexer&) = delete;
  StreamMultiplexer& operator=(const StreamMultiplexer&) = delete;

  std::unique_ptr<Subscription> Subscribe(core::errors::CaptureError& error);

  // Ends the sequence of every subscriber attached so far. The device closes
  // once they have all left; a subscriber arriving before that joins the
  // still-open device with a live sequence.
  void ForceStop();

  struct Snapshot {
    std::uint64_t device_opens = 0;
    std::uint64_t device_closes = 0;
    std::uint64_t frames_served = 0;
    std::uint64_t frame_errors = 0;
    std::uint64_t busy_recoveries = 0;
  };

  Snapshot DebugSnapshot() const;

  // "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: N\r\n\r\n<jpeg>\r\n"
  static std::string BuildChunk(const std::vector<std::uint8_t>& jpeg);

private:
  friend class Subscription;

  bool OpenDevice(const DeviceToken& token, core::errors::CaptureError& error);
  void CloseDevice(const DeviceToken& token);
  bool NextChunk(Subscription& subscription, std::string& chunk,
                 core::errors::CaptureError& error);
  void Leave(const DeviceToken& token);
  // Ends every sequence on a dead or busy device and force closes it. Only
  // the first subscriber to report the loss runs the recovery.
  void AbandonDevice(const Subscription& subscription, const core::errors::CaptureError& error);

  DeviceRegistry& registry_;
  ConfigStore& config_;
  core::IClock& clock_;
  core::logging::Logger& logger_;
  StreamOptions options_;

  // Serializes device calls between subscribers.
  std::mutex device_mu_;
  std::atomic<std::uint64_t> generation_{0};

  mutable std::mutex counters_mu_;
  Snapshot counters_;
};

} // namespace picamd::capture

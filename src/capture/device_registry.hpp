#pragma once

#include "backends/capture_device.hpp"
#include "capture/capture_mode.hpp"
#include "core/errors/capture_error.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

namespace picamd::capture {

// Proof of camera ownership. Tokens are compared by id against the single
// outstanding grant, so a token kept after release is simply stale.
struct DeviceToken {
  std::uint64_t id = 0;
  CaptureMode mode = CaptureMode::kIdle;

  bool valid() const {
    return id != 0;
  }
};

enum class AcquireStatus {
  // Fresh grant; the caller must bring the device up (and, for streaming,
  // call `MarkStreamReady` or `Release`).
  kAcquired = 0,
  // Streaming only: attached to a warm, already-open device.
  kJoined,
  kBusy,
  kUnavailable,
};

struct AcquireResult {
  AcquireStatus status = AcquireStatus::kBusy;
  DeviceToken token;
  // Mode that blocked the request when status is kBusy.
  CaptureMode holder = CaptureMode::kIdle;
  core::errors::CaptureError error;

  bool granted() const {
    return status == AcquireStatus::kAcquired || status == AcquireStatus::kJoined;
  }
};

struct StreamingState {
  int subscriber_count = 0;
  bool device_open = false;
  bool init_in_progress = false;
  bool closing = false;
};

struct RegistryOptions {
  std::chrono::milliseconds join_timeout{5000};
  std::chrono::milliseconds join_poll_interval{100};
};

// Single owner of the physical camera and of the system-wide capture mode.
//
// Every acquire/release, mode hand-off and streaming subscriber change runs
// under one mutex, so check-then-set races between request handlers and
// workers cannot happen. Holders only ever borrow the device pointer while
// their token is current.
//
// Acquisition policy:
// - Recording / Still: fail fast with Busy unless Idle.
// - Streaming: Idle grants a fresh token and marks init in progress; a ready
//   stream is joined; an in-progress init or a closing stream is waited on
//   for at most `join_timeout`, then Unavailable.
class DeviceRegistry {
public:
  DeviceRegistry(std::unique_ptr<backends::ICaptureDevice> device,
                 core::logging::Logger& logger, RegistryOptions options = {});
  ~DeviceRegistry();

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  AcquireResult Acquire(CaptureMode mode);

  // Returns the capture mode to Idle. Stale tokens are ignored (false).
  bool Release(const DeviceToken& token);

  // Moves ownership to `next` without passing through Idle.
  bool HandOff(const DeviceToken& token, CaptureMode next, DeviceToken& handed);

  // Streaming: the initializer finished open/start/warm-up.
  bool MarkStreamReady(const DeviceToken& token);

  // Streaming: drops one subscriber and returns the remaining count. At zero
  // the stream enters `closing`; the caller closes the device, then releases.
  // Returns -1 for a stale token.
  int LeaveStream(const DeviceToken& token);

  // Borrowed device pointer, or nullptr when `token` is not current.
  backends::ICaptureDevice* Borrow(const DeviceToken& token) const;

  bool IsCurrent(const DeviceToken& token) const;
  CaptureMode CurrentMode() const;
  StreamingState Streaming() const;

  // Busy recovery: stops and closes any lingering device handle regardless
  // of owner. Does not change the capture mode.
  void ForceCloseDevice(std::string_view reason);

  // Runs `mutate` only while the mode is Idle, under the registry lock, so a
  // concurrent acquire cannot interleave. Returns false when not Idle.
  bool TryWhileIdle(const std::function<void()>& mutate);

  // Blocks until the mode is Idle or `timeout` elapses.
  bool WaitForIdle(std::chrono::milliseconds timeout);

private:
  DeviceToken GrantLocked(CaptureMode mode);
  void ResetStreamingLocked();

  std::unique_ptr<backends::ICaptureDevice> device_;
  core::logging::Logger& logger_;
  RegistryOptions options_;

  mutable std::mutex mu_;
  std::condition_variable changed_;
  CaptureMode mode_ = CaptureMode::kIdle;
  std::uint64_t current_token_id_ = 0;
  std::uint64_t next_token_id_ = 1;
  StreamingState streaming_;
};

} // namespace picamd::capture

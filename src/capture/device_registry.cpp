#include "capture/device_registry.hpp"

#include <string>
#include <utility>

namespace picamd::capture {

using core::errors::CaptureErrorCode;
using core::errors::MakeError;

DeviceRegistry::DeviceRegistry(std::unique_ptr<backends::ICaptureDevice> device,
                               core::logging::Logger& logger, RegistryOptions options)
    : device_(std::move(device)), logger_(logger), options_(options) {}

DeviceRegistry::~DeviceRegistry() {
  if (device_ != nullptr && device_->IsOpen()) {
    std::string error;
    if (!device_->Close(error)) {
      logger_.Warn("camera close on shutdown failed", {{"error", error}});
    }
  }
}

AcquireResult DeviceRegistry::Acquire(const CaptureMode mode) {
  AcquireResult result;
  if (mode == CaptureMode::kIdle || mode == CaptureMode::kConverting) {
    result.status = AcquireStatus::kBusy;
    result.error = MakeError(CaptureErrorCode::kInternal,
                             std::string("mode cannot be acquired directly: ") + ToString(mode));
    return result;
  }

  std::unique_lock<std::mutex> lock(mu_);
  if (device_ == nullptr) {
    result.status = AcquireStatus::kUnavailable;
    result.error = MakeError(CaptureErrorCode::kUnavailable, "no capture device configured");
    return result;
  }

  if (mode != CaptureMode::kStreaming) {
    if (mode_ != CaptureMode::kIdle) {
      result.status = AcquireStatus::kBusy;
      result.holder = mode_;
      result.error = MakeError(mode_ == mode ? CaptureErrorCode::kAlreadyActive
                                             : CaptureErrorCode::kDeviceBusy,
                               std::string("camera is held by ") + ToString(mode_));
      return result;
    }
    result.status = AcquireStatus::kAcquired;
    result.token = GrantLocked(mode);
    return result;
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.join_timeout;
  while (true) {
    if (mode_ == CaptureMode::kIdle) {
      result.status = AcquireStatus::kAcquired;
      result.token = GrantLocked(CaptureMode::kStreaming);
      streaming_.subscriber_count = 1;
      streaming_.init_in_progress = true;
      return result;
    }
    if (mode_ != CaptureMode::kStreaming) {
      result.status = AcquireStatus::kBusy;
      result.holder = mode_;
      result.error = MakeError(CaptureErrorCode::kDeviceBusy,
                               std::string("camera is held by ") + ToString(mode_));
      return result;
    }
    if (streaming_.device_open && !streaming_.init_in_progress && !streaming_.closing) {
      ++streaming_.subscriber_count;
      result.status = AcquireStatus::kJoined;
      result.token = DeviceToken{.id = current_token_id_, .mode = CaptureMode::kStreaming};
      return result;
    }

    // Init or close in flight: wait for it to settle.
    if (std::chrono::steady_clock::now() >= deadline) {
      result.status = AcquireStatus::kUnavailable;
      result.error = MakeError(CaptureErrorCode::kUnavailable,
                               "stream device did not become ready within " +
                                   std::to_string(options_.join_timeout.count()) + " ms");
      return result;
    }
    changed_.wait_for(lock, options_.join_poll_interval);
  }
}

bool DeviceRegistry::Release(const DeviceToken& token) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!token.valid() || token.id != current_token_id_) {
      return false;
    }
    mode_ = CaptureMode::kIdle;
    current_token_id_ = 0;
    ResetStreamingLocked();
  }
  changed_.notify_all();
  return true;
}

bool DeviceRegistry::HandOff(const DeviceToken& token, const CaptureMode next,
                             DeviceToken& handed) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!token.valid() || token.id != current_token_id_) {
      return false;
    }
    handed = GrantLocked(next);
    ResetStreamingLocked();
  }
  changed_.notify_all();
  return true;
}

bool DeviceRegistry::MarkStreamReady(const DeviceToken& token) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!token.valid() || token.id != current_token_id_ || mode_ != CaptureMode::kStreaming) {
      return false;
    }
    streaming_.init_in_progress = false;
    streaming_.device_open = true;
  }
  changed_.notify_all();
  return true;
}

int DeviceRegistry::LeaveStream(const DeviceToken& token) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!token.valid() || token.id != current_token_id_ || mode_ != CaptureMode::kStreaming) {
    return -1;
  }
  if (streaming_.subscriber_count > 0) {
    --streaming_.subscriber_count;
  }
  if (streaming_.subscriber_count == 0) {
    streaming_.closing = true;
  }
  return streaming_.subscriber_count;
}

backends::ICaptureDevice* DeviceRegistry::Borrow(const DeviceToken& token) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!token.valid() || token.id != current_token_id_) {
    return nullptr;
  }
  return device_.get();
}

bool DeviceRegistry::IsCurrent(const DeviceToken& token) const {
  std::lock_guard<std::mutex> lock(mu_);
  return token.valid() && token.id == current_token_id_;
}

CaptureMode DeviceRegistry::CurrentMode() const {
  std::lock_guard<std::mutex> lock(mu_);
  return mode_;
}

StreamingState DeviceRegistry::Streaming() const {
  std::lock_guard<std::mutex> lock(mu_);
  return streaming_;
}

void DeviceRegistry::ForceCloseDevice(std::string_view reason) {
  std::lock_guard<std::mutex> lock(mu_);
  if (device_ == nullptr) {
    return;
  }
  logger_.Warn("force closing camera", {{"reason", reason}, {"mode", ToString(mode_)}});
  std::string error;
  if (!device_->Stop(error)) {
    logger_.Warn("camera stop during force close failed", {{"error", error}});
  }
  error.clear();
  if (!device_->Close(error)) {
    logger_.Warn("camera close during force close failed", {{"error", error}});
  }
  streaming_.device_open = false;
}

bool DeviceRegistry::TryWhileIdle(const std::function<void()>& mutate) {
  std::lock_guard<std::mutex> lock(mu_);
  if (mode_ != CaptureMode::kIdle) {
    return false;
  }
  mutate();
  return true;
}

bool DeviceRegistry::WaitForIdle(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return changed_.wait_for(lock, timeout, [this]() { return mode_ == CaptureMode::kIdle; });
}

DeviceToken DeviceRegistry::GrantLocked(const CaptureMode mode) {
  mode_ = mode;
  current_token_id_ = next_token_id_++;
  return DeviceToken{.id = current_token_id_, .mode = mode};
}

void DeviceRegistry::ResetStreamingLocked() {
  streaming_ = StreamingState{};
}

} // namespace picamd::capture

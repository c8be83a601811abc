#include "capture/stream_multiplexer.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace picamd::capture {

using core::errors::CaptureError;
using core::errors::CaptureErrorCode;
using core::errors::MakeDeviceError;
using core::errors::MakeError;

Subscription::Subscription(StreamMultiplexer& owner, DeviceToken token,
                           const std::uint64_t generation)
    : owner_(owner), token_(token), generation_(generation) {}

Subscription::~Subscription() {
  owner_.Leave(token_);
}

bool Subscription::Next(std::string& chunk, CaptureError& error) {
  return owner_.NextChunk(*this, chunk, error);
}

StreamMultiplexer::StreamMultiplexer(DeviceRegistry& registry, ConfigStore& config,
                                     core::IClock& clock, core::logging::Logger& logger,
                                     StreamOptions options)
    : registry_(registry), config_(config), clock_(clock), logger_(logger), options_(options) {}

std::unique_ptr<Subscription> StreamMultiplexer::Subscribe(CaptureError& error) {
  // Read before acquiring so a force stop racing this call also ends it.
  const std::uint64_t generation = generation_.load();
  const AcquireResult acquired = registry_.Acquire(CaptureMode::kStreaming);
  if (!acquired.granted()) {
    error = acquired.error;
    logger_.Warn("stream subscribe rejected", {{"error", core::errors::FormatCaptureError(error)}});
    return nullptr;
  }

  if (acquired.status == AcquireStatus::kJoined) {
    const std::string count = std::to_string(registry_.Streaming().subscriber_count);
    logger_.Info("stream subscriber joined warm device", {{"subscribers", count}});
    return std::unique_ptr<Subscription>(new Subscription(*this, acquired.token, generation));
  }

  if (!OpenDevice(acquired.token, error)) {
    if (error.code == CaptureErrorCode::kDeviceBusy || error.code == CaptureErrorCode::kUnavailable) {
      registry_.ForceCloseDevice("stream open failed: " + error.message);
      {
        std::lock_guard<std::mutex> lock(counters_mu_);
        ++counters_.busy_recoveries;
      }
      clock_.SleepFor(options_.busy_recovery_delay);
    } else {
      CloseDevice(acquired.token);
    }
    registry_.Release(acquired.token);
    logger_.Error("stream open failed", {{"error", core::errors::FormatCaptureError(error)}});
    return nullptr;
  }

  registry_.MarkStreamReady(acquired.token);
  logger_.Info("stream device ready", {{"subscribers", "1"}});
  return std::unique_ptr<Subscription>(new Subscription(*this, acquired.token, generation));
}

bool StreamMultiplexer::OpenDevice(const DeviceToken& token, CaptureError& error) {
  std::lock_guard<std::mutex> lock(device_mu_);
  backends::ICaptureDevice* device = registry_.Borrow(token);
  if (device == nullptr) {
    error = MakeError(CaptureErrorCode::kInternal, "stream token lost during open");
    return false;
  }

  const CaptureConfig config = config_.Get();
  const backends::CaptureFormat format{.width = config.width,
                                       .height = config.height,
                                       .fps = config.fps,
                                       .profile = backends::DeviceProfile::kStream};
  std::string detail;
  if (!device->Open(detail)) {
    error = MakeDeviceError("open", detail);
    return false;
  }
  {
    std::lock_guard<std::mutex> counters_lock(counters_mu_);
    ++counters_.device_opens;
  }
  if (!device->Configure(format, detail)) {
    error = MakeDeviceError("configure", detail);
    return false;
  }
  if (!device->Start(detail)) {
    error = MakeDeviceError("start", detail);
    return false;
  }
  clock_.SleepFor(options_.warm_up);
  return true;
}

void StreamMultiplexer::CloseDevice(const DeviceToken& token) {
  std::lock_guard<std::mutex> lock(device_mu_);
  backends::ICaptureDevice* device = registry_.Borrow(token);
  if (device == nullptr || !device->IsOpen()) {
    return;
  }
  std::string detail;
  if (!device->Stop(detail)) {
    logger_.Warn("stream device stop failed", {{"error", detail}});
  }
  detail.clear();
  if (!device->Close(detail)) {
    logger_.Warn("stream device close failed", {{"error", detail}});
  }
  std::lock_guard<std::mutex> counters_lock(counters_mu_);
  ++counters_.device_closes;
}

bool StreamMultiplexer::NextChunk(Subscription& subscription, std::string& chunk,
                                  CaptureError& error) {
  std::vector<std::uint8_t> jpeg;
  while (true) {
    if (generation_.load() != subscription.generation_) {
      error = CaptureError{};
      return false;
    }

    std::string detail;
    bool captured = false;
    bool device_open = true;
    {
      std::lock_guard<std::mutex> lock(device_mu_);
      backends::ICaptureDevice* device = registry_.Borrow(subscription.token_);
      if (device == nullptr) {
        error = MakeError(CaptureErrorCode::kUnavailable, "stream device is no longer available");
        return false;
      }
      captured = device->CaptureFrame(jpeg, detail);
      if (!captured) {
        device_open = device->IsOpen();
      }
    }

    if (captured) {
      chunk = BuildChunk(jpeg);
      ++subscription.frames_;
      subscription.consecutive_errors_ = 0;
      std::lock_guard<std::mutex> lock(counters_mu_);
      ++counters_.frames_served;
      return true;
    }

    {
      std::lock_guard<std::mutex> lock(counters_mu_);
      ++counters_.frame_errors;
    }

    error = MakeDeviceError("capture_frame", detail, CaptureErrorCode::kFrameCaptureError);
    if (!device_open && error.code == CaptureErrorCode::kFrameCaptureError) {
      error.code = CaptureErrorCode::kUnavailable;
    }
    if (error.code == CaptureErrorCode::kUnavailable ||
        error.code == CaptureErrorCode::kDeviceBusy) {
      AbandonDevice(subscription, error);
      return false;
    }

    ++subscription.consecutive_errors_;
    if (subscription.consecutive_errors_ >= options_.max_consecutive_frame_errors) {
      error.message += " (" + std::to_string(subscription.consecutive_errors_) +
                       " consecutive failures)";
      logger_.Error("stream frame capture keeps failing; ending subscriber",
                    {{"error", detail},
                     {"consecutive", std::to_string(subscription.consecutive_errors_)}});
      return false;
    }
    error = CaptureError{};
    logger_.Warn("stream frame capture failed; retrying", {{"error", detail}});
    clock_.SleepFor(options_.frame_error_backoff);
  }
}

void StreamMultiplexer::AbandonDevice(const Subscription& subscription, const CaptureError& error) {
  std::uint64_t expected = subscription.generation_;
  if (!generation_.compare_exchange_strong(expected, expected + 1)) {
    return;
  }
  logger_.Error("stream device lost; ending all subscribers",
                {{"error", core::errors::FormatCaptureError(error)}});
  {
    std::lock_guard<std::mutex> lock(device_mu_);
    registry_.ForceCloseDevice("stream capture failed: " + error.message);
  }
  {
    std::lock_guard<std::mutex> lock(counters_mu_);
    ++counters_.busy_recoveries;
  }
  clock_.SleepFor(options_.busy_recovery_delay);
}

void StreamMultiplexer::Leave(const DeviceToken& token) {
  const int remaining = registry_.LeaveStream(token);
  if (remaining < 0) {
    return;
  }
  const std::string remaining_text = std::to_string(remaining);
  logger_.Info("stream subscriber left", {{"subscribers", remaining_text}});
  if (remaining > 0) {
    return;
  }
  CloseDevice(token);
  registry_.Release(token);
  logger_.Info("stream device closed");
}

void StreamMultiplexer::ForceStop() {
  const std::uint64_t generation = generation_.fetch_add(1) + 1;
  const std::string subscribers = std::to_string(registry_.Streaming().subscriber_count);
  logger_.Info("stream force stop requested",
               {{"generation", std::to_string(generation)}, {"subscribers", subscribers}});
}

StreamMultiplexer::Snapshot StreamMultiplexer::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(counters_mu_);
  return counters_;
}

std::string StreamMultiplexer::BuildChunk(const std::vector<std::uint8_t>& jpeg) {
  std::string chunk;
  chunk.reserve(jpeg.size() + 96U);
  chunk += "--";
  chunk += kStreamBoundary;
  chunk += "\r\nContent-Type: image/jpeg\r\nContent-Length: ";
  chunk += std::to_string(jpeg.size());
  chunk += "\r\n\r\n";
  chunk.append(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
  chunk += "\r\n";
  return chunk;
}

} // namespace picamd::capture

#pragma once

#include "backends/capture_device.hpp"
#include "core/clock.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace picamd::backends {

enum class BackendKind {
  kSim = 0,
  kWebcam,
};

const char* ToString(BackendKind kind);

bool ParseBackendKind(std::string_view text, BackendKind& kind, std::string& error);

// Availability snapshot used by `picamd version` and startup logging.
//
// `reason` is always populated when unavailable so operators see why the
// daemon will answer UNAVAILABLE.
struct BackendAvailability {
  bool available = false;
  std::string reason;
};

BackendAvailability GetBackendAvailability(BackendKind kind);

struct DeviceOptions {
  BackendKind kind = BackendKind::kWebcam;
  std::size_t device_index = 0;
};

// Creates the single camera instance owned by the device registry.
std::unique_ptr<ICaptureDevice> CreateCaptureDevice(const DeviceOptions& options,
                                                    core::IClock& clock);

} // namespace picamd::backends

#include "backends/device_factory.hpp"

#include "backends/sim/sim_capture_device.hpp"
#include "backends/webcam/opencv_bootstrap.hpp"
#include "backends/webcam/opencv_capture_device.hpp"

namespace picamd::backends {

const char* ToString(const BackendKind kind) {
  switch (kind) {
  case BackendKind::kSim:
    return "sim";
  case BackendKind::kWebcam:
    return "webcam";
  }
  return "unknown";
}

bool ParseBackendKind(std::string_view text, BackendKind& kind, std::string& error) {
  if (text == "sim") {
    kind = BackendKind::kSim;
    return true;
  }
  if (text == "webcam") {
    kind = BackendKind::kWebcam;
    return true;
  }
  error = "unknown backend '" + std::string(text) + "' (expected sim or webcam)";
  return false;
}

BackendAvailability GetBackendAvailability(const BackendKind kind) {
  BackendAvailability availability;
  switch (kind) {
  case BackendKind::kSim:
    availability.available = true;
    availability.reason = "enabled";
    return availability;
  case BackendKind::kWebcam:
    availability.available = webcam::IsOpenCvBootstrapEnabled();
    availability.reason = webcam::OpenCvBootstrapDetail();
    return availability;
  }
  availability.reason = "unknown backend";
  return availability;
}

std::unique_ptr<ICaptureDevice> CreateCaptureDevice(const DeviceOptions& options,
                                                    core::IClock& clock) {
  switch (options.kind) {
  case BackendKind::kSim:
    return std::make_unique<sim::SimCaptureDevice>(clock);
  case BackendKind::kWebcam:
    return std::make_unique<webcam::OpenCvCaptureDevice>(options.device_index);
  }
  return nullptr;
}

} // namespace picamd::backends

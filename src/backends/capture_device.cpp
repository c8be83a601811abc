#include "backends/capture_device.hpp"

namespace picamd::backends {

const char* ToString(const DeviceProfile profile) {
  switch (profile) {
  case DeviceProfile::kVideo:
    return "video";
  case DeviceProfile::kStream:
    return "stream";
  case DeviceProfile::kStill:
    return "still";
  }
  return "unknown";
}

} // namespace picamd::backends

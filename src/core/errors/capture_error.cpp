#include "core/errors/capture_error.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace picamd::core::errors {

namespace {

std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string_view ToStableErrorCode(const CaptureErrorCode code) {
  switch (code) {
  case CaptureErrorCode::kNone:
    return "OK";
  case CaptureErrorCode::kAlreadyActive:
    return "ALREADY_ACTIVE";
  case CaptureErrorCode::kNotActive:
    return "NOT_ACTIVE";
  case CaptureErrorCode::kInvalidConfig:
    return "INVALID_CONFIG";
  case CaptureErrorCode::kDeviceBusy:
    return "DEVICE_BUSY";
  case CaptureErrorCode::kUnavailable:
    return "UNAVAILABLE";
  case CaptureErrorCode::kTranscodeFailed:
    return "TRANSCODE_FAILED";
  case CaptureErrorCode::kFrameCaptureError:
    return "FRAME_CAPTURE_ERROR";
  case CaptureErrorCode::kNotFound:
    return "NOT_FOUND";
  case CaptureErrorCode::kConverting:
    return "CONVERTING";
  case CaptureErrorCode::kStillRecording:
    return "STILL_RECORDING";
  case CaptureErrorCode::kInternal:
    return "INTERNAL";
  }
  return "INTERNAL";
}

ErrorClass Classify(const CaptureErrorCode code) {
  switch (code) {
  case CaptureErrorCode::kNone:
    return ErrorClass::kNone;
  case CaptureErrorCode::kAlreadyActive:
  case CaptureErrorCode::kNotActive:
  case CaptureErrorCode::kInvalidConfig:
  case CaptureErrorCode::kNotFound:
  case CaptureErrorCode::kConverting:
  case CaptureErrorCode::kStillRecording:
    return ErrorClass::kCallerError;
  case CaptureErrorCode::kDeviceBusy:
  case CaptureErrorCode::kUnavailable:
  case CaptureErrorCode::kTranscodeFailed:
  case CaptureErrorCode::kFrameCaptureError:
  case CaptureErrorCode::kInternal:
    return ErrorClass::kSystemError;
  }
  return ErrorClass::kSystemError;
}

CaptureErrorCode ClassifyDeviceError(std::string_view detail, const CaptureErrorCode fallback) {
  if (detail.empty()) {
    return fallback;
  }
  const std::string normalized = ToLowerAscii(detail);
  if (ContainsAny(normalized, {"busy", "ebusy", "in use", "already open"})) {
    return CaptureErrorCode::kDeviceBusy;
  }
  if (ContainsAny(normalized,
                  {"not found", "no such device", "unavailable", "not available", "enodev"})) {
    return CaptureErrorCode::kUnavailable;
  }
  return fallback;
}

CaptureError MakeDeviceError(std::string_view operation, std::string_view detail,
                             const CaptureErrorCode fallback) {
  CaptureError error;
  error.code = ClassifyDeviceError(detail, fallback);
  const std::string operation_label = operation.empty() ? "device operation" : std::string(operation);
  error.message = "camera " + operation_label + " failed";
  if (!detail.empty()) {
    error.message += ": " + std::string(detail);
  }
  return error;
}

CaptureError MakeError(const CaptureErrorCode code, std::string message) {
  CaptureError error;
  error.code = code;
  error.message = std::move(message);
  return error;
}

std::string FormatCaptureError(const CaptureError& error) {
  std::string formatted(ToStableErrorCode(error.code));
  if (!error.message.empty()) {
    formatted += ": " + error.message;
  }
  return formatted;
}

} // namespace picamd::core::errors

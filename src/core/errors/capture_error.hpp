#pragma once

#include <string>
#include <string_view>

namespace picamd::core::errors {

// Stable classification for every rejected or failed operation.
//
// Device and transcoder implementations report free-form text; callers get a
// code they can branch on plus the original text for the log.
enum class CaptureErrorCode {
  kNone,
  kAlreadyActive,
  kNotActive,
  kInvalidConfig,
  kDeviceBusy,
  kUnavailable,
  kTranscodeFailed,
  kFrameCaptureError,
  kNotFound,
  kConverting,
  kStillRecording,
  kInternal,
};

// Who is at fault, used by the dispatch layer to pick a response class.
enum class ErrorClass {
  kNone,
  kCallerError,
  kSystemError,
};

struct CaptureError {
  CaptureErrorCode code = CaptureErrorCode::kNone;
  std::string message;

  bool ok() const {
    return code == CaptureErrorCode::kNone;
  }
};

std::string_view ToStableErrorCode(CaptureErrorCode code);

ErrorClass Classify(CaptureErrorCode code);

// Maps raw device error text to a code by keyword. Text that matches no
// known pattern maps to `fallback`.
CaptureErrorCode ClassifyDeviceError(std::string_view detail,
                                     CaptureErrorCode fallback = CaptureErrorCode::kInternal);

// Builds an error whose code is derived from device text for `operation`
// ("open", "start", "capture_frame", ...).
CaptureError MakeDeviceError(std::string_view operation, std::string_view detail,
                             CaptureErrorCode fallback = CaptureErrorCode::kInternal);

CaptureError MakeError(CaptureErrorCode code, std::string message);

// Returns "<STABLE_CODE>: <message>", or just the code when message is empty.
std::string FormatCaptureError(const CaptureError& error);

} // namespace picamd::core::errors

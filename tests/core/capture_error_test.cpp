#include "core/errors/capture_error.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using picamd::core::errors::CaptureErrorCode;
using picamd::core::errors::ErrorClass;

TEST_CASE("Capture error codes map to stable upper-case strings", "[core][errors]") {
  REQUIRE(picamd::core::errors::ToStableErrorCode(CaptureErrorCode::kAlreadyActive) ==
          "ALREADY_ACTIVE");
  REQUIRE(picamd::core::errors::ToStableErrorCode(CaptureErrorCode::kNotActive) == "NOT_ACTIVE");
  REQUIRE(picamd::core::errors::ToStableErrorCode(CaptureErrorCode::kDeviceBusy) ==
          "DEVICE_BUSY");
  REQUIRE(picamd::core::errors::ToStableErrorCode(CaptureErrorCode::kStillRecording) ==
          "STILL_RECORDING");
  REQUIRE(picamd::core::errors::ToStableErrorCode(CaptureErrorCode::kTranscodeFailed) ==
          "TRANSCODE_FAILED");
}

TEST_CASE("Caller misuse and system failures classify apart", "[core][errors]") {
  REQUIRE(picamd::core::errors::Classify(CaptureErrorCode::kNone) == ErrorClass::kNone);
  for (const CaptureErrorCode code :
       {CaptureErrorCode::kAlreadyActive, CaptureErrorCode::kNotActive,
        CaptureErrorCode::kInvalidConfig, CaptureErrorCode::kNotFound,
        CaptureErrorCode::kConverting, CaptureErrorCode::kStillRecording}) {
    REQUIRE(picamd::core::errors::Classify(code) == ErrorClass::kCallerError);
  }
  for (const CaptureErrorCode code :
       {CaptureErrorCode::kDeviceBusy, CaptureErrorCode::kUnavailable,
        CaptureErrorCode::kTranscodeFailed, CaptureErrorCode::kFrameCaptureError,
        CaptureErrorCode::kInternal}) {
    REQUIRE(picamd::core::errors::Classify(code) == ErrorClass::kSystemError);
  }
}

TEST_CASE("Device error text is classified by keyword", "[core][errors]") {
  using picamd::core::errors::ClassifyDeviceError;
  REQUIRE(ClassifyDeviceError("VIDIOC_STREAMON: Device or resource busy") ==
          CaptureErrorCode::kDeviceBusy);
  REQUIRE(ClassifyDeviceError("EBUSY") == CaptureErrorCode::kDeviceBusy);
  REQUIRE(ClassifyDeviceError("camera is in use by another process") ==
          CaptureErrorCode::kDeviceBusy);
  REQUIRE(ClassifyDeviceError("/dev/video0: No such device") == CaptureErrorCode::kUnavailable);
  REQUIRE(ClassifyDeviceError("camera not found") == CaptureErrorCode::kUnavailable);
  REQUIRE(ClassifyDeviceError("select timeout") == CaptureErrorCode::kInternal);
  REQUIRE(ClassifyDeviceError("select timeout", CaptureErrorCode::kFrameCaptureError) ==
          CaptureErrorCode::kFrameCaptureError);
  REQUIRE(ClassifyDeviceError("", CaptureErrorCode::kUnavailable) ==
          CaptureErrorCode::kUnavailable);
}

TEST_CASE("Device errors carry the failing operation in the message", "[core][errors]") {
  const auto error = picamd::core::errors::MakeDeviceError("open", "device or resource busy");
  REQUIRE(error.code == CaptureErrorCode::kDeviceBusy);
  REQUIRE(error.message == "camera open failed: device or resource busy");
  REQUIRE(picamd::core::errors::FormatCaptureError(error) ==
          "DEVICE_BUSY: camera open failed: device or resource busy");

  const auto bare = picamd::core::errors::MakeError(CaptureErrorCode::kNotFound, "");
  REQUIRE(picamd::core::errors::FormatCaptureError(bare) == "NOT_FOUND");
  REQUIRE_FALSE(bare.ok());
  REQUIRE(picamd::core::errors::CaptureError{}.ok());
}

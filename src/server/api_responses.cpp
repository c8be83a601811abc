#include "server/api_responses.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

namespace picamd::server {

using core::JsonObjectWriter;
using core::errors::CaptureError;
using core::errors::CaptureErrorCode;
using core::errors::ErrorClass;

int HttpStatusFor(const CaptureError& error) {
  switch (core::errors::Classify(error.code)) {
  case ErrorClass::kNone:
    return 200;
  case ErrorClass::kCallerError:
    return error.code == CaptureErrorCode::kNotFound ? 404 : 400;
  case ErrorClass::kSystemError:
    if (error.code == CaptureErrorCode::kDeviceBusy ||
        error.code == CaptureErrorCode::kUnavailable) {
      return 503;
    }
    return 500;
  }
  return 500;
}

ApiResponse ErrorResponse(const CaptureError& error) {
  JsonObjectWriter body;
  body.Add("status", 1)
      .Add("code", core::errors::ToStableErrorCode(error.code))
      .Add("msg", error.message);
  return ApiResponse{.status = HttpStatusFor(error), .body = body.str()};
}

ApiResponse StartResponse(const capture::StartReply& reply) {
  JsonObjectWriter msg;
  msg.Add("size", capture::FormatResolution(reply.config))
      .Add("fps", std::to_string(reply.config.fps));

  JsonObjectWriter body;
  body.Add("status", 0)
      .AddRaw("msg", msg.str())
      .Add("start_time", core::ToEpochSeconds(reply.started_at), 3);
  return ApiResponse{.status = 200, .body = body.str()};
}

ApiResponse StopResponse(const capture::StopReply& reply) {
  JsonObjectWriter body;
  body.Add("status", 0)
      .Add("msg", "stopped, converting...")
      .Add("elapsed_seconds", reply.elapsed_seconds, 2);
  return ApiResponse{.status = 200, .body = body.str()};
}

ApiResponse StatusResponse(const capture::StatusView& view) {
  JsonObjectWriter body;
  body.Add("status", 0);
  switch (view.status) {
  case capture::ExternalStatus::kConverting:
    body.Add("msg", "converting video");
    break;
  case capture::ExternalStatus::kRecording:
    body.Add("msg", "recording")
        .Add("duration", core::FormatFixed(view.duration_seconds, 1) + "s")
        .Add("duration_seconds", view.duration_seconds, 1);
    if (view.start_time.has_value()) {
      body.Add("start_time", core::ToEpochSeconds(*view.start_time), 3);
    } else {
      body.AddRaw("start_time", "null");
    }
    break;
  case capture::ExternalStatus::kIdle:
    body.Add("msg", "idle");
    break;
  }
  body.Add("streaming", view.streaming).Add("stream_subscribers", view.stream_subscribers);
  return ApiResponse{.status = 200, .body = body.str()};
}

ApiResponse ConfigResponse(const capture::CaptureConfig& config) {
  JsonObjectWriter body;
  body.Add("format", capture::kVideoFormat)
      .Add("resolution", capture::FormatResolution(config))
      .Add("fps", config.fps);
  return ApiResponse{.status = 200, .body = body.str()};
}

ApiResponse SetConfigResponse(const capture::CaptureConfig& applied) {
  JsonObjectWriter body;
  body.Add("status", "config updated")
      .Add("new_config",
           capture::FormatResolution(applied) + "@" + std::to_string(applied.fps) + "fps");
  return ApiResponse{.status = 200, .body = body.str()};
}

ApiResponse StreamStoppedResponse() {
  JsonObjectWriter body;
  body.Add("status", 0).Add("msg", "stream stopped");
  return ApiResponse{.status = 200, .body = body.str()};
}

bool ParseConfigUpdate(std::string_view body, capture::ConfigUpdate& update, CaptureError& error) {
  update = capture::ConfigUpdate{};
  core::json::FlatObject object;
  std::string detail;
  if (!core::json::ParseFlatObject(body, object, detail)) {
    error = core::errors::MakeError(CaptureErrorCode::kInvalidConfig,
                                    "invalid JSON body: " + detail);
    return false;
  }
  if (!core::json::GetOptionalUInt32(object, "width", update.width, detail) ||
      !core::json::GetOptionalUInt32(object, "height", update.height, detail) ||
      !core::json::GetOptionalUInt32(object, "fps", update.fps, detail)) {
    error = core::errors::MakeError(CaptureErrorCode::kInvalidConfig, detail);
    return false;
  }
  return true;
}

} // namespace picamd::server

#pragma once

#include "capture/camera_service.hpp"
#include "capture/capture_config.hpp"
#include "capture/status_projector.hpp"
#include "core/errors/capture_error.hpp"

#include <string>
#include <string_view>

namespace picamd::server {

// Transport-neutral response: status code plus a JSON body. The HTTP layer
// copies it onto the wire; tests inspect it directly.
struct ApiResponse {
  int status = 200;
  std::string body;
  std::string content_type = "application/json";
};

// Caller errors -> 400 (404 for NotFound); DeviceBusy and Unavailable ->
// 503; other system errors -> 500.
int HttpStatusFor(const core::errors::CaptureError& error);

// {"status":1,"code":"DEVICE_BUSY","msg":"..."}
ApiResponse ErrorResponse(const core::errors::CaptureError& error);

ApiResponse StartResponse(const capture::StartReply& reply);
ApiResponse StopResponse(const capture::StopReply& reply);
ApiResponse StatusResponse(const capture::StatusView& view);
ApiResponse ConfigResponse(const capture::CaptureConfig& config);
ApiResponse SetConfigResponse(const capture::CaptureConfig& applied);
ApiResponse StreamStoppedResponse();

// Parses a `/setconfig` body: {"width":W,"height":H,"fps":F}, every member
// optional. Malformed JSON and non-integer members are InvalidConfig.
bool ParseConfigUpdate(std::string_view body, capture::ConfigUpdate& update,
                       core::errors::CaptureError& error);

} // namespace picamd::server

#include "server/http_server.hpp"

#include "server/api_responses.hpp"

#include <httplib.h>

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <utility>
#include <vector>

namespace picamd::server {

using core::errors::CaptureError;
using core::errors::CaptureErrorCode;

namespace {

void Apply(const ApiResponse& response, httplib::Response& res) {
  res.status = response.status;
  res.set_content(response.body, response.content_type.c_str());
}

} // namespace

HttpServer::HttpServer(capture::CameraService& service, core::logging::Logger& logger,
                       HttpServerOptions options)
    : service_(service), logger_(logger), options_(std::move(options)),
      server_(std::make_unique<httplib::Server>()) {
  RegisterRoutes();
}

HttpServer::~HttpServer() {
  Stop();
}

bool HttpServer::Start(std::string& error) {
  if (listener_.joinable()) {
    error = "http server already started";
    return false;
  }
  if (options_.port == 0) {
    bound_port_ = server_->bind_to_any_port(options_.host);
    if (bound_port_ <= 0) {
      error = "failed to bind " + options_.host + " on an ephemeral port";
      return false;
    }
  } else {
    if (!server_->bind_to_port(options_.host, options_.port)) {
      error = "failed to bind " + options_.host + ":" + std::to_string(options_.port);
      return false;
    }
    bound_port_ = options_.port;
  }

  listener_ = std::thread([this]() {
    if (!server_->listen_after_bind()) {
      logger_.Warn("http listener exited with an error");
    }
  });
  logger_.Info("http server listening",
               {{"host", options_.host}, {"port", std::to_string(bound_port_)}});
  return true;
}

void HttpServer::Stop() {
  if (!listener_.joinable()) {
    return;
  }
  server_->stop();
  listener_.join();
  logger_.Info("http server stopped");
}

void HttpServer::RegisterRoutes() {
  server_->Post("/start", [this](const httplib::Request&, httplib::Response& res) {
    capture::StartReply reply;
    CaptureError error;
    if (!service_.StartRecording(reply, error)) {
      Apply(ErrorResponse(error), res);
      return;
    }
    Apply(StartResponse(reply), res);
  });

  server_->Post("/stop", [this](const httplib::Request&, httplib::Response& res) {
    capture::StopReply reply;
    CaptureError error;
    if (!service_.RequestStopRecording(reply, error)) {
      Apply(ErrorResponse(error), res);
      return;
    }
    Apply(StopResponse(reply), res);
  });

  server_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
    Apply(StatusResponse(service_.GetStatus()), res);
  });

  server_->Get("/getconfig", [this](const httplib::Request&, httplib::Response& res) {
    Apply(ConfigResponse(service_.GetConfig()), res);
  });

  server_->Post("/setconfig", [this](const httplib::Request& req, httplib::Response& res) {
    capture::ConfigUpdate update;
    CaptureError error;
    if (!ParseConfigUpdate(req.body, update, error)) {
      Apply(ErrorResponse(error), res);
      return;
    }
    capture::CaptureConfig applied;
    if (!service_.SetConfig(update, applied, error)) {
      Apply(ErrorResponse(error), res);
      return;
    }
    Apply(SetConfigResponse(applied), res);
  });

  server_->Get("/download", [this](const httplib::Request&, httplib::Response& res) {
    capture::FileReply file;
    CaptureError error;
    if (!service_.DownloadFinal(file, error)) {
      Apply(ErrorResponse(error), res);
      return;
    }
    ServeFile(file, "video/mp4", res);
  });

  server_->Get("/download/raw", [this](const httplib::Request&, httplib::Response& res) {
    capture::FileReply file;
    CaptureError error;
    if (!service_.DownloadRaw(file, error)) {
      Apply(ErrorResponse(error), res);
      return;
    }
    ServeFile(file, "video/h264", res);
  });

  server_->Get("/stream", [this](const httplib::Request&, httplib::Response& res) {
    CaptureError error;
    std::unique_ptr<capture::Subscription> subscription = service_.Subscribe(error);
    if (subscription == nullptr) {
      Apply(ErrorResponse(error), res);
      return;
    }

    // Shared so the provider stays copyable; the releaser drops the
    // subscription as soon as the connection ends.
    auto holder =
        std::make_shared<std::unique_ptr<capture::Subscription>>(std::move(subscription));
    res.set_header("Connection", "close");
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "multipart/x-mixed-replace; boundary=" + std::string(capture::kStreamBoundary),
        [this, holder](std::size_t, httplib::DataSink& sink) {
          std::string chunk;
          for (;;) {
            if (*holder == nullptr) {
              sink.done();
              return true;
            }
            CaptureError next_error;
            if (!(*holder)->Next(chunk, next_error)) {
              if (next_error.code != CaptureErrorCode::kNone) {
                logger_.Warn("stream ended with error",
                             {{"error", core::errors::FormatCaptureError(next_error)}});
              }
              holder->reset();
              sink.done();
              return true;
            }
            if (!sink.write(chunk.data(), chunk.size())) {
              return false;
            }
          }
        },
        [holder](bool) { holder->reset(); });
  });

  server_->Post("/stream/stop", [this](const httplib::Request&, httplib::Response& res) {
    service_.ForceStopStreaming();
    Apply(StreamStoppedResponse(), res);
  });

  server_->Get("/test", [this](const httplib::Request&, httplib::Response& res) {
    capture::FileReply file;
    CaptureError error;
    if (!service_.CaptureStill({}, file, error)) {
      Apply(ErrorResponse(error), res);
      return;
    }
    ServeFile(file, "image/jpeg", res);
  });

  server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) {
      return;
    }
    res.set_content(res.status == 404 ? R"({"error":"not found"})" : R"({"error":"request failed"})",
                    "application/json");
  });

  server_->set_logger([this](const httplib::Request& req, const httplib::Response& res) {
    logger_.Debug("http request",
                  {{"method", req.method}, {"path", req.path}, {"status", std::to_string(res.status)}});
  });
}

void HttpServer::ServeFile(const capture::FileReply& file, const char* content_type,
                           httplib::Response& res) const {
  auto stream = std::make_shared<std::ifstream>(file.path, std::ios::binary);
  if (!stream->is_open()) {
    Apply(ErrorResponse(core::errors::MakeError(CaptureErrorCode::kNotFound,
                                                "file disappeared: " + file.path.string())),
          res);
    return;
  }

  res.set_header("Content-Disposition", "attachment; filename=\"" + file.download_name + "\"");
  res.set_content_provider(
      static_cast<std::size_t>(file.size_bytes), content_type,
      [stream](std::size_t offset, std::size_t length, httplib::DataSink& sink) {
        std::vector<char> buffer(std::min<std::size_t>(length, 64U * 1024U));
        stream->clear();
        stream->seekg(static_cast<std::streamoff>(offset));
        stream->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = stream->gcount();
        if (got <= 0) {
          return false;
        }
        return sink.write(buffer.data(), static_cast<std::size_t>(got));
      });
  logger_.Info("file download started",
               {{"path", file.path.string()}, {"bytes", std::to_string(file.size_bytes)}});
}

} // namespace picamd::server

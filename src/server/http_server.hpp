#pragma once

#include "capture/camera_service.hpp"
#include "core/logging/logger.hpp"

#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Response;
} // namespace httplib

namespace picamd::server {

struct HttpServerOptions {
  std::string host = "0.0.0.0";
  int port = 5000;
};

// Binds the service operations to HTTP routes. Route handlers only translate
// requests and replies; every arbitration decision stays in the service.
class HttpServer {
public:
  HttpServer(capture::CameraService& service, core::logging::Logger& logger,
             HttpServerOptions options);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds the listening socket and serves on a background thread.
  bool Start(std::string& error);
  // Stops accepting requests and joins the listener thread. Idempotent.
  void Stop();

  int bound_port() const {
    return bound_port_;
  }

private:
  void RegisterRoutes();
  void ServeFile(const capture::FileReply& file, const char* content_type,
                 httplib::Response& res) const;

  capture::CameraService& service_;
  core::logging::Logger& logger_;
  HttpServerOptions options_;
  std::unique_ptr<httplib::Server> server_;
  std::thread listener_;
  int bound_port_ = 0;
};

} // namespace picamd::server

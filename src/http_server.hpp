#pragma once
#include <asio.hpp>
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class Logger;

// Installs the HTTP routes of a session on the server before it listens.
class RouteProvider {
public:
  virtual ~RouteProvider() = default;
  virtual void register_routes(httplib::Server& server) = 0;
  // Path as written to the access log.
  virtual std::string loggable_path(const std::string& path) const { return path; }
};

// {"detail": "..."} with the given status. Every error body has this shape.
void set_json_error(httplib::Response& res, int status, const std::string& detail);

class HttpServer {
public:
  struct Options {
    std::string host = "0.0.0.0";
    uint16_t port = 0; // 0 = pick a free port
    std::size_t worker_threads = 0; // 0 = hardware concurrency
    uint64_t max_body_bytes = 1024ull * 1024 * 1024;
    std::chrono::seconds io_timeout{5};
    bool handle_signals = true; // SIGINT/SIGTERM trigger a graceful shutdown
  };

  HttpServer(std::shared_ptr<RouteProvider> routes,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds. Throws InvalidConfiguration for a bad host and IOFailure when the
  // address cannot be bound.
  void start();
  // Serves until shutdown completes. Blocks.
  void run();
  void start_background();
  // Thread safe. Closes the listener after `grace`; requests already accepted
  // run to completion before run() returns.
  void request_shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(0));
  // Immediate stop; joins background threads.
  void stop();

  uint16_t port() const { return port_; }
  bool shutting_down() const { return shutdown_requested_.load(); }

private:
  void configure();
  void stop_listening();

  std::shared_ptr<RouteProvider> routes_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<httplib::Server> server_;

  // signals and the shutdown grace timer
  asio::io_context control_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> control_work_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<asio::steady_timer> grace_timer_;
  std::thread control_thread_;

  std::thread background_;
  std::mutex state_mutex_;
  std::atomic<bool> shutdown_requested_{false};
  bool listening_ = false;
  bool stopped_ = false;
  bool started_ = false;
  uint16_t port_ = 0;
};

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "access_token.hpp"

class Logger;

// Owns the single live token of a serving session and decides, exactly once,
// whether a completed transfer ends the process. One instance is created at
// startup and handed to every request handler.
class SessionCoordinator {
public:
  using ShutdownHandler = std::function<void()>;

  SessionCoordinator(AccessToken token,
                     bool exit_on_completion,
                     std::shared_ptr<Logger> logger = nullptr);

  // Invoked by the winning report_completion() when exit_on_completion is
  // set. Must not block; it should only schedule the serving loop's stop.
  void set_shutdown_handler(ShutdownHandler handler);

  // Throws Unauthorized.
  void authorize(const std::string& candidate) const;
  bool is_authorized(const std::string& candidate) const;

  // Call only after a transfer fully succeeded. Returns true for the single
  // call that fired the shutdown handler.
  bool report_completion();

  bool completed() const { return completed_.load(std::memory_order_acquire); }
  bool exit_on_completion() const { return exit_on_completion_; }
  const AccessToken& token() const { return token_; }

private:
  const AccessToken token_;
  const bool exit_on_completion_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> completed_{false};
  mutable std::mutex handler_mutex_;
  ShutdownHandler shutdown_handler_;
};

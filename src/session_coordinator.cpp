#include "session_coordinator.hpp"
#include "errors.hpp"
#include "log.hpp"

SessionCoordinator::SessionCoordinator(AccessToken token,
                                       bool exit_on_completion,
                                       std::shared_ptr<Logger> logger)
: token_(std::move(token)),
  exit_on_completion_(exit_on_completion),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("session"))
{
}

void SessionCoordinator::set_shutdown_handler(ShutdownHandler handler){
  std::lock_guard<std::mutex> lock(handler_mutex_);
  shutdown_handler_ = std::move(handler);
}

void SessionCoordinator::authorize(const std::string& candidate) const {
  token_.validate(candidate);
}

bool SessionCoordinator::is_authorized(const std::string& candidate) const {
  return token_.is_valid(candidate);
}

bool SessionCoordinator::report_completion(){
  bool expected = false;
  if(!completed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)){
    return false;
  }
  logger_->info("First transfer completed");
  if(!exit_on_completion_) return false;

  ShutdownHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = shutdown_handler_;
  }
  if(!handler){
    logger_->warn("Exit on completion requested but no shutdown handler is installed");
    return false;
  }
  logger_->info("Exit on completion: shutting down");
  handler();
  return true;
}

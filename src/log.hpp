#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Configures the console sinks and, when log_file is non-empty, a file sink
// that receives every leveled channel and the access log.
void init(bool verbose = false, const std::string& log_file = std::string());
// false mutes the console sinks; listeners still see every record.
void set_log_passthrough(bool enabled);
bool log_passthrough();

enum class LogChannel {
  Info,
  Warn,
  Error,
  Debug,
  Access,   // one line per served HTTP request
  Print,    // unadorned stdout: banner, URL, QR code
  PrintErr  // unadorned stderr
};

const char* channel_name(LogChannel channel);
spdlog::level::level_enum channel_level(LogChannel channel);

struct LogRecord {
  const std::string& logger;
  LogChannel channel;
  spdlog::level::level_enum level;
  const std::string& message;
};

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Return true to keep the record off the console.
  using Listener = std::function<bool(const LogRecord& record)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void access(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Access, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void log(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void write(LogChannel channel, const std::string& message);
  bool notify_listeners(const LogRecord& record);

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void write_console(LogChannel channel, const std::string& logger_name, const std::string& message);
} // namespace detail

// For code paths that may not have a Logger (startup errors, main).
template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::write_console(LogChannel::Print, std::string(),
                          fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->print_err(fmt, std::forward<Args>(args)...);
  } else {
    detail::write_console(LogChannel::PrintErr, std::string(),
                          fmt::format(fmt, std::forward<Args>(args)...));
  }
}

#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

constexpr const char* kLevelPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kAccessPattern = "[%Y-%m-%d %H:%M:%S.%e] [access] %v";

struct Sinks {
  std::shared_ptr<spdlog::logger> out;     // info, warn, debug
  std::shared_ptr<spdlog::logger> err;     // error
  std::shared_ptr<spdlog::logger> access;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
  bool has_file = false;
};

std::mutex g_sinks_mutex;
Sinks g_sinks;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern,
                                            spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::info);
  logger->flush_on(flush_level);
  return logger;
}

Sinks& sinks_locked() {
  if(g_sinks.out) return g_sinks;
  using namespace spdlog::sinks;
  g_sinks.out = make_logger("qrdrop.out", std::make_shared<stdout_color_sink_mt>(),
                            kLevelPattern, spdlog::level::warn);
  g_sinks.err = make_logger("qrdrop.err", std::make_shared<stderr_color_sink_mt>(),
                            kLevelPattern, spdlog::level::err);
  g_sinks.access = make_logger("qrdrop.access", std::make_shared<stdout_color_sink_mt>(),
                               kAccessPattern, spdlog::level::info);
  g_sinks.print = make_logger("qrdrop.print", std::make_shared<stdout_color_sink_mt>(),
                              "%v", spdlog::level::info);
  g_sinks.print_err = make_logger("qrdrop.print_err", std::make_shared<stderr_color_sink_mt>(),
                                  "%v", spdlog::level::err);
  return g_sinks;
}

void attach_file_locked(Sinks& sinks, const std::string& path) {
  if(path.empty() || sinks.has_file) return;
  auto leveled = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
  leveled->set_pattern(kLevelPattern);
  sinks.out->sinks().push_back(leveled);
  sinks.err->sinks().push_back(leveled);

  // same file, own pattern
  auto access = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
  access->set_pattern(kAccessPattern);
  sinks.access->sinks().push_back(access);
  sinks.has_file = true;
}

spdlog::logger* target_for(LogChannel channel) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  auto& sinks = sinks_locked();
  switch(channel) {
    case LogChannel::Error: return sinks.err.get();
    case LogChannel::Access: return sinks.access.get();
    case LogChannel::Print: return sinks.print.get();
    case LogChannel::PrintErr: return sinks.print_err.get();
    case LogChannel::Info:
    case LogChannel::Warn:
    case LogChannel::Debug:
      break;
  }
  return sinks.out.get();
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Access: return "access";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info:
    case LogChannel::Access:
    case LogChannel::Print:
      break;
  }
  return spdlog::level::info;
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  auto& sinks = sinks_locked();
  attach_file_locked(sinks, log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  sinks.out->set_level(level);
  spdlog::set_default_logger(sinks.out);
  spdlog::set_level(level);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::notify_listeners(const LogRecord& record) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool consumed = false;
  for(auto& listener : snapshot) {
    if(listener(record)) consumed = true;
  }
  return consumed;
}

void Logger::write(LogChannel channel, const std::string& message) {
  LogRecord record{name_, channel, channel_level(channel), message};
  if(notify_listeners(record)) return;
  detail::write_console(channel, name_, message);
}

namespace detail {

void write_console(LogChannel channel, const std::string& logger_name, const std::string& message) {
  if(!log_passthrough()) return;
  spdlog::logger* target = target_for(channel);
  auto level = channel_level(channel);
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !logger_name.empty()) {
    target->log(level, fmt::format("[{}] {}", logger_name, message));
  } else {
    target->log(level, message);
  }
}

} // namespace detail

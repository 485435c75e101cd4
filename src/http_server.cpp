#include "http_server.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <csignal>

namespace {

const char* status_detail(int status){
  switch(status){
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 413: return "Payload Too Large";
    case 414: return "URI Too Long";
    case 416: return "Range Not Satisfiable";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Error";
  }
}

} // namespace

void set_json_error(httplib::Response& res, int status, const std::string& detail){
  res.status = status;
  res.set_content(nlohmann::json{{"detail", detail}}.dump(), "application/json");
}

HttpServer::HttpServer(std::shared_ptr<RouteProvider> routes,
                       Options options,
                       std::shared_ptr<Logger> logger)
: routes_(std::move(routes)),
  options_(std::move(options)),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("http"))
{
  if(!routes_) throw InvalidConfiguration("http server needs routes");
  if(options_.worker_threads == 0){
    options_.worker_threads = std::max(2u, std::thread::hardware_concurrency());
  }
}

HttpServer::~HttpServer(){
  stop();
}

void HttpServer::configure(){
  server_ = std::make_unique<httplib::Server>();
  const auto workers = options_.worker_threads;
  server_->new_task_queue = [workers]{ return new httplib::ThreadPool(workers); };
  server_->set_payload_max_length(static_cast<std::size_t>(options_.max_body_bytes));
  server_->set_read_timeout(options_.io_timeout.count(), 0);
  server_->set_write_timeout(options_.io_timeout.count(), 0);
  // one request per connection
  server_->set_keep_alive_max_count(1);

  // unmatched routes and transport-level rejections (413, malformed multipart)
  server_->set_error_handler([](const httplib::Request&, httplib::Response& res){
    if(res.body.empty()) set_json_error(res, res.status, status_detail(res.status));
  });

  auto logger = logger_;
  auto routes = routes_;
  server_->set_logger([logger, routes](const httplib::Request& req, const httplib::Response& res){
    std::string bytes = res.get_header_value("Content-Length");
    logger->access("{} \"{} {}\" {} {}",
                   req.remote_addr.empty() ? "-" : req.remote_addr,
                   req.method,
                   routes->loggable_path(req.path),
                   res.status,
                   bytes.empty() ? "-" : bytes);
  });

  routes_->register_routes(*server_);
}

void HttpServer::start(){
  if(started_) return;

  std::error_code ec;
  asio::ip::make_address(options_.host, ec);
  if(ec){
    throw InvalidConfiguration("Invalid host '" + options_.host + "': " + ec.message());
  }

  configure();
  if(options_.port == 0){
    int bound = server_->bind_to_any_port(options_.host);
    if(bound < 0){
      throw IOFailure("Cannot listen on " + options_.host + ": no free port");
    }
    port_ = static_cast<uint16_t>(bound);
  } else {
    if(!server_->bind_to_port(options_.host, options_.port)){
      throw IOFailure("Cannot listen on " + options_.host + ":" + std::to_string(options_.port));
    }
    port_ = options_.port;
  }
  started_ = true;

  control_work_.emplace(asio::make_work_guard(control_));
  if(options_.handle_signals){
    signals_ = std::make_unique<asio::signal_set>(control_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& sig_ec, int signo){
      if(sig_ec) return;
      logger_->info("Received signal {}, shutting down", signo);
      request_shutdown();
    });
  }
  control_thread_ = std::thread([this]{ control_.run(); });

  logger_->debug("Listening on {}:{} with {} worker thread(s)",
                 options_.host, port_, options_.worker_threads);
}

void HttpServer::run(){
  if(!started_) start();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(stopped_){
      logger_->debug("Server loop finished");
      return;
    }
    listening_ = true;
  }
  if(!server_->listen_after_bind()){
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(!stopped_) logger_->error("Listener on port {} failed", port_);
  }
  logger_->debug("Server loop finished");
}

void HttpServer::start_background(){
  if(!started_) start();
  if(background_.joinable()) return;
  background_ = std::thread([this]{ run(); });
  server_->wait_until_ready();
}

void HttpServer::request_shutdown(std::chrono::milliseconds grace){
  if(shutdown_requested_.exchange(true)) return;
  asio::post(control_, [this, grace]{
    grace_timer_ = std::make_unique<asio::steady_timer>(control_);
    grace_timer_->expires_after(grace);
    grace_timer_->async_wait([this](const std::error_code& ec){
      if(ec) return;
      stop_listening();
    });
  });
}

void HttpServer::stop_listening(){
  std::lock_guard<std::mutex> lock(state_mutex_);
  if(stopped_) return;
  stopped_ = true;
  if(signals_){
    std::error_code ec;
    signals_->cancel(ec);
  }
  if(server_ && listening_){
    server_->wait_until_ready();
    server_->stop();
  }
}

void HttpServer::stop(){
  stop_listening();
  if(background_.joinable() && background_.get_id() != std::this_thread::get_id()){
    background_.join();
  }
  control_work_.reset();
  control_.stop();
  if(control_thread_.joinable() && control_thread_.get_id() != std::this_thread::get_id()){
    control_thread_.join();
  }
}

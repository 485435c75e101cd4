#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "access_token.hpp"
#include "http_server.hpp"

class ItemRegistry;
class Logger;
class SessionCoordinator;

// Routes of the upload or share page, all gated by the session token except
// /health and the static script. Token failures and unknown routes produce
// the same 404 response.
class TransferService : public RouteProvider {
public:
  enum class Mode { Upload, Share };

  struct Options {
    Mode mode = Mode::Upload;
    std::filesystem::path upload_dir = "uploads";
    std::string logo_text;
  };

  TransferService(std::shared_ptr<SessionCoordinator> session,
                  std::shared_ptr<ItemRegistry> registry,
                  Options options,
                  std::shared_ptr<Logger> logger = nullptr,
                  SystemClock clock = default_clock());

  void register_routes(httplib::Server& server) override;
  std::string loggable_path(const std::string& path) const override;

  // "/upload/<token>" or "/share/<token>"
  std::string page_path() const;

private:
  using Route = void (TransferService::*)(const httplib::Request&, httplib::Response&);

  // Runs a route and maps TransferErrors onto responses.
  httplib::Server::Handler guarded(Route route);

  void upload_page(const httplib::Request& req, httplib::Response& res);
  void upload_files(const httplib::Request& req, httplib::Response& res);
  void share_page(const httplib::Request& req, httplib::Response& res);
  void download(const httplib::Request& req, httplib::Response& res);

  std::string save_upload(const std::string& filename,
                          const std::string& content,
                          std::chrono::system_clock::time_point now);

  std::shared_ptr<SessionCoordinator> session_;
  std::shared_ptr<ItemRegistry> registry_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  SystemClock clock_;
};

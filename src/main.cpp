#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unistd.h>

#include "access_token.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "http_server.hpp"
#include "item_registry.hpp"
#include "log.hpp"
#include "pages.hpp"
#include "qr_terminal.hpp"
#include "session_coordinator.hpp"
#include "settings_manager.hpp"
#include "transfer_service.hpp"
#include "utils.hpp"

constexpr std::chrono::milliseconds kCompletionGrace{250};

// Address other machines on the LAN can reach us at. Connecting a UDP socket
// sends nothing; it only asks the kernel which interface it would route by.
std::string get_local_ip(Logger& logger) {
  using asio::ip::udp;
  try {
    asio::io_context io;
    udp::socket socket(io);
    socket.connect(udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
    return socket.local_endpoint().address().to_string();
  } catch (const std::exception& e) {
    logger.debug("get_local_ip() failed: {}", e.what());
    return "127.0.0.1";
  }
}

bool is_wildcard_host(const std::string& host) {
  return host.empty() || host == "0.0.0.0" || host == "::";
}

uint16_t validated_port(int value) {
  if(value < 0 || value > 65535) {
    throw InvalidConfiguration("Invalid port '" + std::to_string(value) + "'");
  }
  return static_cast<uint16_t>(value);
}

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    CommandLineParser parser("qrdrop");
    parser.parse(argc, argv, settings);
    if(settings.help_requested()) {
      std::cout << parser.usage(settings);
      return 0;
    }

    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("qrdrop");
    logger->debug("Verbose logging enabled");

    int ttl_minutes = settings.get<int>("ttl_minutes");
    if(ttl_minutes <= 0) {
      throw InvalidConfiguration("ttl_minutes must be positive, got " + std::to_string(ttl_minutes));
    }
    int max_upload_mb = settings.get<int>("max_upload_mb");
    if(max_upload_mb <= 0) {
      throw InvalidConfiguration("max_upload_mb must be positive, got " + std::to_string(max_upload_mb));
    }
    int workers = settings.get<int>("workers");
    if(workers < 0) {
      throw InvalidConfiguration("workers must not be negative");
    }

    auto token = AccessToken::generate(std::chrono::minutes(ttl_minutes));
    auto share_paths = settings.get<std::vector<std::string>>("share");

    TransferService::Options service_options;
    service_options.logo_text = load_logo(settings.get<std::string>("logo_file"));
    std::shared_ptr<ItemRegistry> registry;
    if(!share_paths.empty()) {
      service_options.mode = TransferService::Mode::Share;
      registry = std::make_shared<ItemRegistry>(std::make_shared<Logger>("registry"));
      registry->build(share_paths);
    } else {
      service_options.upload_dir = std::filesystem::absolute(settings.get<std::string>("upload_dir"));
      std::error_code ec;
      std::filesystem::create_directories(service_options.upload_dir, ec);
      if(ec) {
        throw InvalidConfiguration("Cannot create upload directory " +
                                   service_options.upload_dir.string() + ": " + ec.message());
      }
    }

    auto session = std::make_shared<SessionCoordinator>(
      token, settings.get<bool>("exit_on_upload"), std::make_shared<Logger>("session"));
    auto service = std::make_shared<TransferService>(
      session, registry, service_options, std::make_shared<Logger>("transfer"));

    HttpServer::Options server_options;
    server_options.host = settings.get<std::string>("host");
    server_options.port = validated_port(settings.get<int>("port"));
    server_options.worker_threads = static_cast<std::size_t>(workers);
    server_options.max_body_bytes = static_cast<uint64_t>(max_upload_mb) * 1024 * 1024;
    HttpServer server(service, server_options, std::make_shared<Logger>("http"));
    server.start();
    session->set_shutdown_handler([&server]{ server.request_shutdown(kCompletionGrace); });

    std::string host = is_wildcard_host(server_options.host) ? get_local_ip(*logger) : server_options.host;
    std::string url = fmt::format("http://{}:{}{}", host, server.port(), service->page_path());

    if(!service_options.logo_text.empty()) {
      if(::isatty(STDOUT_FILENO)) {
        logger->print("\033[90m{}\033[0m\n", service_options.logo_text);
      } else {
        logger->print("{}\n", service_options.logo_text);
      }
    }
    logger->print("{}", render_terminal_qr(url));
    logger->print("{}", url);
    logger->print("Link expires at {}", iso8601_utc(token.expires_at()));
    if(registry) {
      for(const auto& item : registry->list()) {
        logger->print("  [{}] {} ({})", item.id, item.display_name,
                      item.size_bytes ? human_size(*item.size_bytes) : "?");
      }
    } else {
      logger->print("Saving uploads to {}", service_options.upload_dir.string());
    }
    logger->print("{}", completion_hint(registry != nullptr, session->exit_on_completion()));
    logger->print("Press Ctrl+C to stop");

    server.run();
    logger->info("Server stopped");
    return 0;
  } catch(const TransferError& e) {
    if(!e.fatal_at_startup()) {
      init(false);
      Logger logger("qrdrop-main");
      logger.error("{}: {}", error_kind_name(e.kind()), e.what());
      return 1;
    }
    print_err(nullptr, "error: {}", e.what());
    return 2;
  } catch(std::exception& e) {
    init(false);
    Logger logger("qrdrop-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}

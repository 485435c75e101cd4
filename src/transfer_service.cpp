#include "transfer_service.hpp"
#include "errors.hpp"
#include "filename_sanitizer.hpp"
#include "item_registry.hpp"
#include "log.hpp"
#include "pages.hpp"
#include "session_coordinator.hpp"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* kUploadField = "files";
constexpr int kMaxNameAttempts = 1000;
constexpr std::size_t kDownloadChunk = 64 * 1024;

bool parse_item_id(const std::string& text, std::size_t& out){
  if(text.empty() || text.size() > 9) return false;
  if(!std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c); })) return false;
  out = static_cast<std::size_t>(std::stoul(text));
  return true;
}

// "name.ext" -> "name (n).ext"
std::string numbered_name(const std::string& name, int n){
  auto dot = name.rfind('.');
  if(dot == std::string::npos || dot == 0) return name + " (" + std::to_string(n) + ")";
  return name.substr(0, dot) + " (" + std::to_string(n) + ")" + name.substr(dot);
}

void write_all(int fd, const std::string& data, const fs::path& target){
  const char* p = data.data();
  std::size_t left = data.size();
  while(left > 0){
    ssize_t n = ::write(fd, p, left);
    if(n < 0){
      if(errno == EINTR) continue;
      throw IOFailure("write " + target.filename().string() + ": " + std::strerror(errno));
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
}

std::vector<std::string> path_segments(const std::string& path){
  std::vector<std::string> out;
  std::size_t start = 0;
  while(start <= path.size()){
    auto slash = path.find('/', start);
    if(slash == std::string::npos) slash = path.size();
    if(slash > start) out.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return out;
}

void set_html(httplib::Response& res, const std::string& body){
  res.set_header("Cache-Control", "no-store");
  res.set_content(body, "text/html; charset=utf-8");
}

// Progress of one download. Only a response whose every byte went through
// the sink counts as a completed transfer.
struct DownloadStream {
  std::ifstream in;
  uint64_t size = 0;
  uint64_t written = 0;
  std::vector<char> buffer;
};

} // namespace

TransferService::TransferService(std::shared_ptr<SessionCoordinator> session,
                                 std::shared_ptr<ItemRegistry> registry,
                                 Options options,
                                 std::shared_ptr<Logger> logger,
                                 SystemClock clock)
: session_(std::move(session)),
  registry_(std::move(registry)),
  options_(std::move(options)),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")),
  clock_(clock ? std::move(clock) : default_clock())
{
  if(!session_) throw InvalidConfiguration("transfer service needs a session");
  if(options_.mode == Mode::Share && !registry_){
    throw InvalidConfiguration("share mode needs an item registry");
  }
}

std::string TransferService::page_path() const {
  const char* prefix = options_.mode == Mode::Share ? "/share/" : "/upload/";
  return prefix + session_->token().value();
}

void TransferService::register_routes(httplib::Server& server){
  server.Get("/health", [](const httplib::Request&, httplib::Response& res){
    res.set_content("ok", "text/plain; charset=utf-8");
  });
  server.Get("/static/app.js", [](const httplib::Request&, httplib::Response& res){
    res.set_content(upload_script(), "text/javascript; charset=utf-8");
  });

  // routes of the other mode stay unregistered and fall through to 404
  if(options_.mode == Mode::Upload){
    server.Get(R"(/upload/([^/]+))", guarded(&TransferService::upload_page));
    server.Post(R"(/api/upload/([^/]+))", guarded(&TransferService::upload_files));
  } else {
    server.Get(R"(/share/([^/]+))", guarded(&TransferService::share_page));
    server.Get(R"(/download/([^/]+)/([^/]+))", guarded(&TransferService::download));
  }
}

httplib::Server::Handler TransferService::guarded(Route route){
  return [this, route](const httplib::Request& req, httplib::Response& res){
    try {
      (this->*route)(req, res);
    } catch(const TransferError& e) {
      switch(e.kind()){
        case ErrorKind::Unauthorized:
          set_json_error(res, 404, "Not Found");
          return;
        case ErrorKind::ItemNotFound:
        case ErrorKind::SourceNotFound:
          logger_->debug("{}: {}", error_kind_name(e.kind()), e.what());
          set_json_error(res, 404, "Not Found");
          return;
        case ErrorKind::IOFailure:
          logger_->error("{} {}: {}", req.method, loggable_path(req.path), e.what());
          set_json_error(res, 500, e.what());
          return;
        case ErrorKind::InvalidConfiguration:
          break;
      }
      logger_->error("{} {}: {}", req.method, loggable_path(req.path), e.what());
      set_json_error(res, 500, "Internal Server Error");
    } catch(const std::exception& e) {
      logger_->error("{} {}: {}", req.method, loggable_path(req.path), e.what());
      set_json_error(res, 500, "Internal Server Error");
    }
  };
}

void TransferService::upload_page(const httplib::Request& req, httplib::Response& res){
  const std::string token = req.matches[1].str();
  session_->authorize(token);
  set_html(res, render_upload_page(token, options_.logo_text));
}

void TransferService::upload_files(const httplib::Request& req, httplib::Response& res){
  session_->authorize(req.matches[1].str());

  if(!req.is_multipart_form_data()){
    set_json_error(res, 400, "Expected multipart/form-data");
    return;
  }
  auto parts = req.get_file_values(kUploadField);
  parts.erase(std::remove_if(parts.begin(), parts.end(),
                             [](const httplib::MultipartFormData& p){ return p.filename.empty(); }),
              parts.end());
  if(parts.empty()){
    set_json_error(res, 400, "No files provided");
    return;
  }

  std::error_code ec;
  fs::create_directories(options_.upload_dir, ec);
  if(ec){
    throw IOFailure("cannot create " + options_.upload_dir.string() + ": " + ec.message());
  }

  // one timestamp for the whole request
  auto now = clock_();
  nlohmann::json saved = nlohmann::json::array();
  for(const auto& part : parts){
    auto name = save_upload(part.filename, part.content, now);
    logger_->info("Saved {} ({} bytes) from {}", name, part.content.size(), req.remote_addr);
    saved.push_back(name);
  }

  session_->report_completion();
  res.set_content(nlohmann::json{{"saved", saved}}.dump(), "application/json");
}

std::string TransferService::save_upload(const std::string& filename,
                                         const std::string& content,
                                         std::chrono::system_clock::time_point now){
  const std::string base = sanitize_and_prefix(filename, now);
  for(int attempt = 0; attempt < kMaxNameAttempts; ++attempt){
    std::string name = attempt == 0 ? base : numbered_name(base, attempt);
    fs::path target = options_.upload_dir / name;
    int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if(fd < 0){
      if(errno == EEXIST) continue;
      throw IOFailure("Failed to save '" + name + "': " + std::strerror(errno));
    }
    try {
      write_all(fd, content, target);
    } catch(const IOFailure&) {
      ::close(fd);
      std::error_code ec;
      fs::remove(target, ec);
      throw;
    }
    if(::close(fd) != 0){
      int err = errno;
      std::error_code ec;
      fs::remove(target, ec);
      throw IOFailure("Failed to save '" + name + "': " + std::strerror(err));
    }
    return name;
  }
  throw IOFailure("Failed to save '" + base + "': too many files with this name");
}

void TransferService::share_page(const httplib::Request& req, httplib::Response& res){
  const std::string token = req.matches[1].str();
  session_->authorize(token);
  set_html(res, render_share_page(token, registry_->list(), options_.logo_text));
}

void TransferService::download(const httplib::Request& req, httplib::Response& res){
  session_->authorize(req.matches[1].str());

  const std::string item_id = req.matches[2].str();
  std::size_t id = 0;
  if(!parse_item_id(item_id, id)){
    throw ItemNotFound("invalid item id '" + item_id + "'");
  }
  const auto& item = registry_->get(id);

  auto stream = std::make_shared<DownloadStream>();
  std::error_code ec;
  stream->size = fs::file_size(item.source_path, ec);
  if(!ec) stream->in.open(item.source_path, std::ios::binary);
  if(ec || !stream->in){
    logger_->warn("{} is no longer available: {}", item.source_path.string(),
                  ec ? ec.message() : std::string("cannot open"));
    set_json_error(res, 404, "File no longer available");
    return;
  }
  stream->buffer.resize(kDownloadChunk);

  res.set_header("Content-Disposition", "attachment; filename=\"" + item.display_name + "\"");
  auto session = session_;
  auto logger = logger_;
  auto name = item.display_name;
  res.set_content_provider(
    static_cast<std::size_t>(stream->size),
    "application/octet-stream",
    [stream](std::size_t offset, std::size_t length, httplib::DataSink& sink){
      auto want = std::min(length, stream->buffer.size());
      stream->in.clear();
      stream->in.seekg(static_cast<std::streamoff>(offset));
      stream->in.read(stream->buffer.data(), static_cast<std::streamsize>(want));
      auto got = stream->in.gcount();
      // the file shrank or became unreadable
      if(got <= 0) return false;
      if(!sink.write(stream->buffer.data(), static_cast<std::size_t>(got))) return false;
      stream->written += static_cast<uint64_t>(got);
      return true;
    },
    [stream, session, logger, name](bool success){
      const bool complete = stream->written == stream->size && (success || stream->size == 0);
      if(!complete){
        logger->warn("Download of {} interrupted after {} of {} bytes",
                     name, stream->written, stream->size);
        return;
      }
      logger->info("Download of {} completed", name);
      session->report_completion();
    });
}

std::string TransferService::loggable_path(const std::string& path) const {
  auto segments = path_segments(path);
  std::size_t token_index = 0;
  if(segments.size() >= 2 && (segments[0] == "upload" || segments[0] == "share" || segments[0] == "download")){
    token_index = 1;
  } else if(segments.size() >= 3 && segments[0] == "api" && segments[1] == "upload"){
    token_index = 2;
  } else {
    return path;
  }
  segments[token_index] = "<token>";
  std::string out;
  for(const auto& s : segments) out += "/" + s;
  return out;
}

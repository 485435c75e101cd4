#include "item_registry.hpp"
#include "errors.hpp"
#include "filename_sanitizer.hpp"
#include "log.hpp"
#include "zip_writer.hpp"

#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

fs::path expand_user(const std::string& raw){
  if(raw.empty() || raw[0] != '~') return fs::path(raw);
  if(raw.size() > 1 && raw[1] != '/') return fs::path(raw);
  const char* home = std::getenv("HOME");
  if(!home || !*home) return fs::path(raw);
  return fs::path(home) / raw.substr(raw.size() > 1 ? 2 : 1);
}

fs::path resolve(const std::string& raw){
  std::error_code ec;
  auto expanded = expand_user(raw);
  auto canonical = fs::weakly_canonical(expanded, ec);
  if(!ec) return canonical;
  return fs::absolute(expanded, ec).lexically_normal();
}

fs::path unique_archive_path(const fs::path& dir, const std::string& base){
  std::error_code ec;
  fs::path candidate = dir / (base + ".zip");
  for(int n = 1; fs::exists(candidate, ec); ++n){
    candidate = dir / (base + "_" + std::to_string(n) + ".zip");
  }
  return candidate;
}

} // namespace

ItemRegistry::ItemRegistry(std::shared_ptr<Logger> logger)
: logger_(logger ? std::move(logger) : std::make_shared<Logger>("registry"))
{
}

ItemRegistry::~ItemRegistry(){
  if(!temp_dir_.empty()) remove_temp_dir(temp_dir_);
}

fs::path ItemRegistry::make_temp_dir(){
  std::error_code ec;
  auto base = fs::temp_directory_path(ec);
  if(ec) base = "/tmp";
  std::string templ = (base / "qrdrop_share_XXXXXX").string();
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if(::mkdtemp(buf.data()) == nullptr){
    throw IOFailure("cannot create temporary directory under " + base.string());
  }
  return fs::path(buf.data());
}

void ItemRegistry::remove_temp_dir(const fs::path& dir) const {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if(ec){
    logger_->warn("Failed to remove {}: {}", dir.string(), ec.message());
  } else {
    logger_->debug("Removed {}", dir.string());
  }
}

void ItemRegistry::build(const std::vector<std::string>& paths){
  if(built_) throw InvalidConfiguration("item registry is already built");

  std::vector<fs::path> resolved;
  resolved.reserve(paths.size());
  for(const auto& raw : paths){
    auto p = resolve(raw);
    std::error_code ec;
    auto status = fs::status(p, ec);
    if(ec || !fs::exists(status)){
      throw SourceNotFound("Path does not exist: " + raw);
    }
    // ids follow argument positions, so nothing may be dropped
    if(!fs::is_regular_file(status) && !fs::is_directory(status)){
      throw InvalidConfiguration("Not a regular file or directory: " + raw);
    }
    resolved.push_back(std::move(p));
  }

  std::vector<RegistryItem> items;
  fs::path temp_dir;
  try {
    for(const auto& p : resolved){
      std::error_code ec;
      RegistryItem item;
      item.id = items.size();
      if(fs::is_regular_file(p, ec)){
        item.display_name = sanitize_filename(p.filename().string());
        item.source_path = p;
        auto size = fs::file_size(p, ec);
        if(!ec) item.size_bytes = size;
      } else if(fs::is_directory(p, ec)){
        if(temp_dir.empty()) temp_dir = make_temp_dir();
        std::string base = p.filename().empty() ? "dir" : sanitize_filename(p.filename().string());
        auto archive = unique_archive_path(temp_dir, base);
        logger_->info("Archiving {} -> {}", p.string(), archive.filename().string());
        zip_directory(p, archive, logger_.get());
        item.display_name = archive.filename().string();
        item.source_path = archive;
        item.is_temporary = true;
        auto size = fs::file_size(archive, ec);
        if(!ec) item.size_bytes = size;
      } else {
        throw SourceNotFound("Path changed type during build: " + p.string());
      }
      items.push_back(std::move(item));
    }
  } catch(...) {
    if(!temp_dir.empty()) remove_temp_dir(temp_dir);
    throw;
  }

  items_ = std::move(items);
  temp_dir_ = std::move(temp_dir);
  built_ = true;
  logger_->debug("Registry built with {} item(s)", items_.size());
}

const RegistryItem& ItemRegistry::get(std::size_t id) const {
  if(id >= items_.size()){
    throw ItemNotFound("no item with id " + std::to_string(id));
  }
  return items_[id];
}

std::vector<RegistryItemSummary> ItemRegistry::list() const {
  std::vector<RegistryItemSummary> out;
  out.reserve(items_.size());
  for(const auto& item : items_){
    out.push_back({item.id, item.display_name, item.size_bytes});
  }
  return out;
}

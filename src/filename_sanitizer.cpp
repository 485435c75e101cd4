#include "filename_sanitizer.hpp"
#include "utils.hpp"

#include <cstring>

namespace {

bool is_allowed(char c){
  unsigned char uc = static_cast<unsigned char>(c);
  if(uc >= 0x80) return false;
  if((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return true;
  return std::strchr("-_.() ", c) != nullptr && c != '\0';
}

} // namespace

std::string sanitize_filename(const std::string& raw,
                              std::chrono::system_clock::time_point now){
  std::string out;
  out.reserve(raw.size());
  for(char c : raw){
    if(is_allowed(c)) out.push_back(c);
  }
  if(out.empty()){
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return "file_" + std::to_string(secs);
  }
  return out;
}

std::string sanitize_and_prefix(const std::string& raw,
                                std::chrono::system_clock::time_point now){
  return compact_utc_timestamp(now) + "_" + sanitize_filename(raw, now);
}

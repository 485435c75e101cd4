#include "utils.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <sstream>
#include <stdexcept>

namespace {

std::tm to_utc_tm(std::chrono::system_clock::time_point tp){
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm out{};
  gmtime_r(&t, &out);
  return out;
}

std::string format_tm(const std::tm& tm, const char* pattern){
  std::array<char, 64> buf{};
  auto n = std::strftime(buf.data(), buf.size(), pattern, &tm);
  return std::string(buf.data(), n);
}

} // namespace

std::vector<unsigned char> secure_random_bytes(std::size_t count){
  std::vector<unsigned char> out(count);
  if(count == 0) return out;
  if(RAND_bytes(out.data(), static_cast<int>(out.size())) != 1){
    throw std::runtime_error("RAND_bytes failed: " +
                             std::to_string(ERR_get_error()));
  }
  return out;
}

std::string base64url_from_bytes(const std::vector<unsigned char>& b){
  if(b.empty()) return std::string();
  std::vector<unsigned char> encoded(4 * ((b.size() + 2) / 3) + 1);
  int n = EVP_EncodeBlock(encoded.data(), b.data(), static_cast<int>(b.size()));
  if(n < 0){
    throw std::runtime_error("EVP_EncodeBlock failed");
  }
  std::string out(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(n));
  // url alphabet, no padding
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  out.erase(out.find_last_not_of('=') + 1);
  return out;
}

bool constant_time_equals(const std::string& a, const std::string& b){
  if(a.size() != b.size()) return false;
  if(a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp){
  return format_tm(to_utc_tm(tp), "%Y-%m-%dT%H:%M:%S+00:00");
}

std::string compact_utc_timestamp(std::chrono::system_clock::time_point tp){
  return format_tm(to_utc_tm(tp), "%Y%m%dT%H%M%S");
}

std::string human_size(uint64_t num_bytes){
  static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
  double size = static_cast<double>(num_bytes);
  std::size_t unit = 0;
  while(size >= 1024.0 && unit + 1 < units.size()){
    size /= 1024.0;
    ++unit;
  }
  return fmt::format("{:.1f} {}", size, units[unit]);
}

std::string html_escape(const std::string& text){
  std::string out;
  out.reserve(text.size());
  for(char c : text){
    switch(c){
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#x27;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

std::string trim_common_left_spaces(const std::string& text){
  std::vector<std::string> lines;
  std::istringstream is(text);
  std::string line;
  while(std::getline(is, line)) lines.push_back(line);

  std::size_t common = std::string::npos;
  for(const auto& l : lines){
    if(l.find_first_not_of(" \t\r") == std::string::npos) continue;
    // tabs are kept, only spaces count
    common = std::min(common, l.find_first_not_of(' '));
  }
  if(common == std::string::npos || common == 0) return text;

  std::string out;
  for(std::size_t i = 0; i < lines.size(); ++i){
    if(i > 0) out.push_back('\n');
    if(lines[i].size() >= common) out += lines[i].substr(common);
  }
  return out;
}

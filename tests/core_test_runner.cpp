#include "access_token.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "filename_sanitizer.hpp"
#include "item_registry.hpp"
#include "pages.hpp"
#include "session_coordinator.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"
#include "zip_writer.hpp"

#include <sys/stat.h>
#include <zlib.h>

#include <atomic>
#include <chrono>
#include <cctype>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using qrdrop::test::ScratchDir;
using qrdrop::test::TestCase;
using qrdrop::test::TestContext;

namespace {

struct ManualClock {
  std::shared_ptr<std::chrono::system_clock::time_point> now =
    std::make_shared<std::chrono::system_clock::time_point>(std::chrono::system_clock::from_time_t(1700000000));

  SystemClock fn() const {
    auto p = now;
    return [p]{ return *p; };
  }
  void advance(std::chrono::system_clock::duration d) { *now += d; }
};

bool is_safe_name_char(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return (u < 0x80 && std::isalnum(u)) || c == '-' || c == '_' || c == '.' || c == '(' || c == ')' || c == ' ';
}

bool test_token_expiry_boundary(TestContext&) {
  ManualClock clock;
  auto token = AccessToken::generate(10min, clock.fn());
  if(token.expires_at() != *clock.now + 10min) return false;
  if(!token.is_valid(token.value())) return false;
  if(token.is_valid(token.value() + "x") || token.is_valid("")) return false;

  const auto tick = std::chrono::system_clock::duration(1);
  clock.advance(10min - tick);
  if(!token.is_valid(token.value())) return false;
  clock.advance(tick);
  if(token.is_valid(token.value())) return false;

  try {
    token.validate(token.value());
    return false;
  } catch(const Unauthorized& e) {
    return e.kind() == ErrorKind::Unauthorized;
  }
}

bool test_token_uniqueness(TestContext&) {
  std::set<std::string> seen;
  for(int i = 0; i < 10000; ++i) {
    auto token = AccessToken::generate(1min);
    const auto& v = token.value();
    // 32 bytes -> 43 unpadded base64url characters
    if(v.size() != 43) return false;
    for(char c : v) {
      if(!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')) return false;
    }
    seen.insert(v);
  }
  return seen.size() == 10000;
}

bool test_token_rejects_nonpositive_ttl(TestContext&) {
  for(auto ttl : {std::chrono::system_clock::duration::zero(),
                  std::chrono::duration_cast<std::chrono::system_clock::duration>(-1s)}) {
    try {
      AccessToken::generate(ttl);
      return false;
    } catch(const InvalidConfiguration& e) {
      if(!e.fatal_at_startup()) return false;
    }
  }
  return true;
}

bool test_sanitize_filename(TestContext&) {
  auto now = std::chrono::system_clock::from_time_t(1700000000);
  std::map<std::string, std::string> cases = {
    {"report.pdf", "report.pdf"},
    {"../../etc/passwd", "....etcpasswd"},
    {"my photo (1).jpg", "my photo (1).jpg"},
    {"h\xC3\xA9llo w\xC3\xB6rld.txt", "hllo wrld.txt"},
    {"a;b|c&d$e.sh", "abcde.sh"},
    {"h\xC3\xA9llo\xE4\xB8\x96\xE7\x95\x8C<script>.txt", "hlloscript.txt"},
    {"", "file_1700000000"},
    {"\xE2\x98\x83\xE2\x98\x83", "file_1700000000"},
    {"///", "file_1700000000"},
  };
  for(const auto& [input, expected] : cases) {
    auto out = sanitize_filename(input, now);
    if(out != expected) {
      std::cerr << "sanitize_filename('" << input << "') = '" << out << "'\n";
      return false;
    }
    for(char c : out) {
      if(!is_safe_name_char(c)) return false;
    }
  }
  return sanitize_and_prefix("a.txt", now) == "20231114T221320_a.txt" &&
         sanitize_and_prefix("", now) == "20231114T221320_file_1700000000";
}

bool test_registry_order_and_archives(TestContext& ctx) {
  ScratchDir scratch("qrdrop_registry");
  auto single = scratch.write("notes.txt", "hello");
  scratch.write("photos/a.jpg", "jpeg-bytes");
  scratch.write("photos/trip/b.txt", "b");
  auto other = scratch.write("z-last.bin", std::string(1000, 'z'));

  auto logger = std::make_shared<Logger>("registry");
  ctx.logs.attach(logger);
  fs::path temp_dir;
  fs::path archive;
  {
    ItemRegistry registry(logger);
    registry.build({single.string(), (scratch.path() / "photos").string(), other.string()});
    if(registry.size() != 3) return false;

    const auto& a = registry.get(0);
    const auto& b = registry.get(1);
    const auto& c = registry.get(2);
    if(a.display_name != "notes.txt" || a.is_temporary || a.size_bytes != 5u) return false;
    if(b.display_name != "photos.zip" || !b.is_temporary || !b.size_bytes) return false;
    if(c.display_name != "z-last.bin" || c.size_bytes != 1000u) return false;
    if(!fs::exists(b.source_path) || b.source_path.parent_path() != registry.temp_dir()) return false;

    auto summaries = registry.list();
    for(std::size_t i = 0; i < summaries.size(); ++i) {
      if(summaries[i].id != i) return false;
    }
    temp_dir = registry.temp_dir();
    archive = b.source_path;

    try {
      registry.get(3);
      return false;
    } catch(const ItemNotFound&) {
    }
    try {
      registry.build({single.string()});
      return false;
    } catch(const InvalidConfiguration&) {
    }
  }
  // archives live only as long as the registry
  return !temp_dir.empty() && !fs::exists(archive) && !fs::exists(temp_dir);
}

bool test_registry_missing_path_is_all_or_nothing(TestContext& ctx) {
  ScratchDir scratch("qrdrop_registry_missing");
  auto present = scratch.write("dir/x.txt", "x");
  auto logger = std::make_shared<Logger>("registry");
  ctx.logs.attach(logger);

  ItemRegistry registry(logger);
  try {
    registry.build({(scratch.path() / "dir").string(), (scratch.path() / "nope").string()});
    return false;
  } catch(const SourceNotFound& e) {
    if(std::string(e.what()).find("nope") == std::string::npos) return false;
  }
  if(!registry.empty() || !registry.temp_dir().empty()) return false;
  try {
    registry.get(0);
    return false;
  } catch(const ItemNotFound&) {
  }

  // a failed build leaves the registry usable
  registry.build({present.string()});
  return registry.size() == 1 && registry.get(0).display_name == "x.txt";
}

bool test_registry_duplicate_directory_names(TestContext& ctx) {
  ScratchDir scratch("qrdrop_registry_dupes");
  scratch.write("one/docs/a.txt", "a");
  scratch.write("two/docs/b.txt", "b");
  auto logger = std::make_shared<Logger>("registry");
  ctx.logs.attach(logger);

  ItemRegistry registry(logger);
  registry.build({(scratch.path() / "one/docs").string(), (scratch.path() / "two/docs").string()});
  return registry.size() == 2 &&
         registry.get(0).display_name == "docs.zip" &&
         registry.get(1).display_name == "docs_1.zip";
}

bool test_registry_rejects_special_files(TestContext& ctx) {
  ScratchDir scratch("qrdrop_registry_special");
  auto first = scratch.write("first.txt", "1");
  auto last = scratch.write("last.txt", "3");
  auto fifo = scratch.path() / "pipe";
  if(::mkfifo(fifo.c_str(), 0600) != 0) return false;
  auto logger = std::make_shared<Logger>("registry");
  ctx.logs.attach(logger);

  ItemRegistry registry(logger);
  try {
    registry.build({first.string(), fifo.string(), last.string()});
    return false;
  } catch(const InvalidConfiguration& e) {
    if(std::string(e.what()).find("pipe") == std::string::npos) return false;
  }
  if(!registry.empty() || !registry.temp_dir().empty()) return false;

  // without the fifo every id matches its argument position
  registry.build({first.string(), last.string()});
  return registry.size() == 2 &&
         registry.get(0).display_name == "first.txt" &&
         registry.get(1).display_name == "last.txt";
}

bool test_completion_fires_once(TestContext& ctx) {
  constexpr int kThreads = 16;
  auto logger = std::make_shared<Logger>("session");
  ctx.logs.attach(logger);
  SessionCoordinator session(AccessToken::generate(1min), true, logger);
  std::atomic<int> shutdowns{0};
  session.set_shutdown_handler([&]{ shutdowns++; });

  std::mutex m;
  std::condition_variable cv;
  bool go = false;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for(int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&]{
      {
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&]{ return go; });
      }
      if(session.report_completion()) winners++;
    });
  }
  {
    std::lock_guard<std::mutex> lock(m);
    go = true;
  }
  cv.notify_all();
  for(auto& t : threads) t.join();

  return shutdowns == 1 && winners == 1 && session.completed() && !session.report_completion();
}

bool test_completion_without_exit_keeps_serving(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("session");
  ctx.logs.attach(logger);
  SessionCoordinator session(AccessToken::generate(1min), false, logger);
  bool called = false;
  session.set_shutdown_handler([&]{ called = true; });
  bool fired = session.report_completion();
  return !fired && !called && session.completed() && ctx.logs.contains("First transfer completed");
}

bool test_session_authorize(TestContext&) {
  SessionCoordinator session(AccessToken::generate(1min), false);
  const auto good = session.token().value();
  if(!session.is_authorized(good) || session.is_authorized("nope")) return false;
  session.authorize(good);
  try {
    session.authorize("nope");
    return false;
  } catch(const Unauthorized&) {
    return true;
  }
}

uint16_t le16(const std::string& s, std::size_t at) {
  return static_cast<uint16_t>(static_cast<unsigned char>(s[at]) |
                               (static_cast<unsigned char>(s[at + 1]) << 8));
}

uint32_t le32(const std::string& s, std::size_t at) {
  return static_cast<uint32_t>(le16(s, at)) | (static_cast<uint32_t>(le16(s, at + 2)) << 16);
}

std::string inflate_raw(const std::string& data, std::size_t expected) {
  std::string out(expected, '\0');
  z_stream zs{};
  if(inflateInit2(&zs, -MAX_WBITS) != Z_OK) throw std::runtime_error("inflateInit2");
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  int rc = inflate(&zs, Z_FINISH);
  inflateEnd(&zs);
  if(rc != Z_STREAM_END) throw std::runtime_error("inflate failed");
  return out;
}

// name -> contents, directories map to ""
std::map<std::string, std::string> read_zip(const fs::path& path) {
  auto bytes = qrdrop::test::read_file(path);
  if(bytes.size() < 22) throw std::runtime_error("archive too small");
  std::size_t eocd = bytes.size() - 22;
  while(le32(bytes, eocd) != 0x06054b50) {
    if(eocd == 0) throw std::runtime_error("no end of central directory");
    --eocd;
  }
  uint16_t count = le16(bytes, eocd + 10);
  std::size_t pos = le32(bytes, eocd + 16);

  std::map<std::string, std::string> entries;
  for(uint16_t i = 0; i < count; ++i) {
    if(le32(bytes, pos) != 0x02014b50) throw std::runtime_error("bad central header");
    uint16_t method = le16(bytes, pos + 10);
    uint32_t crc = le32(bytes, pos + 16);
    uint32_t csize = le32(bytes, pos + 20);
    uint32_t usize = le32(bytes, pos + 24);
    uint16_t name_len = le16(bytes, pos + 28);
    uint16_t extra_len = le16(bytes, pos + 30);
    uint16_t comment_len = le16(bytes, pos + 32);
    uint32_t local = le32(bytes, pos + 42);
    std::string name = bytes.substr(pos + 46, name_len);
    pos += 46 + name_len + extra_len + comment_len;

    if(le32(bytes, local) != 0x04034b50) throw std::runtime_error("bad local header");
    if(le32(bytes, local + 14) != crc || le32(bytes, local + 18) != csize) {
      throw std::runtime_error("local header not patched for " + name);
    }
    std::size_t data_at = local + 30 + le16(bytes, local + 26) + le16(bytes, local + 28);
    std::string raw = bytes.substr(data_at, csize);
    std::string content = (method == 8 && usize > 0) ? inflate_raw(raw, usize) : raw;
    uLong actual = crc32(0L, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
    if(actual != crc) throw std::runtime_error("crc mismatch for " + name);
    entries[name] = content;
  }
  return entries;
}

bool test_zip_directory_contents(TestContext& ctx) {
  ScratchDir scratch("qrdrop_zip");
  std::string big;
  for(int i = 0; i < 200000; ++i) big += static_cast<char>('a' + (i * 7) % 26);
  scratch.write("src/readme.md", "# hi\n");
  scratch.write("src/data/big.txt", big);
  scratch.write("src/data/empty.bin", "");
  fs::create_directories(scratch.path() / "src/hollow");

  auto logger = std::make_shared<Logger>("zip");
  ctx.logs.attach(logger);
  auto archive = scratch.path() / "out.zip";
  auto written = zip_directory(scratch.path() / "src", archive, logger.get());

  auto entries = read_zip(archive);
  if(entries.size() != written) return false;
  return entries.count("data/") == 1 &&
         entries.count("hollow/") == 1 &&
         entries["readme.md"] == "# hi\n" &&
         entries["data/big.txt"] == big &&
         entries.count("data/empty.bin") == 1 && entries["data/empty.bin"].empty();
}

bool test_zip_directory_rejects_file(TestContext&) {
  ScratchDir scratch("qrdrop_zip_file");
  auto file = scratch.write("plain.txt", "x");
  try {
    zip_directory(file, scratch.path() / "out.zip");
    return false;
  } catch(const SourceNotFound&) {
    return true;
  }
}

bool test_command_line_settings(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse(std::vector<std::string>{
    "--port=8080", "-x", "--ttl", "5", "--share", "a.txt", "b dir", "--host", "127.0.0.1"}, settings);
  if(settings.get<int>("port") != 8080 || settings.get<int>("ttl_minutes") != 5) return false;
  if(!settings.get<bool>("exit_on_upload") || settings.get<std::string>("host") != "127.0.0.1") return false;
  if(settings.get<std::vector<std::string>>("share") != std::vector<std::string>{"a.txt", "b dir"}) return false;
  if(settings.get<std::string>("upload_dir") != "uploads") return false;

  SettingsManager bad;
  try {
    parser.parse(std::vector<std::string>{"--port", "many"}, bad);
    return false;
  } catch(const InvalidConfiguration&) {
  }
  try {
    parser.parse(std::vector<std::string>{"--no-such-option"}, bad);
    return false;
  } catch(const InvalidConfiguration&) {
  }
  SettingsManager dashed;
  parser.parse(std::vector<std::string>{"--exit-on-upload", "--ttl-minutes", "3"}, dashed);
  if(!dashed.get<bool>("exit_on_upload") || dashed.get<int>("ttl_minutes") != 3) return false;

  auto usage = parser.usage(settings);
  return usage.find("--exit-on-upload") != std::string::npos &&
         usage.find("--ttl-minutes") != std::string::npos &&
         usage.find("--exit_on_upload") == std::string::npos;
}

bool test_completion_hint_names_the_flag(TestContext&) {
  return completion_hint(false, false).find("--exit-on-upload") != std::string::npos &&
         completion_hint(true, false).find("download") != std::string::npos &&
         completion_hint(false, true) == "Will exit after the first completed upload";
}

bool test_config_file_is_overridden_by_arguments(TestContext&) {
  ScratchDir scratch("qrdrop_config");
  auto config = scratch.write("qrdrop.json",
    R"({"port": 9000, "ttl_minutes": 30, "share": ["from-config"], "upload-dir": "inbox"})");

  SettingsManager settings;
  CommandLineParser parser;
  parser.parse(std::vector<std::string>{"--config", config.string(), "--port", "9001"}, settings);
  return settings.get<int>("port") == 9001 &&
         settings.get<int>("ttl_minutes") == 30 &&
         settings.get<std::string>("upload_dir") == "inbox" &&
         settings.get<std::vector<std::string>>("share") == std::vector<std::string>{"from-config"};
}

bool test_formatting_helpers(TestContext&) {
  auto t = std::chrono::system_clock::from_time_t(1700000000);
  return iso8601_utc(t) == "2023-11-14T22:13:20+00:00" &&
         compact_utc_timestamp(t) == "20231114T221320" &&
         human_size(512) == "512.0 B" &&
         human_size(1536) == "1.5 KB" &&
         html_escape("<a href=\"x\">&'") == "&lt;a href=&quot;x&quot;&gt;&amp;&#x27;" &&
         base64url_from_bytes({0xfb, 0xff}) == "-_8" &&
         base64url_from_bytes({'f', 'o', 'o', 'b'}) == "Zm9vYg" &&
         base64url_from_bytes({}).empty();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"token_expiry_boundary", test_token_expiry_boundary},
    {"token_uniqueness", test_token_uniqueness},
    {"token_rejects_nonpositive_ttl", test_token_rejects_nonpositive_ttl},
    {"sanitize_filename", test_sanitize_filename},
    {"registry_order_and_archives", test_registry_order_and_archives},
    {"registry_missing_path_is_all_or_nothing", test_registry_missing_path_is_all_or_nothing},
    {"registry_duplicate_directory_names", test_registry_duplicate_directory_names},
    {"registry_rejects_special_files", test_registry_rejects_special_files},
    {"completion_fires_once", test_completion_fires_once},
    {"completion_without_exit_keeps_serving", test_completion_without_exit_keeps_serving},
    {"session_authorize", test_session_authorize},
    {"zip_directory_contents", test_zip_directory_contents},
    {"zip_directory_rejects_file", test_zip_directory_rejects_file},
    {"command_line_settings", test_command_line_settings},
    {"completion_hint_names_the_flag", test_completion_hint_names_the_flag},
    {"config_file_is_overridden_by_arguments", test_config_file_is_overridden_by_arguments},
    {"formatting_helpers", test_formatting_helpers},
  };
  return qrdrop::test::run_tests("core", tests, argc, argv);
}

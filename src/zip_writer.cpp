#include "zip_writer.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <zlib.h>
#include <sys/stat.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <limits>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint16_t kVersionNeeded = 20;
constexpr uint16_t kVersionMadeBy = (3 << 8) | 20; // unix, 2.0
constexpr uint16_t kFlagUtf8Names = 0x0800;
constexpr uint16_t kMethodStore = 0;
constexpr uint16_t kMethodDeflate = 8;
constexpr uint32_t kDosDirectoryAttr = 0x10;

void put16(std::string& buf, uint16_t v){
  buf.push_back(static_cast<char>(v & 0xFF));
  buf.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string& buf, uint32_t v){
  for(int i = 0; i < 4; ++i) buf.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void to_dos_datetime(std::time_t t, uint16_t& dos_time, uint16_t& dos_date){
  std::tm tm{};
  localtime_r(&t, &tm);
  if(tm.tm_year < 80){
    dos_time = 0;
    dos_date = (1 << 5) | 1; // 1980-01-01
    return;
  }
  dos_time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
  dos_date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

} // namespace

ZipWriter::ZipWriter(const fs::path& archive_path)
: path_(archive_path)
{
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if(!out_) throw IOFailure("cannot create archive " + path_.string());
}

ZipWriter::~ZipWriter(){
  if(out_.is_open()) out_.close();
}

void ZipWriter::check_stream(const char* action) const {
  if(!out_) throw IOFailure(std::string("failed to ") + action + " " + path_.string());
}

void ZipWriter::require_32bit(uint64_t value, const char* what) const {
  if(value >= std::numeric_limits<uint32_t>::max()){
    throw IOFailure(std::string("archive ") + path_.string() + ": " + what +
                    " exceeds the 4 GiB zip limit");
  }
}

void ZipWriter::write_local_header(const Entry& e){
  std::string buf;
  put32(buf, kLocalHeaderSig);
  put16(buf, kVersionNeeded);
  put16(buf, kFlagUtf8Names);
  put16(buf, e.method);
  put16(buf, e.dos_time);
  put16(buf, e.dos_date);
  put32(buf, e.crc);
  put32(buf, static_cast<uint32_t>(e.compressed_size));
  put32(buf, static_cast<uint32_t>(e.uncompressed_size));
  put16(buf, static_cast<uint16_t>(e.name.size()));
  put16(buf, 0);
  buf += e.name;
  out_.write(buf.data(), static_cast<std::streamsize>(buf.size()));
  check_stream("write");
}

void ZipWriter::patch_local_header(const Entry& e){
  auto resume = out_.tellp();
  std::string buf;
  put32(buf, e.crc);
  put32(buf, static_cast<uint32_t>(e.compressed_size));
  put32(buf, static_cast<uint32_t>(e.uncompressed_size));
  out_.seekp(static_cast<std::streamoff>(e.header_offset + 14));
  out_.write(buf.data(), static_cast<std::streamsize>(buf.size()));
  out_.seekp(resume);
  check_stream("patch");
}

void ZipWriter::add_directory(const std::string& entry_name, uint32_t unix_mode){
  if(finished_) throw IOFailure("archive already finished: " + path_.string());
  Entry e;
  e.name = entry_name;
  if(e.name.empty() || e.name.back() != '/') e.name.push_back('/');
  e.method = kMethodStore;
  to_dos_datetime(std::time(nullptr), e.dos_time, e.dos_date);
  e.external_attr = ((S_IFDIR | (unix_mode & 07777)) << 16) | kDosDirectoryAttr;
  e.header_offset = static_cast<uint64_t>(out_.tellp());
  require_32bit(e.header_offset, "offset");
  write_local_header(e);
  entries_.push_back(std::move(e));
}

void ZipWriter::add_file(const fs::path& source, const std::string& entry_name){
  if(finished_) throw IOFailure("archive already finished: " + path_.string());

  struct stat st{};
  if(::stat(source.c_str(), &st) != 0){
    throw IOFailure("cannot stat " + source.string());
  }
  std::ifstream in(source, std::ios::binary);
  if(!in) throw IOFailure("cannot open " + source.string());

  Entry e;
  e.name = entry_name;
  e.method = kMethodDeflate;
  to_dos_datetime(st.st_mtime, e.dos_time, e.dos_date);
  e.external_attr = (static_cast<uint32_t>(S_IFREG | (st.st_mode & 07777))) << 16;
  e.header_offset = static_cast<uint64_t>(out_.tellp());
  require_32bit(e.header_offset, "offset");
  write_local_header(e);

  z_stream zs{};
  if(deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK){
    throw IOFailure("deflateInit2 failed for " + source.string());
  }

  std::vector<char> input(kReadChunk);
  std::vector<unsigned char> output(kReadChunk);
  uLong crc = crc32(0L, Z_NULL, 0);
  int flush = Z_NO_FLUSH;
  try {
    do {
      in.read(input.data(), static_cast<std::streamsize>(input.size()));
      std::streamsize got = in.gcount();
      if(in.bad()) throw IOFailure("read failed for " + source.string());
      flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

      auto* bytes = reinterpret_cast<unsigned char*>(input.data());
      crc = crc32(crc, bytes, static_cast<uInt>(got));
      e.uncompressed_size += static_cast<uint64_t>(got);
      zs.next_in = bytes;
      zs.avail_in = static_cast<uInt>(got);

      do {
        zs.next_out = output.data();
        zs.avail_out = static_cast<uInt>(output.size());
        int rc = deflate(&zs, flush);
        if(rc == Z_STREAM_ERROR) throw IOFailure("deflate failed for " + source.string());
        std::size_t produced = output.size() - zs.avail_out;
        out_.write(reinterpret_cast<const char*>(output.data()), static_cast<std::streamsize>(produced));
        check_stream("write");
        e.compressed_size += produced;
      } while(zs.avail_out == 0);
    } while(flush != Z_FINISH);
  } catch(...) {
    deflateEnd(&zs);
    throw;
  }
  deflateEnd(&zs);

  require_32bit(e.uncompressed_size, "entry size");
  require_32bit(e.compressed_size, "compressed entry size");
  e.crc = static_cast<uint32_t>(crc);
  patch_local_header(e);
  entries_.push_back(std::move(e));
}

void ZipWriter::write_central_directory(){
  auto cd_offset = static_cast<uint64_t>(out_.tellp());
  require_32bit(cd_offset, "central directory offset");
  if(entries_.size() >= std::numeric_limits<uint16_t>::max()){
    throw IOFailure("archive " + path_.string() + " has too many entries");
  }

  std::string buf;
  for(const auto& e : entries_){
    put32(buf, kCentralHeaderSig);
    put16(buf, kVersionMadeBy);
    put16(buf, kVersionNeeded);
    put16(buf, kFlagUtf8Names);
    put16(buf, e.method);
    put16(buf, e.dos_time);
    put16(buf, e.dos_date);
    put32(buf, e.crc);
    put32(buf, static_cast<uint32_t>(e.compressed_size));
    put32(buf, static_cast<uint32_t>(e.uncompressed_size));
    put16(buf, static_cast<uint16_t>(e.name.size()));
    put16(buf, 0); // extra
    put16(buf, 0); // comment
    put16(buf, 0); // disk
    put16(buf, 0); // internal attrs
    put32(buf, e.external_attr);
    put32(buf, static_cast<uint32_t>(e.header_offset));
    buf += e.name;
  }
  uint64_t cd_size = buf.size();
  require_32bit(cd_size, "central directory size");

  put32(buf, kEndOfCentralDirSig);
  put16(buf, 0);
  put16(buf, 0);
  put16(buf, static_cast<uint16_t>(entries_.size()));
  put16(buf, static_cast<uint16_t>(entries_.size()));
  put32(buf, static_cast<uint32_t>(cd_size));
  put32(buf, static_cast<uint32_t>(cd_offset));
  put16(buf, 0);

  out_.write(buf.data(), static_cast<std::streamsize>(buf.size()));
  check_stream("write");
}

void ZipWriter::finish(){
  if(finished_) return;
  write_central_directory();
  out_.flush();
  check_stream("flush");
  out_.close();
  finished_ = true;
}

std::size_t zip_directory(const fs::path& dir,
                          const fs::path& archive_path,
                          Logger* logger){
  std::error_code ec;
  if(!fs::is_directory(dir, ec)){
    throw SourceNotFound("not a directory: " + dir.string());
  }

  ZipWriter writer(archive_path);

  // depth-first, children sorted so archives are reproducible
  std::vector<fs::path> pending{dir};
  while(!pending.empty()){
    fs::path current = pending.back();
    pending.pop_back();

    std::vector<fs::directory_entry> children;
    fs::directory_iterator it(current, ec);
    if(ec) throw IOFailure("cannot list " + current.string() + ": " + ec.message());
    for(const auto& entry : it) children.push_back(entry);
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b){
                return a.path().filename() < b.path().filename();
              });

    std::vector<fs::path> subdirs;
    for(const auto& child : children){
      auto rel = child.path().lexically_relative(dir).generic_string();
      if(child.is_symlink(ec) && child.is_directory(ec)){
        if(logger) logger->debug("zip: skipping directory symlink {}", child.path().string());
        continue;
      }
      if(child.is_directory(ec)){
        writer.add_directory(rel);
        subdirs.push_back(child.path());
      } else if(child.is_regular_file(ec)){
        writer.add_file(child.path(), rel);
      } else if(logger){
        logger->debug("zip: skipping special file {}", child.path().string());
      }
    }
    // reverse so the first subdirectory is visited next
    pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
  }

  writer.finish();
  if(logger) logger->debug("zip: wrote {} entries to {}", writer.entry_count(), archive_path.string());
  return writer.entry_count();
}

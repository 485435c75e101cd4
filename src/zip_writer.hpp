#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

class Logger;

// Streaming writer for a classic (non-zip64) zip archive. Files are stored
// with raw deflate; CRC and sizes are patched into the local header once the
// entry has been written. Throws IOFailure on any read/write/zlib error.
class ZipWriter {
public:
  static constexpr std::size_t kReadChunk = 64 * 1024;

  explicit ZipWriter(const std::filesystem::path& archive_path);
  ~ZipWriter();

  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  void add_file(const std::filesystem::path& source, const std::string& entry_name);
  // entry_name gets a trailing '/' if it lacks one
  void add_directory(const std::string& entry_name, uint32_t unix_mode = 0755);
  void finish();

  std::size_t entry_count() const { return entries_.size(); }
  const std::filesystem::path& path() const { return path_; }

private:
  struct Entry {
    std::string name;
    uint16_t method = 0;
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;
    uint32_t crc = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint32_t external_attr = 0;
    uint64_t header_offset = 0;
  };

  void write_local_header(const Entry& e);
  void patch_local_header(const Entry& e);
  void write_central_directory();
  void require_32bit(uint64_t value, const char* what) const;
  void check_stream(const char* action) const;

  std::filesystem::path path_;
  std::ofstream out_;
  std::vector<Entry> entries_;
  bool finished_ = false;
};

// Archives the full recursive contents of dir into archive_path, entries
// relative to dir. Returns the number of entries written.
std::size_t zip_directory(const std::filesystem::path& dir,
                          const std::filesystem::path& archive_path,
                          Logger* logger = nullptr);

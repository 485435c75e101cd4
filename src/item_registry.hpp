#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class Logger;

struct RegistryItem {
  std::size_t id = 0;
  std::string display_name;
  std::filesystem::path source_path; // absolute
  bool is_temporary = false;         // generated zip archive
  std::optional<uint64_t> size_bytes;
};

struct RegistryItemSummary {
  std::size_t id = 0;
  std::string display_name;
  std::optional<uint64_t> size_bytes;
};

// Ordered, read-only set of shareable entries. build() is all-or-nothing and
// runs once before serving; afterwards concurrent get()/list() need no lock.
class ItemRegistry {
public:
  explicit ItemRegistry(std::shared_ptr<Logger> logger = nullptr);
  ~ItemRegistry();

  ItemRegistry(const ItemRegistry&) = delete;
  ItemRegistry& operator=(const ItemRegistry&) = delete;

  // Throws SourceNotFound if any path is missing, InvalidConfiguration for a
  // path that is neither a regular file nor a directory or when called twice,
  // IOFailure if an archive cannot be written. The registry is left empty on
  // failure.
  void build(const std::vector<std::string>& paths);

  // Throws ItemNotFound.
  const RegistryItem& get(std::size_t id) const;
  std::vector<RegistryItemSummary> list() const;

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const std::filesystem::path& temp_dir() const { return temp_dir_; }

private:
  static std::filesystem::path make_temp_dir();
  void remove_temp_dir(const std::filesystem::path& dir) const;

  std::shared_ptr<Logger> logger_;
  std::vector<RegistryItem> items_;
  std::filesystem::path temp_dir_;
  bool built_ = false;
};

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace sqlscope::server {

// Detects on-disk changes of a database file (and its -wal companion) by comparing
// size and modification time between polls.
class change_monitor {
 public:
  explicit change_monitor(std::string db_path);

  // True when anything differs from the previous poll (or the construction snapshot).
  bool poll();

  const std::string& path() const { return db_path_; }

 private:
  struct stamp {
    bool exists{false};
    std::uintmax_t size{0};
    std::filesystem::file_time_type mtime{};
    bool operator==(const stamp& o) const { return exists == o.exists && size == o.size && mtime == o.mtime; }
    bool operator!=(const stamp& o) const { return !(*this == o); }
  };
  static stamp observe(const std::filesystem::path& p);

  std::string db_path_;
  stamp db_stamp_;
  stamp wal_stamp_;
};

}

#include "change_monitor.h"

namespace fs = std::filesystem;

namespace sqlscope::server {

change_monitor::change_monitor(std::string db_path)
    : db_path_(std::move(db_path)),
      db_stamp_(observe(db_path_)),
      wal_stamp_(observe(db_path_ + "-wal")) {}

change_monitor::stamp change_monitor::observe(const fs::path& p) {
  stamp s;
  std::error_code ec;
  if (!fs::exists(p, ec) || ec) return s;
  s.exists = true;
  s.size = fs::file_size(p, ec);
  if (ec) s.size = 0;
  s.mtime = fs::last_write_time(p, ec);
  if (ec) s.mtime = fs::file_time_type{};
  return s;
}

bool change_monitor::poll() {
  stamp db_now = observe(db_path_);
  stamp wal_now = observe(db_path_ + "-wal");
  bool changed = db_now != db_stamp_ || wal_now != wal_stamp_;
  db_stamp_ = db_now;
  wal_stamp_ = wal_now;
  return changed;
}

}

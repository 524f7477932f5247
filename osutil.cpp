#include "osutil.hpp"

#include <cerrno>

#include <sys/stat.h>
#include <sys/types.h>
#include <utime.h>

#include <gflags/gflags.h>
namespace gflags {
}

DEFINE_string(cache_dir, "", "directory for the cached TLD tables");

#include <glog/logging.h>

namespace osutil {

fs::path get_cache_dir()
{
  if (!FLAGS_cache_dir.empty()) {
    return FLAGS_cache_dir;
  }

  // $TMPDIR, or /tmp
  error_code ec;
  auto const tmp{fs::temp_directory_path(ec)};
  if (ec) {
    LOG(WARNING) << "no temp directory: " << ec.message();
    return "/tmp";
  }
  return tmp;
}

// File times through stat(2) rather than fs::last_write_time(), whose
// clock is not system_clock until C++20 library support settles.

std::optional<std::time_t> get_mtime(fs::path const& path)
{
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    if (errno != ENOENT) {
      PLOG(WARNING) << "stat " << path;
    }
    return {};
  }
  return st.st_mtime;
}

bool set_mtime(fs::path const& path, std::time_t when)
{
  utimbuf times{};
  times.actime  = when;
  times.modtime = when;
  if (utime(path.c_str(), &times) != 0) {
    PLOG(WARNING) << "utime " << path;
    return false;
  }
  return true;
}

} // namespace osutil

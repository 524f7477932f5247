#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <ctime>
#include <optional>

#include "fs.hpp"

namespace osutil {
fs::path                   get_cache_dir();
std::optional<std::time_t> get_mtime(fs::path const& path);
bool                       set_mtime(fs::path const& path, std::time_t when);
} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED

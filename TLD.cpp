#include "TLD.hpp"

#include "osutil.hpp"

#include <atomic>
#include <exception>
#include <fstream>
#include <sstream>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Config {
constexpr char two_level_url[]   = "http://www.surbl.org/tld/two-level-tlds";
constexpr char three_level_url[] = "http://www.surbl.org/tld/three-level-tlds";

constexpr char two_level_fn[]   = "tlds.2";
constexpr char three_level_fn[] = "tlds.3";

constexpr auto max_age{std::chrono::hours(24)};
} // namespace Config

TLD::options TLD::default_options()
{
  return options{
      osutil::get_cache_dir(),
      Config::two_level_url,
      Config::three_level_url,
      Config::max_age,
  };
}

TLD::TLD(HTTP::Fetch& fetch)
  : TLD(fetch, default_options())
{
}

TLD::TLD(HTTP::Fetch& fetch, options opts)
  : fetch_(fetch)
  , opts_(std::move(opts))
{
  error_code ec;
  fs::create_directories(opts_.cache_dir, ec);
  if (ec || !fs::is_directory(opts_.cache_dir, ec)) {
    throw config_error(fmt::format("invalid cache directory {}: {}",
                                   opts_.cache_dir.string(),
                                   ec ? ec.message() : "not a directory"));
  }

  two_.level   = 2;
  two_.url     = opts_.two_level_url;
  two_.path    = opts_.cache_dir / Config::two_level_fn;
  three_.level = 3;
  three_.url   = opts_.three_level_url;
  three_.path  = opts_.cache_dir / Config::three_level_fn;
}

TLD::level_tables& TLD::level_(int level)
{
  switch (level) {
  case 2: return two_;
  case 3: return three_;
  }
  throw std::invalid_argument(fmt::format("no TLD table for level {}", level));
}

TLD::level_tables const& TLD::level_(int level) const
{
  return const_cast<TLD*>(this)->level_(level);
}

fs::path const& TLD::cache_path(int level) const { return level_(level).path; }

std::shared_ptr<TLD::table const> TLD::table_for(int level) const
{
  auto tbl = level_(level).tbl.load();
  if (!tbl) {
    throw not_loaded_error(
        fmt::format("level {} TLD table not loaded", level));
  }
  return tbl;
}

bool TLD::loaded() const
{
  return two_.tbl.load() && three_.tbl.load();
}

bool TLD::refresh()
{
  std::lock_guard<std::mutex> lock(refresh_mutex_);

  auto const now{std::time(nullptr)};

  // Both tables are refreshed even if the first one throws.
  auto reloaded{false};
  std::exception_ptr first_error;

  for (auto lvl : {&two_, &three_}) {
    try {
      if (refresh_(*lvl, now))
        reloaded = true;
    }
    catch (io_error const& e) {
      LOG(ERROR) << e.what();
      if (!first_error)
        first_error = std::current_exception();
    }
  }

  if (first_error)
    std::rethrow_exception(first_error);

  return reloaded;
}

bool TLD::refresh_(level_tables& lvl, std::time_t now)
{
  auto const have{lvl.tbl.load() != nullptr};
  auto const mtime{osutil::get_mtime(lvl.path)};
  auto const stale{!mtime || (*mtime + opts_.max_age.count() < now)};

  if (!stale) {
    if (have)
      return false;
    load_cache_(lvl);
    return true;
  }

  std::string body;
  switch (fetch_.get(lvl.url, mtime, body)) {
  case HTTP::status::ok:
    store_(lvl, body);
    return true;

  case HTTP::status::not_modified:
    // Restart the clock so we don't ask again until max_age passes.
    osutil::set_mtime(lvl.path, now);
    if (have)
      return false;
    load_cache_(lvl);
    return true;

  case HTTP::status::failed: break;
  }

  if (!mtime) {
    if (have) {
      LOG(WARNING) << "unable to fetch " << lvl.url
                   << ", keeping the table in memory";
      return false;
    }
    throw io_error(fmt::format("unable to fetch {} and no cache file {}",
                               lvl.url, lvl.path.string()));
  }

  LOG(WARNING) << "unable to fetch " << lvl.url << ", using stale "
               << lvl.path;
  if (have)
    return false;
  load_cache_(lvl);
  return true;
}

void TLD::load_cache_(level_tables& lvl)
{
  std::ifstream is(lvl.path);
  if (!is.is_open()) {
    throw io_error(fmt::format("unable to open {}", lvl.path.string()));
  }

  auto tbl{parse(is)};
  if (is.bad()) {
    throw io_error(fmt::format("error reading {}", lvl.path.string()));
  }

  publish_(lvl, std::move(tbl), lvl.path.string());
}

// Write to a temporary in the same directory, then rename over the
// cache file, so a reader of the cache never sees a short file.
void TLD::store_(level_tables& lvl, std::string const& body)
{
  auto tmp{lvl.path};
  tmp += ".tmp";

  try {
    std::ofstream ofs;
    ofs.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    ofs.open(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
    ofs.write(body.data(), body.size());
    ofs.close();

    fs::rename(tmp, lvl.path);
  }
  catch (std::system_error const& e) {
    LOG(ERROR) << "can't write " << lvl.path << ": " << e.what()
               << " code: " << e.code();
    error_code ec;
    fs::remove(tmp, ec);
  }

  std::istringstream is(body);
  publish_(lvl, parse(is), lvl.url);
}

void TLD::publish_(level_tables& lvl, table&& tbl, std::string const& from)
{
  LOG(INFO) << "Loaded " << tbl.size() << " TLDs from " << from;

  std::shared_ptr<table const> snapshot{
      std::make_shared<table>(std::move(tbl))};
  lvl.tbl.store(std::move(snapshot));
}

TLD::table TLD::parse(std::istream& is)
{
  table tbl;

  std::string line;
  while (std::getline(is, line)) {
    boost::algorithm::trim(line);
    if (line.empty())
      continue;
    boost::algorithm::to_lower(line);
    tbl.insert(line);
  }

  return tbl;
}

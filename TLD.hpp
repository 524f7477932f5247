#ifndef TLD_DOT_HPP
#define TLD_DOT_HPP

#include <chrono>
#include <ctime>
#include <istream>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "HTTP.hpp"
#include "fs.hpp"

// The two-level and three-level TLD tables published by SURBL: the
// multi-label public suffixes under which a registered domain has
// three (or four) labels.  <http://www.surbl.org/guidelines>
//
// Each table is an immutable snapshot; refresh() publishes a new one
// with an atomic pointer swap, so readers never lock and never see a
// partly loaded table.

class TLD {
public:
  using table = std::unordered_set<std::string>;

  // The cache directory can't be created.
  struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // A table was never loaded and neither cache nor remote has it.
  struct io_error : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // table_for() before the first successful refresh().
  struct not_loaded_error : std::logic_error {
    using std::logic_error::logic_error;
  };

  struct options {
    fs::path             cache_dir;
    std::string          two_level_url;
    std::string          three_level_url;
    std::chrono::seconds max_age;
  };

  static options default_options();

  TLD(TLD const&) = delete;
  TLD& operator=(TLD const&) = delete;

  explicit TLD(HTTP::Fetch& fetch);
  TLD(HTTP::Fetch& fetch, options opts);

  // True if either table was (re)loaded.
  bool refresh();

  std::shared_ptr<table const> table_for(int level) const;

  bool loaded() const;

  fs::path const& cache_path(int level) const;

  static table parse(std::istream& is);

private:
  struct level_tables {
    int                                       level{0};
    std::string                               url;
    fs::path                                  path;
    std::atomic<std::shared_ptr<table const>> tbl;
  };

  level_tables&       level_(int level);
  level_tables const& level_(int level) const;

  bool refresh_(level_tables& lvl, std::time_t now);
  void load_cache_(level_tables& lvl);
  void store_(level_tables& lvl, std::string const& body);
  void publish_(level_tables& lvl, table&& tbl, std::string const& from);

  HTTP::Fetch& fetch_;
  options      opts_;

  std::mutex refresh_mutex_;

  level_tables two_;
  level_tables three_;
};

#endif // TLD_DOT_HPP

#include "TLD.hpp"

#include "osutil.hpp"

#include <ctime>
#include <fstream>
#include <map>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
constexpr char two_url[]   = "http://tld.test/two-level-tlds";
constexpr char three_url[] = "http://tld.test/three-level-tlds";

class fake_fetch : public HTTP::Fetch {
public:
  HTTP::status get(std::string const&         url,
                   std::optional<std::time_t> if_modified_since,
                   std::string&               body) override
  {
    ++calls;
    last_ims = if_modified_since;
    if (st == HTTP::status::ok)
      body = bodies[url];
    return st;
  }

  HTTP::status                       st{HTTP::status::failed};
  std::map<std::string, std::string> bodies;
  int                                calls{0};
  std::optional<std::time_t>         last_ims;
};

TLD::options test_options(fs::path dir)
{
  return TLD::options{dir, two_url, three_url, std::chrono::hours(24)};
}

void make_stale(TLD const& tld, std::time_t when)
{
  CHECK(osutil::set_mtime(tld.cache_path(2), when));
  CHECK(osutil::set_mtime(tld.cache_path(3), when));
}
} // namespace

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const dir{fs::temp_directory_path()
                 / fmt::format("TLD-test-{}", getpid())};
  fs::remove_all(dir);

  fake_fetch fetch;

  // Nothing loaded yet.
  {
    TLD tld(fetch, test_options(dir));
    CHECK(fs::is_directory(dir));
    CHECK(!tld.loaded());

    auto threw{false};
    try {
      tld.table_for(2);
    }
    catch (TLD::not_loaded_error const& e) {
      threw = true;
    }
    CHECK(threw);

    threw = false;
    try {
      tld.table_for(4);
    }
    catch (std::invalid_argument const& e) {
      threw = true;
    }
    CHECK(threw);

    // No cache and no network.
    threw = false;
    try {
      tld.refresh();
    }
    catch (TLD::io_error const& e) {
      threw = true;
    }
    CHECK(threw);
    CHECK(!tld.loaded());
    CHECK_EQ(fetch.calls, 2);
    CHECK(!fetch.last_ims);
  }

  fetch.st               = HTTP::status::ok;
  fetch.bodies[two_url]  = "co.uk\r\nac.uk\nco.uk\n\n  COM.AR \n";
  fetch.bodies[three_url] = "blogspot.co.uk\n";
  fetch.calls            = 0;

  TLD tld(fetch, test_options(dir));

  // First load comes from the remote and is written to the cache.
  CHECK(tld.refresh());
  CHECK(tld.loaded());
  CHECK_EQ(fetch.calls, 2);
  CHECK(fs::exists(tld.cache_path(2)));
  CHECK(fs::exists(tld.cache_path(3)));
  CHECK_EQ(tld.cache_path(2).filename().string(), "tlds.2");
  CHECK_EQ(tld.cache_path(3).filename().string(), "tlds.3");

  auto const two{tld.table_for(2)};
  CHECK_EQ(two->size(), 3u);
  CHECK(two->count("co.uk"));
  CHECK(two->count("ac.uk"));
  CHECK(two->count("com.ar"));
  CHECK(!two->count("com"));
  CHECK_EQ(tld.table_for(3)->size(), 1u);
  CHECK(tld.table_for(3)->count("blogspot.co.uk"));

  // Fresh and loaded: nothing to do.
  CHECK(!tld.refresh());
  CHECK(!tld.refresh());
  CHECK_EQ(fetch.calls, 2);

  // A new instance loads from the fresh cache without the network.
  {
    fetch.st = HTTP::status::failed;
    TLD restarted(fetch, test_options(dir));
    CHECK(restarted.refresh());
    CHECK_EQ(fetch.calls, 2);
    CHECK_EQ(restarted.table_for(2)->size(), 3u);
    CHECK(!restarted.refresh());
  }

  auto const now{std::time(nullptr)};
  auto const yesterday{now - 25 * 60 * 60};

  // Stale, not modified: no reload, but the clock restarts.
  make_stale(tld, yesterday);
  fetch.st    = HTTP::status::not_modified;
  fetch.calls = 0;
  CHECK(!tld.refresh());
  CHECK_EQ(fetch.calls, 2);
  CHECK(fetch.last_ims);
  CHECK_EQ(*fetch.last_ims, yesterday);
  CHECK_GE(*osutil::get_mtime(tld.cache_path(2)), now);
  CHECK(!tld.refresh());
  CHECK_EQ(fetch.calls, 2);

  // Stale, network down: keep what we have, or load the stale cache.
  make_stale(tld, yesterday);
  fetch.st    = HTTP::status::failed;
  fetch.calls = 0;
  CHECK(!tld.refresh());
  CHECK_EQ(fetch.calls, 2);
  CHECK_EQ(tld.table_for(2)->size(), 3u);
  {
    TLD restarted(fetch, test_options(dir));
    CHECK(restarted.refresh());
    CHECK(restarted.table_for(2)->count("co.uk"));
  }

  // Stale, new content: both cache and memory replaced.  The snapshot
  // taken earlier is untouched.
  make_stale(tld, yesterday);
  fetch.st                = HTTP::status::ok;
  fetch.bodies[two_url]   = "co.uk\nco.jp\n";
  fetch.bodies[three_url] = "";
  CHECK(tld.refresh());
  CHECK_EQ(tld.table_for(2)->size(), 2u);
  CHECK(tld.table_for(2)->count("co.jp"));
  CHECK(tld.table_for(3)->empty());
  CHECK_EQ(two->size(), 3u);
  CHECK(two->count("com.ar"));

  {
    std::ifstream is(tld.cache_path(2));
    auto const cached{TLD::parse(is)};
    CHECK_EQ(cached.size(), 2u);
    CHECK(cached.count("co.jp"));
  }
  CHECK(!fs::exists(fs::path(tld.cache_path(2)) += ".tmp"));

  // The cache directory can't be a file.
  {
    auto const file{dir / "not-a-directory"};
    std::ofstream(file) << "x\n";
    auto threw{false};
    try {
      TLD bad(fetch, test_options(file));
    }
    catch (TLD::config_error const& e) {
      threw = true;
    }
    CHECK(threw);
  }

  fs::remove_all(dir);
}

#include "SURBL.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

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
    if (url == two_url)
      body = "co.uk\nac.uk\ncom.ar\n";
    else
      body = "blogspot.co.uk\n";
    return HTTP::status::ok;
  }
};

class fake_lookup : public DNS::Lookup {
public:
  DNS::answer forward(std::string const& name) override
  {
    queries.push_back(name);
    auto const it = answers.find(name);
    if (it != end(answers))
      return it->second;
    return DNS::answer{DNS::outcome::not_found, {}};
  }

  std::map<std::string, DNS::answer> answers;
  std::vector<std::string>           queries;
};

DNS::answer listed(char const* addr)
{
  return DNS::answer{DNS::outcome::found, {addr}};
}

template <typename F>
bool throws_malformed(F f)
{
  try {
    f();
  }
  catch (SURBL::malformed_input const& e) {
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const dir{fs::temp_directory_path()
                 / fmt::format("SURBL-test-{}", getpid())};
  fs::remove_all(dir);

  fake_fetch fetch;
  TLD        tld(fetch, TLD::options{dir, two_url, three_url,
                                     std::chrono::hours(24)});

  fake_lookup dns;
  SURBL       surbl(tld, dns);
  CHECK_EQ(surbl.zone(), "multi.surbl.org");

  // Addresses need no tables.
  {
    auto const res{surbl.lookup("1.2.3.4")};
    CHECK(!res.listed);
    CHECK_EQ(res.level, 4);
    CHECK_EQ(res.table_lookups, 0);
    CHECK_EQ(res.domain, "4.3.2.1");
    CHECK_EQ(res.query, "4.3.2.1.multi.surbl.org.");
  }

  // Names do.
  {
    auto threw{false};
    try {
      surbl.check("www.acme.com");
    }
    catch (TLD::not_loaded_error const& e) {
      threw = true;
    }
    CHECK(threw);
  }

  CHECK(tld.refresh());
  dns.queries.clear();

  // Plain .com domain, clean.
  {
    auto const res{surbl.lookup("www.acme.com")};
    CHECK(!res.listed);
    CHECK(res.queried);
    CHECK_EQ(res.level, 2);
    CHECK_EQ(res.table_lookups, 1);
    CHECK_EQ(res.domain, "acme.com");
    CHECK_EQ(res.query, "acme.com.multi.surbl.org.");
    CHECK_EQ(res.dns, DNS::outcome::not_found);
    CHECK_EQ(dns.queries.size(), 1u);
    CHECK_EQ(dns.queries.back(), "acme.com.multi.surbl.org.");
  }

  // …and listed.
  dns.answers["acme.com.multi.surbl.org."] = listed("127.0.0.2");
  CHECK(surbl.check("www.acme.com"));
  CHECK(surbl.check("acme.com"));
  CHECK(surbl.check("WWW.ACME.COM."));
  CHECK(surbl.check("deep.down.www.acme.com"));

  // Same answer every time.
  dns.queries.clear();
  CHECK_EQ(surbl.check("www.acme.com"), surbl.check("www.acme.com"));
  CHECK_EQ(dns.queries.size(), 2u);
  CHECK_EQ(dns.queries[0], dns.queries[1]);

  // Two-level TLD: one more label.
  {
    auto const res{surbl.lookup("www.example.co.uk")};
    CHECK(!res.listed);
    CHECK_EQ(res.level, 3);
    CHECK_EQ(res.table_lookups, 2);
    CHECK_EQ(res.domain, "example.co.uk");
    CHECK_EQ(res.query, "example.co.uk.multi.surbl.org.");
  }

  // Three-level TLD: two more.
  {
    auto const res{surbl.lookup("foo.bar.blogspot.co.uk")};
    CHECK_EQ(res.level, 4);
    CHECK_EQ(res.table_lookups, 2);
    CHECK_EQ(res.domain, "bar.blogspot.co.uk");
  }

  // A two-level TLD not followed by a three-level one stops at three.
  {
    auto const res{surbl.lookup("a.b.shop.ac.uk")};
    CHECK_EQ(res.level, 3);
    CHECK_EQ(res.domain, "shop.ac.uk");
  }

  // Bare public suffixes are never queried.
  dns.queries.clear();
  for (auto suffix : {"co.uk", "blogspot.co.uk", "com.ar."}) {
    auto const res{surbl.lookup(suffix)};
    CHECK(!res.listed) << suffix;
    CHECK(!res.queried) << suffix;
    CHECK(res.domain.empty()) << suffix;
  }
  CHECK(dns.queries.empty());

  // Fewer than two labels: local host, no query.
  for (auto local : {"localhost", "", ".", "com", "localhost."}) {
    CHECK(!surbl.check(local)) << local;
  }
  CHECK(dns.queries.empty());

  // IPv4 literal: reversed, all four octets.
  dns.answers["4.3.2.1.multi.surbl.org."] = listed("127.0.0.64");
  {
    auto const res{surbl.lookup("1.2.3.4")};
    CHECK(res.listed);
    CHECK_EQ(res.level, 4);
    CHECK_EQ(res.domain, "4.3.2.1");
  }
  CHECK(surbl.check("[1.2.3.4]"));
  CHECK(!surbl.check("4.3.2.1"));

  // IPv6 literal: error, no query.
  dns.queries.clear();
  CHECK(throws_malformed([&] { surbl.check("::1"); }));
  CHECK(throws_malformed([&] { surbl.check("2001:db8::8a2e:370:7334"); }));
  CHECK(throws_malformed([&] { surbl.check("[IPv6:2001:db8::1]"); }));
  CHECK(throws_malformed([&] { surbl.lookup("[::1]"); }));
  CHECK(dns.queries.empty());

  // Only 127/8 means listed.
  dns.answers["evil.com.multi.surbl.org."]
      = DNS::answer{DNS::outcome::found, {"10.0.0.2", "127.0.0.4"}};
  dns.answers["odd.com.multi.surbl.org."] = listed("192.0.2.1");
  CHECK(surbl.check("www.evil.com"));
  CHECK(!surbl.check("www.odd.com"));

  // Broken blacklist DNS fails open...
  dns.answers["broken.com.multi.surbl.org."]
      = DNS::answer{DNS::outcome::failed, {}};
  {
    auto const res{surbl.lookup("www.broken.com")};
    CHECK(!res.listed);
    CHECK(res.queried);
    CHECK_EQ(res.dns, DNS::outcome::failed);
  }

  // ...or closed, when strict.
  {
    SURBL strict(tld, dns, SURBL::options{"multi.surbl.org", true});
    CHECK(strict.check("www.broken.com"));
    CHECK(!strict.check("www.example.com"));
  }

  // Names no resolver would take are never sent, and fail like a broken
  // lookup: clean by default, listed when strict.
  {
    SURBL strict(tld, dns, SURBL::options{"multi.surbl.org", true});

    std::string const long_label(64, 'a');
    std::string const zone{std::string(60, 'z') + "." + std::string(60, 'z')
                           + "." + std::string(60, 'z') + ".test"};
    SURBL long_zone(tld, dns, SURBL::options{zone, false});

    dns.queries.clear();
    for (auto const& bad : {"www." + long_label + ".com",
                            std::string("www.ev\\il.com"),
                            std::string("www.ev il.com"),
                            std::string("www.evil\t.com")}) {
      auto const res{surbl.lookup(bad)};
      CHECK(!res.listed) << bad;
      CHECK(!res.queried) << bad;
      CHECK_EQ(res.dns, DNS::outcome::failed) << bad;
      CHECK(strict.check(bad)) << bad;
    }

    auto const over{"www." + std::string(63, 'b') + ".com"};
    auto const res{long_zone.lookup(over)};
    CHECK(!res.listed);
    CHECK(!res.queried);
    CHECK_GT(res.query.size(), 255u);
    CHECK(dns.queries.empty());

    // A 63-octet label is still fine.
    auto const ok{surbl.lookup("www." + std::string(63, 'c') + ".com")};
    CHECK(ok.queried);
    CHECK_EQ(dns.queries.size(), 1u);
  }

  // A trailing root dot doesn't turn an address into a name.
  {
    auto const res{surbl.lookup("1.2.3.4.")};
    CHECK(res.listed);
    CHECK_EQ(res.level, 4);
    CHECK_EQ(res.domain, "4.3.2.1");
    CHECK_EQ(res.query, "4.3.2.1.multi.surbl.org.");
  }

  // No zone at all is a configuration error.
  {
    auto threw{false};
    try {
      SURBL none(tld, dns, SURBL::options{"..", false});
    }
    catch (std::invalid_argument const& e) {
      threw = true;
    }
    CHECK(threw);
  }

  // Another zone, trailing dot or not.
  {
    SURBL other(tld, dns, SURBL::options{"black.uribl.test.", false});
    CHECK_EQ(other.zone(), "black.uribl.test");
    dns.queries.clear();
    CHECK(!other.check("www.acme.com"));
    CHECK_EQ(dns.queries.back(), "acme.com.black.uribl.test.");
  }

  fs::remove_all(dir);
}

#include "SURBL.hpp"

#include "IP.hpp"
#include "IP4.hpp"
#include "Labels.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include <boost/algorithm/string/join.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Config {
/*
From <http://www.surbl.org/lists#multi>

last octet indicates which lists it belongs to. The bit positions in
that last octet for membership in the different lists are:

  8 = listed on PH
 16 = listed on MW
 64 = listed on ABUSE
128 = listed on CR

Any answer in 127.0.0.0/8 means listed on at least one of them.
*/
constexpr char zone[] = "multi.surbl.org";

// Registered domains have two labels, three under a two-level TLD,
// four under a three-level TLD.  Reversed IPv4 addresses always four.
constexpr int min_level  = 2;
constexpr int addr_level = 4;

constexpr size_t max_label = 63;
constexpr size_t max_name  = 253; // 255 octets on the wire
} // namespace Config

SURBL::options SURBL::default_options()
{
  return options{Config::zone, false};
}

SURBL::SURBL(TLD const& tld, DNS::Lookup& dns)
  : SURBL(tld, dns, default_options())
{
}

SURBL::SURBL(TLD const& tld, DNS::Lookup& dns, options opts)
  : tld_(tld)
  , dns_(dns)
  , opts_(std::move(opts))
{
  while (!opts_.zone.empty() && opts_.zone.back() == '.')
    opts_.zone.pop_back();
  if (opts_.zone.empty())
    throw std::invalid_argument("no blacklist zone");
}

bool SURBL::check(std::string_view hostname) const
{
  return lookup(hostname).listed;
}

SURBL::result SURBL::lookup(std::string_view hostname) const
{
  result res;

  auto level{Config::min_level};
  std::vector<std::string> labels;

  // A fully qualified "1.2.3.4." is still an address.
  auto host{hostname};
  if (!host.empty() && host.back() == '.')
    host.remove_suffix(1);

  switch (IP::family_of(host)) {
  case IP::family::v4:
    // 1.2.3.4 is looked up as 4.3.2.1.<zone>
    labels = Labels::split(IP4::reverse(IP::as_address(host)));
    level  = Config::addr_level;
    break;

  case IP::family::v6:
    throw malformed_input(
        fmt::format("unsupported IPv6 address {}", hostname));

  case IP::family::none:
    VLOG(1) << hostname << " is not an address literal";
    labels = Labels::split(host);
    break;
  }

  VLOG(1) << "domain tokens: [" << boost::algorithm::join(labels, ", ")
          << "]";

  if (labels.size() < 2) {
    LOG(INFO) << "local host \"" << hostname << "\" not checked";
    return res;
  }

  std::shared_ptr<TLD::table const> two;
  std::shared_ptr<TLD::table const> three;
  if (level < Config::addr_level) {
    two   = tld_.table_for(2);
    three = tld_.table_for(3);
  }

  for (;;) {
    res.level = level;

    if (static_cast<size_t>(level) > labels.size()) {
      // Nothing left of the name but a public suffix.
      LOG(INFO) << hostname << " is a public suffix, not checked";
      return res;
    }

    auto dom{Labels::tail(labels, level)};

    if (level == 2) {
      ++res.table_lookups;
      if (two->count(dom)) {
        ++level;
        continue;
      }
    }
    else if (level == 3) {
      ++res.table_lookups;
      if (three->count(dom)) {
        ++level;
        continue;
      }
    }

    res.domain = std::move(dom);
    break;
  }

  query_(res);
  return res;
}

namespace {
// RFC 1035 section 2.3.4 sizes, and no octet the resolver's text form
// would read as an escape or a separator.
bool is_queryable(std::string_view name)
{
  if (!name.empty() && name.back() == '.')
    name.remove_suffix(1);
  if (name.empty() || name.size() > Config::max_name)
    return false;

  size_t label{0};
  for (auto ch : name) {
    auto const c{static_cast<unsigned char>(ch)};
    if (c <= ' ' || c == 0x7f || c == '\\')
      return false;
    if (c == '.') {
      if (label == 0)
        return false;
      label = 0;
    }
    else if (++label > Config::max_label) {
      return false;
    }
  }
  return label != 0;
}
} // namespace

void SURBL::query_(result& res) const
{
  res.query = fmt::format("{}.{}.", res.domain, opts_.zone);

  DNS::answer ans{DNS::outcome::failed, {}};
  if (is_queryable(res.query)) {
    LOG(INFO) << "checking SURBL (levels=" << res.level
              << "): " << res.domain;
    res.queried = true;
    ans         = dns_.forward(res.query);
  }
  else {
    LOG(WARNING) << "can't look up \"" << res.query << "\"";
  }
  res.dns = ans.result;

  switch (ans.result) {
  case DNS::outcome::found:
    if (std::any_of(begin(ans.addresses), end(ans.addresses),
                    [](auto const& addr) { return IP4::is_loopback(addr); })) {
      res.listed = true;
      LOG(INFO) << "SURBL checking (BANNED): " << res.domain;
      return;
    }
    LOG(WARNING) << res.query << " answered outside of "
                 << IP4::loopback_pfx << "0.0.0/8";
    break;

  case DNS::outcome::not_found: break;

  case DNS::outcome::failed:
    if (opts_.strict) {
      res.listed = true;
      LOG(WARNING) << "lookup of " << res.query
                   << " failed, treating as listed";
      return;
    }
    LOG(WARNING) << "lookup of " << res.query << " failed, treating as clean";
    break;
  }

  LOG(INFO) << "SURBL checking (CLEAN): " << res.domain;
}

#ifndef SURBL_DOT_HPP
#define SURBL_DOT_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include "DNS-lookup.hpp"
#include "TLD.hpp"

// Spam URI Realtime Blocklist client.
//
// <http://www.surbl.org/guidelines>
// <http://www.rfc-editor.org/rfc/rfc5782.txt> DNS Blacklists and Whitelists

class SURBL {
public:
  // IPv6 addresses can't be looked up on a URI list.
  struct malformed_input : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
  };

  struct options {
    std::string zone;
    bool        strict; // a failed lookup counts as listed
  };

  static options default_options();

  // What one check did, for logging and tests.
  struct result {
    bool         listed{false};
    bool         queried{false};
    int          level{0};
    int          table_lookups{0};
    std::string  domain; // the registered domain, or reversed address
    std::string  query;  // domain with the zone appended
    DNS::outcome dns{DNS::outcome::not_found};
  };

  SURBL(SURBL const&) = delete;
  SURBL& operator=(SURBL const&) = delete;

  SURBL(TLD const& tld, DNS::Lookup& dns);
  SURBL(TLD const& tld, DNS::Lookup& dns, options opts);

  bool   check(std::string_view hostname) const;
  result lookup(std::string_view hostname) const;

  std::string const& zone() const { return opts_.zone; }

private:
  void query_(result& res) const;

  TLD const&   tld_;
  DNS::Lookup& dns_;
  options      opts_;
};

#endif // SURBL_DOT_HPP

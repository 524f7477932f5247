#include "DNS-ldns.hpp"
#include "DNS-lookup.hpp"

#include "fs.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using DNS_ldns::Name;

  CHECK(Name("acme.com.multi.surbl.org.").valid());
  CHECK(Name("4.3.2.1.multi.surbl.org.").valid());
  CHECK(Name(std::string(63, 'a') + ".com.").valid());

  std::string const long_label{std::string(64, 'a') + ".com.multi.surbl.org."};
  CHECK(!Name(long_label).valid());
  CHECK(Name(long_label).error() != nullptr);

  std::string long_name;
  for (auto i = 0; i < 5; ++i)
    long_name += std::string(60, 'b') + ".";
  CHECK(!Name(long_name).valid());

  // Rejected before anything goes out, so this needs no network, only a
  // resolv.conf to build the resolver from.
  if (fs::exists("/etc/resolv.conf")) {
    DNS::ldns_lookup dns(std::chrono::milliseconds(100), 0);
    CHECK_EQ(dns.forward(long_label).result, DNS::outcome::failed);
    CHECK_EQ(dns.forward(long_name).result, DNS::outcome::failed);
  }
}

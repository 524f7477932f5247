#include <gflags/gflags.h>
namespace gflags {
}

DEFINE_uint64(connect_timeout, 30000, "TLD download connect timeout (ms)");
DEFINE_uint64(read_timeout, 60000, "TLD download read timeout (ms)");
DEFINE_uint64(dns_timeout, 5000, "DNS query timeout (ms)");
DEFINE_uint64(dns_retries, 2, "DNS query retries");
DEFINE_string(zone, "multi.surbl.org", "blacklist zone to query");
DEFINE_bool(strict, false, "count a failed blacklist lookup as listed");

#include "DNS-lookup.hpp"
#include "HTTP.hpp"
#include "SURBL.hpp"
#include "TLD.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetUsageMessage("[flags] hostname...");
    ParseCommandLineFlags(&argc, &argv, true);
  }

  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " [flags] hostname...\n";
    return 2;
  }

  HTTP::curl_fetch fetch;
  fetch.set_connect_timeout(std::chrono::milliseconds(FLAGS_connect_timeout))
      .set_read_timeout(std::chrono::milliseconds(FLAGS_read_timeout));

  DNS::ldns_lookup dns(std::chrono::milliseconds(FLAGS_dns_timeout),
                       static_cast<unsigned>(FLAGS_dns_retries));

  auto ret = 0;

  try {
    TLD tld(fetch);
    if (tld.refresh()) {
      LOG(INFO) << "TLD tables loaded";
    }

    auto opts{SURBL::default_options()};
    opts.zone   = FLAGS_zone;
    opts.strict = FLAGS_strict;
    SURBL surbl(tld, dns, opts);

    for (int i = 1; i < argc; ++i) {
      try {
        auto const res{surbl.lookup(argv[i])};
        if (res.listed) {
          std::cout << argv[i] << " spam (" << res.domain << ")\n";
          ret = std::max(ret, 1);
        }
        else {
          std::cout << argv[i] << " clean\n";
        }
      }
      catch (SURBL::malformed_input const& e) {
        std::cerr << argv[i] << ": " << e.what() << '\n';
        ret = 2;
      }
    }
  }
  catch (std::exception const& e) {
    LOG(ERROR) << e.what();
    std::cerr << argv[0] << ": " << e.what() << '\n';
    return 2;
  }

  return ret;
}

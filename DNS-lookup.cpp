#include "DNS-lookup.hpp"

#include "DNS-ldns.hpp"

#include <glog/logging.h>

namespace DNS {

ldns_lookup::ldns_lookup(std::chrono::milliseconds timeout, unsigned retries)
  : res_(std::make_unique<DNS_ldns::Resolver>(timeout, retries))
{
}

ldns_lookup::~ldns_lookup() = default;

answer ldns_lookup::forward(std::string const& name)
{
  answer ans;

  DNS_ldns::Name const dname(name);
  if (!dname.valid()) {
    LOG(WARNING) << "not a DNS name \"" << name << "\": " << dname.error();
    ans.result = outcome::failed;
    return ans;
  }

  std::lock_guard<std::mutex> lock(mtx_);

  DNS_ldns::A_query q(*res_, dname);

  if (q.failed())
    ans.result = outcome::failed;
  else if (q.nx_domain())
    ans.result = outcome::not_found;
  else {
    ans.addresses = q.addresses();
    ans.result = ans.addresses.empty() ? outcome::not_found : outcome::found;
  }

  VLOG(1) << name << " " << ans.result << " (" << ans.addresses.size()
          << " addresses)";

  return ans;
}

} // namespace DNS

#include "DNS-ldns.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <stdexcept>

#include <arpa/inet.h>
#include <sys/time.h>

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace DNS_ldns {

Name::Name(std::string const& text)
  : str_(text)
  , status_(ldns_str2rdf_dname(&rdf_, text.c_str()))
{
  if (status_ != LDNS_STATUS_OK)
    rdf_ = nullptr;
}

Name::~Name()
{
  if (rdf_)
    ldns_rdf_deep_free(rdf_);
}

char const* Name::error() const
{
  return ldns_get_errorstr_by_id(static_cast<ldns_status>(status_));
}

Resolver::Resolver(std::chrono::milliseconds timeout, unsigned retries)
{
  auto const status{ldns_resolver_new_frm_file(&res_, nullptr)};
  if (status != LDNS_STATUS_OK) {
    throw std::runtime_error(
        fmt::format("failed to initialize DNS resolver: {}",
                    ldns_get_errorstr_by_id(status)));
  }

  auto const secs{std::chrono::duration_cast<std::chrono::seconds>(timeout)};
  auto const usecs{
      std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs)};

  timeval tv{};
  tv.tv_sec  = secs.count();
  tv.tv_usec = usecs.count();
  ldns_resolver_set_timeout(res_, tv);

  ldns_resolver_set_retry(res_, static_cast<uint8_t>(std::min(retries, 255u)));
}

Resolver::~Resolver() { ldns_resolver_deep_free(res_); }

A_query::A_query(Resolver const& res, Name const& name)
{
  CHECK(name.valid()) << name.str();

  auto const status{ldns_resolver_query_status(&pkt_, res.get(), name.get(),
                                               LDNS_RR_TYPE_A,
                                               LDNS_RR_CLASS_IN, LDNS_RD)};
  if (status != LDNS_STATUS_OK) {
    failed_ = true;
    LOG(WARNING) << name.str()
                 << " A query failed: " << ldns_get_errorstr_by_id(status);

    // With a single nameserver a timeout marks it unreachable, and every
    // later query on this resolver would fail without trying.
    ldns_resolver_set_nameserver_rtt(res.get(), 0, LDNS_RESOLV_RTT_MIN);
  }

  if (!pkt_)
    return;

  auto const rcode{ldns_pkt_get_rcode(pkt_)};
  switch (rcode) {
  case LDNS_RCODE_NOERROR: break;

  case LDNS_RCODE_NXDOMAIN: nx_domain_ = true; break;

  default: {
    failed_ = true;
    std::unique_ptr<char, decltype(&std::free)> str{ldns_pkt_rcode2str(rcode),
                                                    &std::free};
    LOG(WARNING) << name.str() << " A query answered "
                 << (str ? str.get() : "?") << " (" << static_cast<int>(rcode)
                 << ")";
    break;
  }
  }
}

A_query::~A_query()
{
  if (pkt_)
    ldns_pkt_free(pkt_);
}

std::vector<std::string> A_query::addresses() const
{
  std::vector<std::string> ret;

  if (!pkt_ || failed_)
    return ret;

  auto const rrs{
      ldns_pkt_rr_list_by_type(pkt_, LDNS_RR_TYPE_A, LDNS_SECTION_ANSWER)};
  if (!rrs)
    return ret;

  for (size_t i = 0; i < ldns_rr_list_rr_count(rrs); ++i) {
    auto const rdf{ldns_rr_a_address(ldns_rr_list_rr(rrs, i))};
    if (!rdf || ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_A
        || ldns_rdf_size(rdf) != 4) {
      LOG(WARNING) << "malformed A record in answer";
      continue;
    }
    char str[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, ldns_rdf_data(rdf), str, sizeof str))
      ret.emplace_back(str);
  }

  ldns_rr_list_deep_free(rrs);
  return ret;
}

} // namespace DNS_ldns

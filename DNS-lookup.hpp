#ifndef DNS_LOOKUP_DOT_HPP
#define DNS_LOOKUP_DOT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace DNS_ldns {
class Resolver;
}

namespace DNS {

enum class outcome : int {
  found,     // one or more A records
  not_found, // NXDOMAIN, or no A records at the name
  failed,    // no usable answer: timeout, SERVFAIL, refused…
};

constexpr char const* outcome_c_str(outcome o)
{
  switch (o) { // clang-format off
  case outcome::found:     return "found";
  case outcome::not_found: return "not found";
  case outcome::failed:    return "failed";
  } // clang-format on
  return "*** unknown outcome ***";
}

inline std::ostream& operator<<(std::ostream& os, outcome o)
{
  return os << outcome_c_str(o);
}

struct answer {
  outcome                  result{outcome::not_found};
  std::vector<std::string> addresses;
};

// Forward (type A) lookup.
class Lookup {
public:
  virtual ~Lookup() = default;

  // A name that can't be put on the wire is a failed lookup, not an
  // exception.
  virtual answer forward(std::string const& name) = 0;
};

class ldns_lookup : public Lookup {
public:
  ldns_lookup(ldns_lookup const&) = delete;
  ldns_lookup& operator=(ldns_lookup const&) = delete;

  ldns_lookup(std::chrono::milliseconds timeout, unsigned retries);
  ~ldns_lookup() override;

  answer forward(std::string const& name) override;

private:
  std::mutex                          mtx_; // ldns_resolver is not reentrant
  std::unique_ptr<DNS_ldns::Resolver> res_;
};

} // namespace DNS

#endif // DNS_LOOKUP_DOT_HPP

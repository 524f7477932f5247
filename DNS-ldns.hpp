#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <chrono>
#include <string>
#include <vector>

// forward decl
typedef struct ldns_struct_pkt      ldns_pkt;
typedef struct ldns_struct_rdf      ldns_rdf;
typedef struct ldns_struct_resolver ldns_resolver;

namespace DNS_ldns {

// A domain name in wire form.  Text ldns can't encode (a label over 63
// octets, a name over 255, a bad escape) leaves it invalid, with the
// reason in error().
class Name {
public:
  Name(Name const&) = delete;
  Name& operator=(Name const&) = delete;

  explicit Name(std::string const& text);
  ~Name();

  bool        valid() const { return rdf_ != nullptr; }
  char const* error() const;

  std::string const& str() const { return str_; }
  ldns_rdf*          get() const { return rdf_; }

private:
  std::string str_;
  ldns_rdf*   rdf_{nullptr};
  int         status_;
};

// Nameservers come from /etc/resolv.conf; throws std::runtime_error if
// that can't be read.
class Resolver {
public:
  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  Resolver(std::chrono::milliseconds timeout, unsigned retries);
  ~Resolver();

  ldns_resolver* get() const { return res_; }

private:
  ldns_resolver* res_{nullptr};
};

// One IN A query, sent with recursion desired.
class A_query {
public:
  A_query(A_query const&) = delete;
  A_query& operator=(A_query const&) = delete;

  A_query(Resolver const& res, Name const& name);
  ~A_query();

  bool failed() const { return failed_; }
  bool nx_domain() const { return nx_domain_; }

  // Dotted quads from the answer section; CNAMEs on the way are skipped.
  std::vector<std::string> addresses() const;

private:
  ldns_pkt* pkt_{nullptr};

  bool failed_{false};
  bool nx_domain_{false};
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP

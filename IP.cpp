#include "IP.hpp"

#include "IP4.hpp"
#include "IP6.hpp"

namespace IP {
family family_of(std::string_view host)
{
  if (IP4::is_address(host))
    return family::v4;
  if (IP6::is_address(host) || IP6::is_address_literal(host))
    return family::v6;

  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    auto const inner = host.substr(1, host.size() - 2);
    if (IP4::is_address(inner))
      return family::v4;
    if (IP6::is_address(inner))
      return family::v6;
  }

  return family::none;
}

std::string_view as_address(std::string_view host)
{
  if (IP6::is_address_literal(host))
    return host.substr(IP6::lit_pfx.size(),
                       host.size() - IP6::lit_pfx.size() - IP6::lit_sfx.size());
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    return host.substr(1, host.size() - 2);
  return host;
}
} // namespace IP

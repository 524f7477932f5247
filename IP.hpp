#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include <ostream>
#include <string_view>

namespace IP {
enum class family : int { none, v4, v6 };

// Syntax only, nothing is resolved.  Accepts the bare address forms
// and the bracketed forms seen in URL authorities and SMTP literals.
family family_of(std::string_view host);

// Strip the brackets (and any "IPv6:" tag) from an address literal.
std::string_view as_address(std::string_view host);

constexpr char const* family_c_str(family fam)
{
  switch (fam) { // clang-format off
  case family::none: return "none";
  case family::v4:   return "IPv4";
  case family::v6:   return "IPv6";
  } // clang-format on
  return "*** unknown family ***";
}

inline std::ostream& operator<<(std::ostream& os, family fam)
{
  return os << family_c_str(fam);
}
} // namespace IP

#endif // IP_DOT_HPP

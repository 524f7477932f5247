#ifndef IP6_DOT_HPP
#define IP6_DOT_HPP

#include <string_view>

namespace IP6 {
using namespace std::literals::string_view_literals;

auto is_address(std::string_view addr) -> bool;
auto is_address_literal(std::string_view addr) -> bool;

auto constexpr lit_pfx{"[IPv6:"sv};
auto constexpr lit_sfx{"]"sv};
} // namespace IP6

#endif // IP6_DOT_HPP

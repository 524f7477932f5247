#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace IP4 {
auto is_address(std::string_view addr) -> bool;

// True for 127.0.0.0/8, the block DNS lists answer from (RFC 5782 2.1).
auto is_loopback(std::string_view addr) -> bool;

// "1.2.3.4" -> "4.3.2.1.", throws std::invalid_argument for anything
// that is not a dotted quad.
auto reverse(std::string_view addr) -> std::string;

constexpr char loopback_pfx[] = "127.";
} // namespace IP4

#endif // IP4_DOT_HPP

#include "IP4.hpp"

#include <array>
#include <charconv>
#include <optional>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::parse;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;

using tao::pegtl::abnf::DIGIT;

namespace IP4 {

namespace {
// One to three digits; the 0..255 range is checked as each octet is
// collected, so "001" is fine and "256" and "0001" are not.
struct octet : rep_min_max<1, 3, DIGIT> {
};

struct dotted_quad : seq<octet,
                         one<'.'>,
                         octet,
                         one<'.'>,
                         octet,
                         one<'.'>,
                         octet,
                         eof> {
};

struct octets {
  std::array<unsigned, 4> val{};
  size_t                  n{0};
  bool                    in_range{true};
};

template <typename Rule>
struct collect : nothing<Rule> {
};

template <>
struct collect<octet> {
  template <typename Input>
  static void apply(Input const& in, octets& o)
  {
    unsigned v{0};
    std::from_chars(in.begin(), in.end(), v);
    if (v > 255)
      o.in_range = false;
    if (o.n < o.val.size())
      o.val[o.n] = v;
    ++o.n;
  }
};

std::optional<octets> parse_quad(std::string_view addr)
{
  octets o;
  memory_input<> in{addr.data(), addr.size(), "ip4"};
  if (!parse<dotted_quad, collect>(in, o) || !o.in_range || o.n != 4)
    return {};
  return o;
}
} // namespace

auto is_address(std::string_view addr) -> bool
{
  return parse_quad(addr).has_value();
}

// Any 127/8 answer counts, the low octets carry list membership bits.
auto is_loopback(std::string_view addr) -> bool
{
  auto const o{parse_quad(addr)};
  return o && o->val[0] == 127;
}

auto reverse(std::string_view addr) -> std::string
{
  auto const o{parse_quad(addr)};
  if (!o)
    throw std::invalid_argument(fmt::format("not an IPv4 address: {}", addr));
  return fmt::format("{}.{}.{}.{}.", o->val[3], o->val[2], o->val[1],
                     o->val[0]);
}
} // namespace IP4

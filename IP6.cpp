#include "IP6.hpp"

#include "IP4.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::list;
using tao::pegtl::memory_input;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::parse;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::two;

using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;

namespace IP6 {

namespace {
// The shape is parsed here, and the group count is checked after: eight
// 16-bit pieces, or fewer with one "::", and an embedded dotted quad
// only in the last 32 bits.
struct h16 : rep_min_max<1, 4, HEXDIG> {
};

struct quad : seq<rep_min_max<1, 3, DIGIT>,
                  one<'.'>,
                  rep_min_max<1, 3, DIGIT>,
                  one<'.'>,
                  rep_min_max<1, 3, DIGIT>,
                  one<'.'>,
                  rep_min_max<1, 3, DIGIT>> {
};

struct piece : sor<quad, h16> {
};

struct dcolon : two<':'> {
};

struct address : seq<opt<list<piece, one<':'>>>,
                     opt<dcolon, opt<list<piece, one<':'>>>>,
                     eof> {
};

struct pieces {
  int  units{0};
  bool compressed{false};
  bool quad_seen{false};
  bool bad{false};
};

template <typename Rule>
struct count : nothing<Rule> {
};

template <>
struct count<h16> {
  template <typename Input>
  static void apply(Input const& in, pieces& p)
  {
    if (p.quad_seen)
      p.bad = true;
    p.units += 1;
  }
};

template <>
struct count<quad> {
  template <typename Input>
  static void apply(Input const& in, pieces& p)
  {
    if (p.quad_seen || !IP4::is_address(in.string()))
      p.bad = true;
    p.quad_seen = true;
    p.units += 2;
  }
};

template <>
struct count<dcolon> {
  template <typename Input>
  static void apply(Input const& in, pieces& p)
  {
    if (p.quad_seen)
      p.bad = true;
    p.compressed = true;
  }
};
} // namespace

bool is_address(std::string_view addr)
{
  pieces p;
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  if (!parse<address, count>(in, p) || p.bad)
    return false;
  return p.compressed ? p.units <= 7 : p.units == 8;
}

bool is_address_literal(std::string_view addr)
{
  if (addr.size() <= lit_pfx.size() + lit_sfx.size())
    return false;
  if (!boost::algorithm::istarts_with(addr, lit_pfx)
      || !boost::algorithm::ends_with(addr, lit_sfx))
    return false;
  return is_address(addr.substr(lit_pfx.size(), addr.size() - lit_pfx.size()
                                                    - lit_sfx.size()));
}
} // namespace IP6

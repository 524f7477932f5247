#include "IP6.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP6::is_address;
  using IP6::is_address_literal;

  CHECK(is_address("::1"));
  CHECK(is_address("::"));
  CHECK(is_address_literal("[IPv6:::1]"));

  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));

  CHECK(is_address("::ffff:0:0.0.0.0"));
  CHECK(is_address("::ffff:0:255.255.255.255"));

  CHECK(is_address("fd12:3456:789a:1::1"));
  CHECK(is_address("2001:db8::"));

  auto const addr{"2001:0db8:85a3:0000:0000:8a2e:0370:7334"};
  auto const addr_lit{"[IPv6:2001:0db8:85a3:0000:0000:8a2e:0370:7334]"};

  CHECK(is_address(addr));
  CHECK(is_address_literal(addr_lit));
  CHECK(!is_address(addr_lit));
  CHECK(!is_address_literal(addr));

  CHECK(!is_address(""));
  CHECK(!is_address("1.2.3.4"));
  CHECK(!is_address("www.acme.com"));
  CHECK(!is_address("12345::1"));
  CHECK(!is_address("1:2:3:4:5:6:7:8:9"));
  CHECK(!is_address_literal("[::1]"));

  CHECK(is_address("::1.2.3.4"));
  CHECK(is_address("1:2:3:4:5:6:7::"));
  CHECK(is_address("1:2:3:4:5:6:7:8"));
  CHECK(is_address_literal("[ipv6:fe80::1]"));

  CHECK(!is_address("1.2.3.4::"));
  CHECK(!is_address("::1.2.3.4:5"));
  CHECK(!is_address("::1.2.3.256"));
  CHECK(!is_address("1::2::3"));
  CHECK(!is_address(":1"));
  CHECK(!is_address("1:2:3:4:5:6:7"));
  CHECK(!is_address("1:2:3:4:5:6:7:8::"));
  CHECK(!is_address("1:2:3:4:5:6:7:1.2.3.4"));
}

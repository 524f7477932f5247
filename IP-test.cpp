#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP::as_address;
  using IP::family;
  using IP::family_of;

  CHECK_EQ(family_of("1.2.3.4"), family::v4);
  CHECK_EQ(family_of("[1.2.3.4]"), family::v4);

  CHECK_EQ(family_of("::1"), family::v6);
  CHECK_EQ(family_of("[::1]"), family::v6);
  CHECK_EQ(family_of("[IPv6:::1]"), family::v6);
  CHECK_EQ(family_of("2001:db8::8a2e:370:7334"), family::v6);

  CHECK_EQ(family_of("www.acme.com"), family::none);
  CHECK_EQ(family_of("localhost"), family::none);
  CHECK_EQ(family_of("1.2.3.4.example.com"), family::none);
  CHECK_EQ(family_of("[www.acme.com]"), family::none);
  CHECK_EQ(family_of(""), family::none);
  CHECK_EQ(family_of("[]"), family::none);

  CHECK_EQ(as_address("[1.2.3.4]"), "1.2.3.4");
  CHECK_EQ(as_address("[IPv6:::1]"), "::1");
  CHECK_EQ(as_address("[::1]"), "::1");
  CHECK_EQ(as_address("1.2.3.4"), "1.2.3.4");
}

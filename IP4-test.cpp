#include "IP4.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP4::is_address;
  using IP4::is_loopback;
  using IP4::reverse;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("160.0.0.0"));
  CHECK(is_address("250.0.0.0"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));
  CHECK(is_address("9.9.9.9"));
  CHECK(is_address("99.99.99.99"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address("www.acme.com"));
  CHECK(!is_address("1.2.3"));
  CHECK(!is_address("1.2.3.4.5"));
  CHECK(!is_address(""));

  // This is acceptable:
  CHECK(is_address("001.001.001.001"));
  // and this
  CHECK(is_address("01.01.01.01"));
  // but not:
  CHECK(!is_address("0001.0.0.0"));

  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("1.300.0.0"));
  CHECK(!is_address("1.1.1000.0"));
  CHECK(!is_address("1.1.1.256"));

  CHECK_EQ(reverse("1.2.3.4"), "4.3.2.1.");
  CHECK_EQ(reverse("192.168.0.10"), "10.0.168.192.");
  CHECK_EQ(reverse("001.002.003.004"), "4.3.2.1.");

  auto threw{false};
  try {
    reverse("www.acme.com");
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);

  CHECK(is_loopback("127.0.0.1"));
  CHECK(is_loopback("127.0.0.2"));
  CHECK(is_loopback("127.0.1.255"));
  CHECK(is_loopback("127.255.255.255"));

  CHECK(!is_loopback("126.0.0.2"));
  CHECK(!is_loopback("10.127.0.2"));
  CHECK(!is_loopback("1.2.3.4"));
  CHECK(!is_loopback("127.example.com"));
  CHECK(!is_loopback("::1"));
}

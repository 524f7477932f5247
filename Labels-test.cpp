#include "Labels.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using Labels::split;
  using Labels::tail;

  auto const www{split("www.acme.com")};
  CHECK_EQ(www.size(), 3u);
  CHECK_EQ(www[0], "www");
  CHECK_EQ(www[1], "acme");
  CHECK_EQ(www[2], "com");

  CHECK_EQ(tail(www, 1), "com");
  CHECK_EQ(tail(www, 2), "acme.com");
  CHECK_EQ(tail(www, 3), "www.acme.com");

  // Empty labels are dropped.
  CHECK_EQ(split("www.acme.com.").size(), 3u);
  CHECK_EQ(split(".www..acme.com").size(), 3u);
  CHECK_EQ(tail(split("www..acme.com."), 2), "acme.com");

  CHECK(split("").empty());
  CHECK(split("...").empty());
  CHECK_EQ(split("localhost").size(), 1u);

  // DNS is case-insensitive, the TLD tables are lower case.
  CHECK_EQ(tail(split("WWW.Example.CO.UK"), 3), "example.co.uk");
}

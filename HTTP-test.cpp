#include "HTTP.hpp"

#include "fs.hpp"

#include <fstream>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  HTTP::curl_fetch fetch;
  fetch.set_connect_timeout(std::chrono::seconds(2))
      .set_read_timeout(std::chrono::seconds(2));

  // Only http and https answers are trusted; a local file has no
  // response code to go by.
  auto const path{fs::temp_directory_path()
                  / fmt::format("HTTP-test-{}", getpid())};
  std::ofstream(path) << "co.uk\n";

  std::string body{"untouched"};
  CHECK_EQ(fetch.get("file://" + path.string(), {}, body),
           HTTP::status::failed);
  CHECK_EQ(fetch.get("file://" + path.string(), std::time_t{0}, body),
           HTTP::status::failed);
  CHECK_EQ(body, "untouched");

  fs::remove(path);

  // Nothing listens on port 1.
  CHECK_EQ(fetch.get("http://127.0.0.1:1/two-level-tlds", {}, body),
           HTTP::status::failed);
  CHECK_EQ(body, "untouched");
}

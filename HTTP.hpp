#ifndef HTTP_DOT_HPP
#define HTTP_DOT_HPP

#include <chrono>
#include <ctime>
#include <optional>
#include <ostream>
#include <string>

namespace HTTP {

enum class status : int {
  ok,           // 200, body filled in
  not_modified, // 304, cached copy is current
  failed,       // transport error or any other response code
};

constexpr char const* status_c_str(status s)
{
  switch (s) { // clang-format off
  case status::ok:           return "HTTP_OK";
  case status::not_modified: return "HTTP_NOT_MODIFIED";
  case status::failed:       return "failed";
  } // clang-format on
  return "*** unknown status ***";
}

inline std::ostream& operator<<(std::ostream& os, status s)
{
  return os << status_c_str(s);
}

// Conditional GET.
class Fetch {
public:
  virtual ~Fetch() = default;

  virtual status get(std::string const&         url,
                     std::optional<std::time_t> if_modified_since,
                     std::string&               body) = 0;
};

class curl_fetch : public Fetch {
public:
  curl_fetch(curl_fetch const&) = delete;
  curl_fetch& operator=(curl_fetch const&) = delete;

  curl_fetch();
  ~curl_fetch() override = default;

  curl_fetch& set_connect_timeout(std::chrono::milliseconds timeout)
  {
    connect_timeout_ = timeout;
    return *this;
  }

  // Abort when no data arrives for this long.
  curl_fetch& set_read_timeout(std::chrono::milliseconds timeout)
  {
    read_timeout_ = timeout;
    return *this;
  }

  status get(std::string const&         url,
             std::optional<std::time_t> if_modified_since,
             std::string&               body) override;

private:
  std::chrono::milliseconds connect_timeout_{std::chrono::seconds(30)};
  std::chrono::milliseconds read_timeout_{std::chrono::seconds(60)};
};

} // namespace HTTP

#endif // HTTP_DOT_HPP

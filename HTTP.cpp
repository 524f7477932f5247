#include "HTTP.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>

#include <curl/curl.h>

#include <glog/logging.h>

namespace {
struct curl_del {
  void operator()(CURL* x) const { curl_easy_cleanup(x); }
};

std::once_flag global_init;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  auto const body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}
} // namespace

namespace HTTP {

curl_fetch::curl_fetch()
{
  std::call_once(global_init, [] {
    auto const rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    CHECK_EQ(rc, CURLE_OK) << "curl_global_init: " << curl_easy_strerror(rc);
  });
}

status curl_fetch::get(std::string const&         url,
                       std::optional<std::time_t> if_modified_since,
                       std::string&               body)
{
  std::unique_ptr<CURL, curl_del> chp(curl_easy_init());
  if (!chp) {
    LOG(WARNING) << "curl_easy_init failed";
    return status::failed;
  }
  auto ch = chp.get();

  std::string data;

  auto const read_secs{std::max<long>(
      1, std::chrono::duration_cast<std::chrono::seconds>(read_timeout_)
             .count())};

  curl_easy_setopt(ch, CURLOPT_URL, url.c_str());
  curl_easy_setopt(ch, CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(ch, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(ch, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(ch, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(ch, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(ch, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(connect_timeout_.count()));
  curl_easy_setopt(ch, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(ch, CURLOPT_LOW_SPEED_TIME, read_secs);
  curl_easy_setopt(ch, CURLOPT_WRITEDATA, &data);
  curl_easy_setopt(ch, CURLOPT_WRITEFUNCTION, write_body);

  if (if_modified_since) {
    curl_easy_setopt(ch, CURLOPT_TIMECONDITION,
                     static_cast<long>(CURL_TIMECOND_IFMODSINCE));
    curl_easy_setopt(ch, CURLOPT_TIMEVALUE,
                     static_cast<long>(*if_modified_since));
  }

  auto const rc = curl_easy_perform(ch);
  if (rc != CURLE_OK) {
    LOG(WARNING) << url << ": " << curl_easy_strerror(rc);
    return status::failed;
  }

  long code = 0;
  if (auto const irc = curl_easy_getinfo(ch, CURLINFO_RESPONSE_CODE, &code);
      irc != CURLE_OK) {
    LOG(WARNING) << url << ": no response code: " << curl_easy_strerror(irc);
    return status::failed;
  }

  long unmet = 0;
  if (auto const irc = curl_easy_getinfo(ch, CURLINFO_CONDITION_UNMET, &unmet);
      irc != CURLE_OK) {
    LOG(WARNING) << url << ": no time condition result: "
                 << curl_easy_strerror(irc);
    return status::failed;
  }

  if (code == 304 || unmet) {
    LOG(INFO) << status::not_modified << ": " << url;
    return status::not_modified;
  }

  if (code == 200) {
    LOG(INFO) << status::ok << ": " << url;
    body = std::move(data);
    return status::ok;
  }

  LOG(WARNING) << url << ": unexpected response code " << code;
  return status::failed;
}

} // namespace HTTP

#include "plx_http_request.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {

  size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp)
  {
    size_t real_size = size * nmemb;
    plx_string* mem = static_cast<plx_string*>(userp);
    mem->append(static_cast<char*>(contents), real_size);
    return real_size;
  }

  // One header line per call, "Key: value\r\n"
  size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata)
  {
    size_t numbytes = size * nitems;
    plxv_map* headers = static_cast<plxv_map*>(userdata);
    plx_string header_line(buffer, numbytes);

    size_t colon_pos = header_line.find(":");
    if (colon_pos != plx_string::npos)
    {
      plx_string key = header_line.substr(0, colon_pos).trim().lower();
      plx_string value = header_line.substr(colon_pos + 1).trim();
      (*headers)[key] = value;
    }
    return numbytes;
  }

} // namespace

plx_http_request::plx_http_request()
  : url_(), method_("GET"), timeout_seconds_(0), status_code_(0) {}

plx_http_request::plx_http_request(const plx_string& url)
  : url_(url), method_("GET"), timeout_seconds_(0), status_code_(0) {}

void plx_http_request::set_url(const plx_string& url) { url_ = url; }
plx_string plx_http_request::get_url() const { return url_; }
void plx_http_request::set_method(const plx_string& method) { method_ = method; }
plx_string plx_http_request::get_method() const { return method_; }
void plx_http_request::set_header(const plx_string& key, const plx_string& value) { headers_[key] = value; }
plx_string plx_http_request::get_header(const plx_string& key) const
{
  auto it = headers_.find(key);
  return (it != headers_.end() && it->second.is_string()) ? it->second.string_value() : plx_string();
}
void plx_http_request::set_body(const plx_string& body) { body_ = body; }
plx_string plx_http_request::get_body() const { return body_; }
void plx_http_request::set_timeout_seconds(long seconds) { timeout_seconds_ = seconds; }

bool plx_http_request::ensure_global_init()
{
  static std::once_flag once;
  static CURLcode init_result = CURLE_FAILED_INIT;
  std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  return init_result == CURLE_OK;
}

bool plx_http_request::send()
{
  status_code_ = 0;
  response_body_.clear();
  response_headers_.clear();
  error_message_.clear();

  if (url_.empty())
  {
    error_message_ = "URL is empty.";
    return false;
  }

  if (!ensure_global_init())
  {
    error_message_ = "Failed to initialize libcurl.";
    return false;
  }

  auto curl_deleter = [](CURL* c) { if (c) curl_easy_cleanup(c); };
  auto slist_deleter = [](struct curl_slist* s) { if (s) curl_slist_free_all(s); };

  std::unique_ptr<CURL, decltype(curl_deleter)> curl(curl_easy_init(), curl_deleter);
  if (!curl)
  {
    error_message_ = "Failed to initialize libcurl.";
    return false;
  }

  std::unique_ptr<struct curl_slist, decltype(slist_deleter)> header_list(nullptr, slist_deleter);
  char errbuf[CURL_ERROR_SIZE] = {0};

  plx_string method_upper = method_.upper();

  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (timeout_seconds_ > 0)
  {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  }

  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body_);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers_);

  for (const auto& pair : headers_)
  {
    if (pair.second.is_string())
    {
      plx_string header_string = pair.first + ": " + pair.second.string_value();
      struct curl_slist* appended = curl_slist_append(header_list.get(), header_string.c_str());
      if (!appended)
      {
        error_message_ = "Failed to build request headers.";
        return false;
      }
      header_list.release();
      header_list.reset(appended);
    }
  }
  if (header_list)
  {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  }

  if (method_upper == "POST")
  {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body_.length()));
  }
  else if (method_upper == "PUT")
  {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body_.length()));
  }
  else if (method_upper != "GET")
  {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method_upper.c_str());
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK)
  {
    error_message_ = plx_string("libcurl error: ") + curl_easy_strerror(res) + " - " + errbuf;
    return false;
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  status_code_ = static_cast<int>(http_code);

  if (status_code_ < 200 || status_code_ >= 300)
  {
    error_message_ = plx_string("HTTP error: ") + plx_string(status_code_) + " - " + response_body_;
    return false;
  }
  return true;
}

int plx_http_request::get_status_code() const { return status_code_; }
plx_string plx_http_request::get_response_body() const { return response_body_; }
const plxv_map& plx_http_request::get_response_headers() const { return response_headers_; }
plx_string plx_http_request::get_error_message() const { return error_message_; }

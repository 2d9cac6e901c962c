#ifndef PLX_HTTP_REQUEST_H
#define PLX_HTTP_REQUEST_H

#include "../../utils/plx_variant.h"

// Synchronous HTTP request on top of libcurl.
class plx_http_request
{
public:
  plx_http_request();
  explicit plx_http_request(const plx_string& url);

  void set_url(const plx_string& url);
  plx_string get_url() const;

  /**
   * @brief Sets the HTTP method ("GET", "POST", "PUT", "DELETE", ...).
   */
  void set_method(const plx_string& method);
  plx_string get_method() const;

  void set_header(const plx_string& key, const plx_string& value);
  plx_string get_header(const plx_string& key) const;

  void set_body(const plx_string& body);
  plx_string get_body() const;

  /**
   * @brief Total transfer timeout in seconds, 0 disables it.
   */
  void set_timeout_seconds(long seconds);

  /**
   * @brief Sends the request and blocks until the response is read.
   * @return true for a 2xx status, false otherwise (see get_error_message()).
   */
  bool send();

  /**
   * @brief Runs curl_global_init once per process, safe to call from any thread.
   * @return false when libcurl could not be initialized.
   */
  static bool ensure_global_init();

  int get_status_code() const;
  plx_string get_response_body() const;
  const plxv_map& get_response_headers() const;
  plx_string get_error_message() const;

private:
  plx_string url_;
  plx_string method_;
  plxv_map headers_;
  plx_string body_;
  long timeout_seconds_;

  int status_code_;
  plx_string response_body_;
  plxv_map response_headers_;
  plx_string error_message_;
};

#endif // PLX_HTTP_REQUEST_H

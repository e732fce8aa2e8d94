#ifndef NETCONN_HTTP_RESPONSE_HPP
#define NETCONN_HTTP_RESPONSE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <llhttp.h>

#include "netconn/errors.hpp"

namespace netconn {

struct HeaderEntry {
  std::string name;
  std::string value;
};

// Incremental parser for an HTTP/1.x response head (status line and
// headers). The body, if any, is never consumed: parsing stops at the blank
// line that ends the head.
class ResponseHeadParser {
 public:
  ResponseHeadParser();

  ResponseHeadParser(const ResponseHeadParser&) = delete;
  ResponseHeadParser& operator=(const ResponseHeadParser&) = delete;

  // Feed the next chunk of the response.
  // Returns Error::ProxyResponseInvalid on malformed input; see LastError().
  Error Feed(std::string_view data);

  bool HeadersComplete() const { return headers_complete_; }

  int StatusCode() const { return status_code_; }
  const std::string& Reason() const { return reason_; }
  int HttpMajor() const { return http_major_; }
  int HttpMinor() const { return http_minor_; }

  // Case-insensitive header lookup (first match)
  std::optional<std::string> Header(std::string_view name) const;
  const std::vector<HeaderEntry>& Headers() const { return headers_; }

  const std::string& LastError() const { return last_error_; }

 private:
  static int OnStatus(llhttp_t* parser, const char* at, size_t length);
  static int OnHeaderField(llhttp_t* parser, const char* at, size_t length);
  static int OnHeaderValue(llhttp_t* parser, const char* at, size_t length);
  static int OnHeaderValueComplete(llhttp_t* parser);
  static int OnHeadersComplete(llhttp_t* parser);

  llhttp_t parser_{};
  llhttp_settings_t settings_{};

  bool headers_complete_ = false;
  int status_code_ = 0;
  int http_major_ = 1;
  int http_minor_ = 1;
  std::string reason_;
  std::string field_;
  std::string value_;
  std::vector<HeaderEntry> headers_;
  std::string last_error_;
};

}  // namespace netconn

#endif  // NETCONN_HTTP_RESPONSE_HPP

#include "netconn/http_response.hpp"

#include <cctype>

namespace netconn {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

void TrimTrailingSpaces(std::string* s) {
  while (!s->empty() && (s->back() == ' ' || s->back() == '\t')) {
    s->pop_back();
  }
}

}  // namespace

ResponseHeadParser::ResponseHeadParser() {
  llhttp_settings_init(&settings_);
  settings_.on_status = &ResponseHeadParser::OnStatus;
  settings_.on_header_field = &ResponseHeadParser::OnHeaderField;
  settings_.on_header_value = &ResponseHeadParser::OnHeaderValue;
  settings_.on_header_value_complete =
      &ResponseHeadParser::OnHeaderValueComplete;
  settings_.on_headers_complete = &ResponseHeadParser::OnHeadersComplete;
  llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
  parser_.data = this;
}

Error ResponseHeadParser::Feed(std::string_view data) {
  if (headers_complete_) {
    return Error::OK;
  }

  llhttp_errno_t err = llhttp_execute(&parser_, data.data(), data.size());
  if (err == HPE_OK || err == HPE_PAUSED_UPGRADE) {
    return Error::OK;
  }

  const char* reason = llhttp_get_error_reason(&parser_);
  last_error_ = (reason && *reason) ? reason : llhttp_errno_name(err);
  return Error::ProxyResponseInvalid;
}

std::optional<std::string> ResponseHeadParser::Header(
    std::string_view name) const {
  for (const auto& entry : headers_) {
    if (EqualsIgnoreCase(entry.name, name)) {
      return entry.value;
    }
  }
  return std::nullopt;
}

int ResponseHeadParser::OnStatus(llhttp_t* parser, const char* at,
                                 size_t length) {
  auto* self = static_cast<ResponseHeadParser*>(parser->data);
  self->reason_.append(at, length);
  return 0;
}

int ResponseHeadParser::OnHeaderField(llhttp_t* parser, const char* at,
                                      size_t length) {
  auto* self = static_cast<ResponseHeadParser*>(parser->data);
  self->field_.append(at, length);
  return 0;
}

int ResponseHeadParser::OnHeaderValue(llhttp_t* parser, const char* at,
                                      size_t length) {
  auto* self = static_cast<ResponseHeadParser*>(parser->data);
  self->value_.append(at, length);
  return 0;
}

int ResponseHeadParser::OnHeaderValueComplete(llhttp_t* parser) {
  auto* self = static_cast<ResponseHeadParser*>(parser->data);
  TrimTrailingSpaces(&self->value_);
  self->headers_.push_back({std::move(self->field_), std::move(self->value_)});
  self->field_.clear();
  self->value_.clear();
  return 0;
}

int ResponseHeadParser::OnHeadersComplete(llhttp_t* parser) {
  auto* self = static_cast<ResponseHeadParser*>(parser->data);
  self->status_code_ = parser->status_code;
  self->http_major_ = parser->http_major;
  self->http_minor_ = parser->http_minor;
  self->headers_complete_ = true;
  // 2 = no body, treat as upgrade: llhttp stops with HPE_PAUSED_UPGRADE and
  // whatever follows the head belongs to the tunnel
  return 2;
}

}  // namespace netconn

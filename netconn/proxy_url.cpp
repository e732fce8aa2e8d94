#include "netconn/proxy_url.hpp"

#include <cctype>

#include "netconn/tcp.hpp"

namespace netconn {

namespace {

uint16_t DefaultPort(const std::string& scheme) {
  if (scheme == "http") {
    return 80;
  }
  if (scheme == "https") {
    return 443;
  }
  return 0;
}

bool ValidScheme(const std::string& scheme) {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
    return false;
  }
  for (char c : scheme) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' &&
        c != '.') {
      return false;
    }
  }
  return true;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool PercentDecode(const std::string& in, std::string* out) {
  out->clear();
  out->reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') {
      out->push_back(in[i]);
      continue;
    }
    if (i + 2 >= in.size()) {
      return false;
    }
    int hi = HexValue(in[i + 1]);
    int lo = HexValue(in[i + 2]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out->push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return true;
}

bool ParsePort(const std::string& text, uint16_t* port) {
  if (text.empty() || text.size() > 5) {
    return false;
  }
  uint32_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value > 65535) {
    return false;
  }
  *port = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

Result<ProxyUrl> ProxyUrl::Parse(const std::string& url) {
  ProxyUrl parsed;

  size_t sep = url.find("://");
  if (sep == std::string::npos) {
    return {parsed, Error::InvalidProxyUrl};
  }
  parsed.scheme = url.substr(0, sep);
  if (!ValidScheme(parsed.scheme)) {
    return {parsed, Error::InvalidProxyUrl};
  }
  for (auto& c : parsed.scheme) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  std::string authority = url.substr(sep + 3);
  size_t authority_end = authority.find_first_of("/?#");
  if (authority_end != std::string::npos) {
    authority.resize(authority_end);
  }

  // user-info
  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    std::string user_info = authority.substr(0, at);
    authority = authority.substr(at + 1);
    parsed.has_user_info = true;

    size_t colon = user_info.find(':');
    std::string raw_user = user_info.substr(0, colon);
    if (!PercentDecode(raw_user, &parsed.user)) {
      return {parsed, Error::InvalidProxyUrl};
    }
    if (colon != std::string::npos) {
      parsed.has_password = true;
      if (!PercentDecode(user_info.substr(colon + 1), &parsed.password)) {
        return {parsed, Error::InvalidProxyUrl};
      }
    }
  }

  // host[:port]
  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) {
      return {parsed, Error::InvalidProxyUrl};
    }
    parsed.host = authority.substr(1, close - 1);
    std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return {parsed, Error::InvalidProxyUrl};
      }
      port_text = tail.substr(1);
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      parsed.host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
    } else {
      parsed.host = authority;
    }
    if (parsed.host.find(':') != std::string::npos) {
      return {parsed, Error::InvalidProxyUrl};
    }
  }

  if (parsed.host.empty()) {
    return {parsed, Error::InvalidProxyUrl};
  }

  // "host:" means the default port
  if (!port_text.empty() && !ParsePort(port_text, &parsed.port)) {
    return {parsed, Error::InvalidProxyUrl};
  }
  if (parsed.port == 0) {
    parsed.port = DefaultPort(parsed.scheme);
  }

  return {parsed, Error::OK};
}

std::string ProxyUrl::HostPort() const { return JoinHostPort(host, port); }

std::string ProxyUrl::BasicCredentials() const {
  if (!has_user_info) {
    return "";
  }
  return Base64Encode(has_password ? user + ":" + password : user);
}

std::string Base64Encode(const uint8_t* data, size_t len) {
  static constexpr char kTable[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve(((len + 2) / 3) * 4);

  size_t i = 0;
  while (i + 2 < len) {
    uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                      (static_cast<uint32_t>(data[i + 1]) << 8) |
                      static_cast<uint32_t>(data[i + 2]);
    out.push_back(kTable[(triple >> 18) & 0x3F]);
    out.push_back(kTable[(triple >> 12) & 0x3F]);
    out.push_back(kTable[(triple >> 6) & 0x3F]);
    out.push_back(kTable[triple & 0x3F]);
    i += 3;
  }

  if (i < len) {
    uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
    if (i + 1 < len) {
      triple |= static_cast<uint32_t>(data[i + 1]) << 8;
    }
    out.push_back(kTable[(triple >> 18) & 0x3F]);
    out.push_back(kTable[(triple >> 12) & 0x3F]);
    out.push_back(i + 1 < len ? kTable[(triple >> 6) & 0x3F] : '=');
    out.push_back('=');
  }

  return out;
}

std::string Base64Encode(const std::string& text) {
  return Base64Encode(reinterpret_cast<const uint8_t*>(text.data()),
                      text.size());
}

}  // namespace netconn

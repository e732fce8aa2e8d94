#include "netconn/dialer.hpp"

#include "netconn/http_response.hpp"
#include "netconn/log.hpp"
#include "netconn/proxy_url.hpp"
#include "netconn/tcp.hpp"

namespace netconn {

DialResult ConnectServer(const std::string& address, const DialConfig& config) {
  auto stream = TcpStream::Dial(address);
  if (!stream.ok()) {
    return {nullptr, stream.error};
  }
  return {Conn::Wrap(std::move(stream.value), config.conn), Error::OK};
}

std::string BuildConnectRequest(const std::string& target,
                                const std::string& credentials,
                                const std::string& user_agent) {
  std::string request;
  request.reserve(128 + target.size() * 2 + credentials.size());
  request.append("CONNECT ").append(target).append(" HTTP/1.1\r\n");
  request.append("Host: ").append(target).append("\r\n");
  request.append("User-Agent: ").append(user_agent).append("\r\n");
  if (!credentials.empty()) {
    request.append("Proxy-Authorization: Basic ")
        .append(credentials)
        .append("\r\n");
  }
  request.append("\r\n");
  return request;
}

DialResult ConnectServerByHttpProxy(const std::string& proxy_url,
                                    const std::string& server_address,
                                    const DialConfig& config) {
  auto url = ProxyUrl::Parse(proxy_url);
  if (!url.ok()) {
    return {nullptr, url.error};
  }

  if (url.value.scheme != "http") {
    NETCONN_LOG_WARN("proxy url scheme must be http, not [{}]",
                     url.value.scheme);
    return {nullptr, Error::UnsupportedProxyScheme};
  }

  std::string credentials = url.value.BasicCredentials();

  DialResult result = ConnectServer(url.value.HostPort(), config);
  if (!result.ok()) {
    return result;
  }

  Error err = result.conn->WriteString(
      BuildConnectRequest(server_address, credentials, config.user_agent));
  if (err != Error::OK) {
    result.error = err;
    return result;
  }

  // Read the reply one line at a time so nothing past the head is buffered
  // away from the tunnel
  ResponseHeadParser parser;
  size_t head_bytes = 0;
  while (!parser.HeadersComplete()) {
    // The line limit keeps an unterminated line within the head budget too
    size_t remaining = config.max_response_head - head_bytes;
    auto line = remaining > 0 ? result.conn->ReadLine(remaining)
                              : Result<std::string>{"", Error::LineTooLong};
    if (line.error == Error::LineTooLong) {
      NETCONN_LOG_WARN("proxy {} reply head exceeds {} bytes",
                       url.value.HostPort(), config.max_response_head);
      result.error = Error::ProxyResponseInvalid;
      return result;
    }
    if (!line.ok()) {
      NETCONN_LOG_WARN("proxy {} reply for {}: {}", url.value.HostPort(),
                       server_address, ErrorString(line.error));
      result.error = line.error;
      return result;
    }
    head_bytes += line.value.size();

    if (parser.Feed(line.value) != Error::OK) {
      NETCONN_LOG_WARN("proxy {} sent a malformed reply: {}",
                       url.value.HostPort(), parser.LastError());
      result.error = Error::ProxyResponseInvalid;
      return result;
    }
  }

  result.status_code = parser.StatusCode();
  if (result.status_code != 200) {
    NETCONN_LOG_WARN("ConnectServer using proxy error, StatusCode [{}]",
                     result.status_code);
    result.error = Error::ProxyHandshakeFailed;
    return result;
  }

  NETCONN_LOG_DEBUG("tunnel to {} via {} established", server_address,
                    url.value.HostPort());
  return result;
}

DialResult ConnectServerByProxy(const std::string& proxy_url,
                                const std::string& server_address,
                                const DialConfig& config) {
  if (proxy_url.empty()) {
    return ConnectServer(server_address, config);
  }
  return ConnectServerByHttpProxy(proxy_url, server_address, config);
}

}  // namespace netconn

#ifndef NETCONN_DIALER_HPP
#define NETCONN_DIALER_HPP

#include <memory>
#include <string>

#include "netconn/conn.hpp"
#include "netconn/errors.hpp"
#include "netconn/types.hpp"

namespace netconn {

// Dial configuration
struct DialConfig {
  std::string user_agent = kProxyUserAgent;
  size_t max_response_head = kMaxProxyResponseHead;
  ConnConfig conn;
};

// Outcome of a dial.
//
// After a failed proxy handshake `conn` still holds the connection to the
// proxy; it is unusable and should be closed (dropping it also closes it).
struct DialResult {
  std::unique_ptr<Conn> conn;
  Error error = Error::OK;
  int status_code = 0;  // Proxy reply status, when one was read

  bool ok() const { return error == Error::OK; }
  explicit operator bool() const { return ok(); }
};

// Connect straight to "host:port"
DialResult ConnectServer(const std::string& address,
                         const DialConfig& config = {});

// Connect to server_address through an HTTP proxy using CONNECT.
// Only "http://" proxy URLs are accepted; user info in the URL is sent as
// Basic Proxy-Authorization.
DialResult ConnectServerByHttpProxy(const std::string& proxy_url,
                                    const std::string& server_address,
                                    const DialConfig& config = {});

// ConnectServer when proxy_url is empty, ConnectServerByHttpProxy otherwise
DialResult ConnectServerByProxy(const std::string& proxy_url,
                                const std::string& server_address,
                                const DialConfig& config = {});

// CONNECT request head for target. Empty credentials omit
// Proxy-Authorization.
std::string BuildConnectRequest(const std::string& target,
                                const std::string& credentials,
                                const std::string& user_agent);

}  // namespace netconn

#endif  // NETCONN_DIALER_HPP

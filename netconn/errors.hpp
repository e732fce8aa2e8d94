#ifndef NETCONN_ERRORS_HPP
#define NETCONN_ERRORS_HPP

namespace netconn {

// Error codes for netconn operations
enum class Error {
  OK = 0,
  EOF_,
  Timeout,
  ConnectionClosed,
  ConnectionReset,
  ReadError,
  WriteError,
  DeadlineError,
  InvalidAddress,
  ResolutionError,
  ConnectError,
  ListenError,
  AcceptError,
  LineTooLong,
  ChannelClosed,
  InvalidProxyUrl,
  UnsupportedProxyScheme,
  ProxyResponseInvalid,
  ProxyHandshakeFailed,
};

// Convert error to human-readable string
inline const char* ErrorString(Error err) {
  switch (err) {
    case Error::OK:
      return "ok";
    case Error::EOF_:
      return "end of file";
    case Error::Timeout:
      return "timeout";
    case Error::ConnectionClosed:
      return "connection closed";
    case Error::ConnectionReset:
      return "connection reset";
    case Error::ReadError:
      return "read error";
    case Error::WriteError:
      return "write error";
    case Error::DeadlineError:
      return "set deadline failed";
    case Error::InvalidAddress:
      return "invalid address";
    case Error::ResolutionError:
      return "address resolution failed";
    case Error::ConnectError:
      return "connect failed";
    case Error::ListenError:
      return "listen failed";
    case Error::AcceptError:
      return "accept failed";
    case Error::LineTooLong:
      return "line too long";
    case Error::ChannelClosed:
      return "channel close";
    case Error::InvalidProxyUrl:
      return "invalid proxy url";
    case Error::UnsupportedProxyScheme:
      return "proxy url scheme must be http";
    case Error::ProxyResponseInvalid:
      return "invalid proxy response";
    case Error::ProxyHandshakeFailed:
      return "proxy handshake failed";
    default:
      return "unknown error";
  }
}

// Result type for operations that return a value or error
template <typename T>
struct Result {
  T value;
  Error error;

  bool ok() const { return error == Error::OK; }

  // Implicit conversion for checking
  explicit operator bool() const { return ok(); }
};

}  // namespace netconn

#endif  // NETCONN_ERRORS_HPP

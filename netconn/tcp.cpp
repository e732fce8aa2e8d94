#include "netconn/tcp.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

#include "netconn/log.hpp"

namespace netconn {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* ai) const { ::freeaddrinfo(ai); }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

// Render a socket address as "host:port"
std::string FormatSockaddr(const sockaddr_storage& storage) {
  char host[INET6_ADDRSTRLEN] = {0};
  uint16_t port = 0;

  if (storage.ss_family == AF_INET) {
    auto* in4 = reinterpret_cast<const sockaddr_in*>(&storage);
    if (!::inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host))) {
      return "";
    }
    port = ntohs(in4->sin_port);
  } else if (storage.ss_family == AF_INET6) {
    auto* in6 = reinterpret_cast<const sockaddr_in6*>(&storage);
    if (!::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host))) {
      return "";
    }
    port = ntohs(in6->sin6_port);
  } else {
    return "";
  }

  return JoinHostPort(host, port);
}

std::string PeerName(int fd) {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&storage), &len) != 0) {
    return "";
  }
  return FormatSockaddr(storage);
}

std::string SockName(int fd, uint16_t* port) {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&storage), &len) != 0) {
    return "";
  }
  if (port) {
    if (storage.ss_family == AF_INET) {
      *port = ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
    } else if (storage.ss_family == AF_INET6) {
      *port = ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
    }
  }
  return FormatSockaddr(storage);
}

Error Resolve(const std::string& host, const std::string& port, int flags,
              AddrInfoPtr* out) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = flags;

  addrinfo* raw = nullptr;
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(),
                         &hints, &raw);
  if (rc != 0 || !raw) {
    NETCONN_LOG_DEBUG("resolve {}:{} failed: {}", host, port,
                      rc != 0 ? ::gai_strerror(rc) : "no addresses");
    return Error::ResolutionError;
  }
  out->reset(raw);
  return Error::OK;
}

}  // namespace

bool SplitHostPort(const std::string& address, std::string* host,
                   std::string* port) {
  if (address.empty()) {
    return false;
  }

  if (address.front() == '[') {
    size_t end = address.find(']');
    if (end == std::string::npos || end + 1 >= address.size() ||
        address[end + 1] != ':') {
      return false;
    }
    *host = address.substr(1, end - 1);
    *port = address.substr(end + 2);
  } else {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos) {
      return false;
    }
    // More than one colon: an IPv6 literal without brackets
    if (address.find(':') != colon) {
      return false;
    }
    *host = address.substr(0, colon);
    *port = address.substr(colon + 1);
  }

  return !port->empty();
}

std::string JoinHostPort(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

// --- TcpStream ---

TcpStream::TcpStream(int fd)
    : fd_(fd),
      remote_address_(PeerName(fd)),
      local_address_(SockName(fd, nullptr)) {
  int one = 1;
  if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
    NETCONN_LOG_DEBUG("TCP_NODELAY on fd {} failed: {}", fd_,
                      std::strerror(errno));
  }
}

TcpStream::~TcpStream() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

Result<std::unique_ptr<TcpStream>> TcpStream::Dial(const std::string& address) {
  std::string host;
  std::string port;
  if (!SplitHostPort(address, &host, &port)) {
    return {nullptr, Error::InvalidAddress};
  }

  AddrInfoPtr addrs;
  Error err = Resolve(host, port, 0, &addrs);
  if (err != Error::OK) {
    return {nullptr, err};
  }

  int last_errno = 0;
  for (addrinfo* ai = addrs.get(); ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      return {std::make_unique<TcpStream>(fd), Error::OK};
    }
    last_errno = errno;
    ::close(fd);
  }

  NETCONN_LOG_DEBUG("connect {} failed: {}", address,
                    std::strerror(last_errno));
  return {nullptr, Error::ConnectError};
}

Error TcpStream::WaitReady(short events,
                           const std::atomic<Clock::rep>& deadline) {
  for (;;) {
    int timeout_ms = -1;
    Clock::rep rep = deadline.load();
    if (rep != 0) {
      auto remaining = Deadline(Clock::duration(rep)) - Clock::now();
      if (remaining <= Clock::duration::zero()) {
        return Error::Timeout;
      }
      auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
      timeout_ms = static_cast<int>(
          std::min<std::chrono::milliseconds::rep>(ms, INT_MAX));
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc > 0) {
      return Error::OK;
    }
    if (rc == 0 || errno == EINTR) {
      continue;  // Re-check the deadline
    }
    return events == POLLIN ? Error::ReadError : Error::WriteError;
  }
}

Result<size_t> TcpStream::Read(uint8_t* buf, size_t max_len) {
  if (closed_.load()) {
    return {0, Error::ConnectionClosed};
  }
  if (max_len == 0) {
    return {0, Error::OK};
  }

  for (;;) {
    Error err = WaitReady(POLLIN, read_deadline_);
    if (err != Error::OK) {
      return {0, err};
    }

    ssize_t n = ::recv(fd_, buf, max_len, 0);
    if (n > 0) {
      return {static_cast<size_t>(n), Error::OK};
    }
    if (n == 0) {
      // A local shutdown also reads as EOF
      return {0, closed_.load() ? Error::ConnectionClosed : Error::EOF_};
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    if (closed_.load()) {
      return {0, Error::ConnectionClosed};
    }
    return {0, errno == ECONNRESET ? Error::ConnectionReset : Error::ReadError};
  }
}

Result<size_t> TcpStream::Write(const uint8_t* data, size_t len) {
  size_t written = 0;
  while (written < len) {
    if (closed_.load()) {
      return {written, Error::ConnectionClosed};
    }

    Error err = WaitReady(POLLOUT, write_deadline_);
    if (err != Error::OK) {
      return {written, err};
    }

    ssize_t n = ::send(fd_, data + written, len - written, MSG_NOSIGNAL);
    if (n >= 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    if (closed_.load()) {
      return {written, Error::ConnectionClosed};
    }
    if (errno == ECONNRESET || errno == EPIPE) {
      return {written, Error::ConnectionReset};
    }
    return {written, Error::WriteError};
  }
  return {written, Error::OK};
}

Error TcpStream::Close() {
  if (closed_.exchange(true)) {
    return Error::ConnectionClosed;
  }

  // ENOTCONN: the peer already reset the connection
  if (::shutdown(fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
    NETCONN_LOG_DEBUG("shutdown {} failed: {}", remote_address_,
                      std::strerror(errno));
  }
  return Error::OK;
}

Error TcpStream::SetDeadline(Deadline t) {
  if (closed_.load()) {
    return Error::DeadlineError;
  }
  read_deadline_.store(t.time_since_epoch().count());
  write_deadline_.store(t.time_since_epoch().count());
  return Error::OK;
}

Error TcpStream::SetReadDeadline(Deadline t) {
  if (closed_.load()) {
    return Error::DeadlineError;
  }
  read_deadline_.store(t.time_since_epoch().count());
  return Error::OK;
}

// --- TcpListenSocket ---

TcpListenSocket::TcpListenSocket(int fd) : fd_(fd) {
  local_address_ = SockName(fd_, &port_);
}

TcpListenSocket::~TcpListenSocket() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

Result<std::unique_ptr<TcpListenSocket>> TcpListenSocket::Listen(
    const std::string& host, uint16_t port, int backlog) {
  std::string node = host;
  if (node.size() >= 2 && node.front() == '[' && node.back() == ']') {
    node = node.substr(1, node.size() - 2);
  }

  AddrInfoPtr addrs;
  Error err = Resolve(node, std::to_string(port), AI_PASSIVE, &addrs);
  if (err != Error::OK) {
    return {nullptr, err};
  }

  int last_errno = 0;
  for (addrinfo* ai = addrs.get(); ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }

    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
      NETCONN_LOG_DEBUG("SO_REUSEADDR failed: {}", std::strerror(errno));
    }

    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 &&
        ::listen(fd, backlog) == 0) {
      return {std::unique_ptr<TcpListenSocket>(new TcpListenSocket(fd)),
              Error::OK};
    }
    last_errno = errno;
    ::close(fd);
  }

  NETCONN_LOG_DEBUG("listen on {} failed: {}", JoinHostPort(node, port),
                    std::strerror(last_errno));
  return {nullptr, Error::ListenError};
}

Result<std::unique_ptr<TcpStream>> TcpListenSocket::Accept() {
  for (;;) {
    if (closed_.load()) {
      return {nullptr, Error::ConnectionClosed};
    }

    int fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd >= 0) {
      return {std::make_unique<TcpStream>(fd), Error::OK};
    }
    if (errno == EINTR) {
      continue;
    }
    return {nullptr,
            closed_.load() ? Error::ConnectionClosed : Error::AcceptError};
  }
}

Error TcpListenSocket::Close() {
  if (closed_.exchange(true)) {
    return Error::OK;
  }

  // On Linux, shutting down a listening socket wakes a blocked accept()
  if (::shutdown(fd_, SHUT_RDWR) != 0) {
    NETCONN_LOG_DEBUG("shutdown listener {} failed: {}", local_address_,
                      std::strerror(errno));
  }
  return Error::OK;
}

}  // namespace netconn

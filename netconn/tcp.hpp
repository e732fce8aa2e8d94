#ifndef NETCONN_TCP_HPP
#define NETCONN_TCP_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "netconn/errors.hpp"
#include "netconn/stream.hpp"
#include "netconn/types.hpp"

namespace netconn {

// Split "host:port" into its parts. IPv6 hosts must be bracketed
// ("[::1]:80"); the brackets are removed from the returned host.
bool SplitHostPort(const std::string& address, std::string* host,
                   std::string* port);

// Inverse of SplitHostPort
std::string JoinHostPort(const std::string& host, uint16_t port);

// A connected TCP socket.
//
// Close() shuts the socket down so that blocked reads and writes on other
// threads return; the descriptor itself is released by the destructor, so a
// concurrent reader never touches a recycled descriptor.
class TcpStream : public Stream {
 public:
  // Take ownership of a connected socket descriptor
  explicit TcpStream(int fd);

  ~TcpStream() override;

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  // Resolve "host:port" and connect to the first address that accepts
  static Result<std::unique_ptr<TcpStream>> Dial(const std::string& address);

  Result<size_t> Read(uint8_t* buf, size_t max_len) override;
  Result<size_t> Write(const uint8_t* data, size_t len) override;
  Error Close() override;
  Error SetDeadline(Deadline t) override;
  Error SetReadDeadline(Deadline t) override;
  std::string RemoteAddress() const override { return remote_address_; }
  std::string LocalAddress() const override { return local_address_; }

  int NativeHandle() const { return fd_; }

 private:
  // Wait for the descriptor to become ready, honoring the deadline
  Error WaitReady(short events, const std::atomic<Clock::rep>& deadline);

  int fd_;
  std::atomic<bool> closed_{false};
  std::atomic<Clock::rep> read_deadline_{0};
  std::atomic<Clock::rep> write_deadline_{0};
  std::string remote_address_;
  std::string local_address_;
};

// A bound, listening TCP socket
class TcpListenSocket {
 public:
  ~TcpListenSocket();

  TcpListenSocket(const TcpListenSocket&) = delete;
  TcpListenSocket& operator=(const TcpListenSocket&) = delete;

  // Resolve host:port for a passive socket, bind and listen.
  // An empty host binds every local address.
  static Result<std::unique_ptr<TcpListenSocket>> Listen(
      const std::string& host, uint16_t port,
      int backlog = kDefaultListenBacklog);

  // Block until a client connects or the socket is closed
  Result<std::unique_ptr<TcpStream>> Accept();

  // Stop listening. Wakes a thread blocked in Accept().
  Error Close();

  bool IsClosed() const { return closed_.load(); }

  std::string LocalAddress() const { return local_address_; }
  uint16_t Port() const { return port_; }

 private:
  explicit TcpListenSocket(int fd);

  int fd_;
  std::atomic<bool> closed_{false};
  std::string local_address_;
  uint16_t port_ = 0;
};

}  // namespace netconn

#endif  // NETCONN_TCP_HPP

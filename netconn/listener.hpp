#ifndef NETCONN_LISTENER_HPP
#define NETCONN_LISTENER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "netconn/channel.hpp"
#include "netconn/conn.hpp"
#include "netconn/errors.hpp"
#include "netconn/tcp.hpp"
#include "netconn/types.hpp"

namespace netconn {

// Listener configuration
struct ListenerConfig {
  int backlog = kDefaultListenBacklog;
  size_t pending_capacity = kDefaultPendingAccepts;
  ConnConfig conn;
};

// Delay before retrying after a failed accept, given the previous delay
// (zero after a successful accept)
std::chrono::milliseconds AcceptRetryDelay(
    std::chrono::milliseconds previous);

// A TCP listener whose accepts run on a background thread.
//
// Accepted connections are handed to Accept() callers in arrival order
// through a bounded channel; once `pending_capacity` connections are waiting
// the accept thread stalls until a caller takes one.
class Listener {
 public:
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  // Bind and listen on bind_addr:bind_port, then start the accept thread.
  // Port 0 picks an ephemeral port; see Port().
  static Result<std::unique_ptr<Listener>> Listen(
      const std::string& bind_addr, uint16_t bind_port,
      const ListenerConfig& config = {});

  // Wait for the next connection. Returns Error::ChannelClosed once the
  // listener is closed.
  Result<std::unique_ptr<Conn>> Accept();

  // Stop listening. Only the first call has an effect.
  Error Close();

  bool IsClosed() const { return closed_.load(); }

  std::string LocalAddress() const { return socket_->LocalAddress(); }
  uint16_t Port() const { return socket_->Port(); }

 private:
  Listener(std::unique_ptr<TcpListenSocket> socket,
           const ListenerConfig& config);

  // Background accept loop
  void AcceptLoop();

  ListenerConfig config_;
  std::unique_ptr<TcpListenSocket> socket_;
  HandoffChannel<std::unique_ptr<Conn>> channel_;
  std::atomic<bool> closed_{false};
  std::mutex retry_mtx_;
  std::condition_variable retry_cv_;  // Wakes a retry pause on Close()
  std::thread accept_thread_;
};

}  // namespace netconn

#endif  // NETCONN_LISTENER_HPP

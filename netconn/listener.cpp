#include "netconn/listener.hpp"

#include <algorithm>

#include "netconn/log.hpp"

namespace netconn {

std::chrono::milliseconds AcceptRetryDelay(
    std::chrono::milliseconds previous) {
  if (previous < kAcceptRetryMinDelay) {
    return kAcceptRetryMinDelay;
  }
  return std::min(previous * 2, kAcceptRetryMaxDelay);
}

Listener::Listener(std::unique_ptr<TcpListenSocket> socket,
                   const ListenerConfig& config)
    : config_(config),
      socket_(std::move(socket)),
      channel_(config.pending_capacity) {}

Listener::~Listener() {
  Close();

  // Close() unblocks both accept() and a pending hand-off, so the loop is
  // already on its way out
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
}

Result<std::unique_ptr<Listener>> Listener::Listen(
    const std::string& bind_addr, uint16_t bind_port,
    const ListenerConfig& config) {
  auto socket = TcpListenSocket::Listen(bind_addr, bind_port, config.backlog);
  if (!socket.ok()) {
    return {nullptr, socket.error};
  }

  auto listener = std::unique_ptr<Listener>(
      new Listener(std::move(socket.value), config));
  listener->accept_thread_ = std::thread([l = listener.get()]() {
    l->AcceptLoop();
  });

  NETCONN_LOG_DEBUG("listening on {}", listener->LocalAddress());
  return {std::move(listener), Error::OK};
}

Result<std::unique_ptr<Conn>> Listener::Accept() { return channel_.Receive(); }

Error Listener::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true)) {
    return Error::OK;  // Already closed
  }

  // Socket first so the loop cannot accept again, then the channel to
  // release a blocked hand-off and any waiting Accept() callers
  Error err = socket_->Close();
  if (err != Error::OK) {
    NETCONN_LOG_DEBUG("close listener {}: {}", socket_->LocalAddress(),
                      ErrorString(err));
  }
  channel_.Close();
  {
    std::lock_guard<std::mutex> lock(retry_mtx_);
    retry_cv_.notify_all();
  }

  return Error::OK;
}

void Listener::AcceptLoop() {
  std::chrono::milliseconds retry_delay{0};
  for (;;) {
    auto result = socket_->Accept();
    if (!result.ok()) {
      if (closed_.load()) {
        NETCONN_LOG_DEBUG("accept loop on {} stopped", socket_->LocalAddress());
        return;
      }
      // Back off so a persistent failure (EMFILE) does not spin
      retry_delay = AcceptRetryDelay(retry_delay);
      NETCONN_LOG_DEBUG("accept on {} failed: {}; retrying in {}ms",
                        socket_->LocalAddress(), ErrorString(result.error),
                        retry_delay.count());
      std::unique_lock<std::mutex> lock(retry_mtx_);
      retry_cv_.wait_for(lock, retry_delay,
                         [this]() { return closed_.load(); });
      continue;
    }
    retry_delay = std::chrono::milliseconds{0};

    auto conn = Conn::Wrap(std::move(result.value), config_.conn);
    if (channel_.Send(std::move(conn)) != Error::OK) {
      // Closed while waiting for a receiver; nobody will take this one
      conn->Close();
      return;
    }
  }
}

}  // namespace netconn

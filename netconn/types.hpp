#ifndef NETCONN_TYPES_HPP
#define NETCONN_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace netconn {

// Deadlines are absolute wall-clock points, like SO_RCVTIMEO set from a
// timestamp. The epoch value means "no deadline".
using Clock = std::chrono::system_clock;
using Deadline = Clock::time_point;

constexpr Deadline kNoDeadline{};

// Size of the per-connection read buffer
constexpr size_t kDefaultReadBufferSize = 4096;

// How long CheckHalfClosed waits for the peer's FIN
constexpr std::chrono::milliseconds kHalfCloseProbeTimeout{1};

// Pause after a failed accept, doubling up to the maximum while failures
// persist
constexpr std::chrono::milliseconds kAcceptRetryMinDelay{5};
constexpr std::chrono::milliseconds kAcceptRetryMaxDelay{1000};

// listen(2) backlog
constexpr int kDefaultListenBacklog = 128;

// Accepted connections buffered before the accept loop stalls
constexpr size_t kDefaultPendingAccepts = 1;

// Upper bound on the proxy's CONNECT response head
constexpr size_t kMaxProxyResponseHead = 16 * 1024;

// User-Agent sent with CONNECT requests
constexpr const char* kProxyUserAgent = "Mozilla/5.0";

// Connection lifecycle states
enum class ConnState {
  Open,
  Closed,
};

// Convert connection state to string for debugging
inline const char* ConnStateString(ConnState state) {
  switch (state) {
    case ConnState::Open:
      return "Open";
    case ConnState::Closed:
      return "Closed";
    default:
      return "Unknown";
  }
}

}  // namespace netconn

#endif  // NETCONN_TYPES_HPP

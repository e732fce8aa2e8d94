#ifndef NETCONN_STREAM_HPP
#define NETCONN_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "netconn/errors.hpp"
#include "netconn/types.hpp"

namespace netconn {

// Abstract interface for a bidirectional byte stream with deadline control.
// TcpStream wraps a connected socket; tests substitute in-memory pipes.
class Stream {
 public:
  virtual ~Stream() = default;

  // Read data from the stream.
  // Blocks until at least one byte is available, the read deadline passes
  // (Error::Timeout), or the peer closes (Error::EOF_).
  virtual Result<size_t> Read(uint8_t* buf, size_t max_len) = 0;

  // Write data to the stream.
  // Returns the number of bytes written; on error the count is what was
  // accepted before the failure.
  virtual Result<size_t> Write(const uint8_t* data, size_t len) = 0;

  // Close the stream. Unblocks reads and writes in progress on other threads.
  virtual Error Close() = 0;

  // Set both read and write deadlines. kNoDeadline clears them.
  virtual Error SetDeadline(Deadline t) = 0;

  // Set the read deadline. kNoDeadline clears it.
  virtual Error SetReadDeadline(Deadline t) = 0;

  // "host:port" of the peer
  virtual std::string RemoteAddress() const = 0;

  // "host:port" of the local endpoint
  virtual std::string LocalAddress() const = 0;
};

}  // namespace netconn

#endif  // NETCONN_STREAM_HPP

#ifndef NETCONN_CONN_HPP
#define NETCONN_CONN_HPP

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>

#include "netconn/buffered_reader.hpp"
#include "netconn/errors.hpp"
#include "netconn/stream.hpp"
#include "netconn/types.hpp"

namespace netconn {

// Connection configuration
struct ConnConfig {
  size_t read_buffer_size = kDefaultReadBufferSize;
  std::chrono::milliseconds half_close_probe_timeout = kHalfCloseProbeTimeout;
};

// A stream with a read buffer and a close-once lifecycle.
//
// The guard protects the lifecycle state and stream replacement only. Reads
// and writes do not take it, so Close() from another thread can always
// interrupt a blocked read. At most one reader and one writer may be active
// at a time.
class Conn {
 public:
  ~Conn();

  Conn(const Conn&) = delete;
  Conn& operator=(const Conn&) = delete;

  // Wrap an established stream
  static std::unique_ptr<Conn> Wrap(std::unique_ptr<Stream> stream,
                                    const ConnConfig& config = {});

  // Install a new stream, dropping buffered bytes and reopening the
  // connection. The previous stream is handed back untouched; the caller
  // decides when to close or destroy it.
  std::unique_ptr<Stream> ReplaceStream(std::unique_ptr<Stream> stream);

  // Read buffered data
  Result<size_t> Read(uint8_t* buf, size_t max_len);

  // Read a line including the trailing '\n'. EOF or a connection reset
  // marks the connection closed. A non-zero max_len caps the line length
  // (Error::LineTooLong).
  Result<std::string> ReadLine(size_t max_len = 0);

  // Write directly to the stream
  Result<size_t> Write(const uint8_t* data, size_t len);
  Error WriteString(const std::string& text);

  // Close the stream. Only the first call reaches the transport; every call
  // returns Error::OK.
  Error Close();

  // Last observed lifecycle state
  bool IsClosed() const;
  ConnState State() const;

  // Probe whether the peer has half-closed the connection.
  //
  // The caller must ensure the peer sends nothing while the probe runs. A
  // byte that does arrive is kept in the read buffer. Returns true when the
  // connection is (now) closed.
  bool CheckHalfClosed();

  std::string RemoteAddress() const;
  std::string LocalAddress() const;

  Error SetDeadline(Deadline t);
  Error SetReadDeadline(Deadline t);

 private:
  Conn(std::unique_ptr<Stream> stream, const ConnConfig& config);

  ConnConfig config_;

  mutable std::shared_mutex mtx_;
  std::unique_ptr<Stream> stream_;
  std::unique_ptr<BufferedReader> reader_;
  ConnState state_ = ConnState::Open;
};

}  // namespace netconn

#endif  // NETCONN_CONN_HPP

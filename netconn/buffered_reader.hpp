#ifndef NETCONN_BUFFERED_READER_HPP
#define NETCONN_BUFFERED_READER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "netconn/errors.hpp"
#include "netconn/stream.hpp"
#include "netconn/types.hpp"

namespace netconn {

// Read buffer in front of a Stream. Only the read direction is buffered;
// writes go straight to the stream.
class BufferedReader {
 public:
  // The stream is not owned and must outlive the reader
  explicit BufferedReader(Stream* stream,
                          size_t size = kDefaultReadBufferSize);

  // Read up to max_len bytes. Serves buffered bytes first; otherwise
  // performs at most one read on the stream.
  Result<size_t> Read(uint8_t* buf, size_t max_len);

  // Read until the first occurrence of delim, inclusive.
  // On error, the bytes read before the error are returned with it.
  // A non-zero max_len bounds the line: once max_len bytes are buffered
  // without delim, Error::LineTooLong is returned and the bytes stay
  // buffered.
  Result<std::string> ReadUntil(uint8_t delim, size_t max_len = 0);

  // Add bytes that were read from the stream out of band. They follow the
  // data already buffered.
  void Append(const uint8_t* data, size_t len);

  // Number of bytes that can be read without touching the stream
  size_t Buffered() const { return end_ - start_; }

 private:
  // Read more data from the stream into the free tail of the buffer
  Error Fill();

  Stream* stream_;
  std::vector<uint8_t> buf_;
  size_t start_ = 0;  // First unread byte
  size_t end_ = 0;    // One past the last valid byte
};

}  // namespace netconn

#endif  // NETCONN_BUFFERED_READER_HPP

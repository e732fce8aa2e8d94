#include "netconn/buffered_reader.hpp"

#include <algorithm>
#include <cstring>

namespace netconn {

BufferedReader::BufferedReader(Stream* stream, size_t size)
    : stream_(stream), buf_(std::max<size_t>(size, 16)) {}

Error BufferedReader::Fill() {
  // Slide unread data to the front
  if (start_ > 0) {
    std::memmove(buf_.data(), buf_.data() + start_, end_ - start_);
    end_ -= start_;
    start_ = 0;
  }

  if (end_ == buf_.size()) {
    buf_.resize(buf_.size() * 2);
  }

  auto result = stream_->Read(buf_.data() + end_, buf_.size() - end_);
  end_ += result.value;
  if (result.error != Error::OK) {
    return result.error;
  }
  if (result.value == 0) {
    return Error::EOF_;
  }
  return Error::OK;
}

Result<size_t> BufferedReader::Read(uint8_t* buf, size_t max_len) {
  if (max_len == 0) {
    return {0, Error::OK};
  }

  if (Buffered() == 0) {
    // Large reads bypass the buffer entirely
    if (max_len >= buf_.size()) {
      return stream_->Read(buf, max_len);
    }

    start_ = 0;
    end_ = 0;
    Error err = Fill();
    if (Buffered() == 0) {
      return {0, err};
    }
  }

  size_t to_copy = std::min(max_len, Buffered());
  std::memcpy(buf, buf_.data() + start_, to_copy);
  start_ += to_copy;
  return {to_copy, Error::OK};
}

Result<std::string> BufferedReader::ReadUntil(uint8_t delim,
                                              size_t max_len) {
  std::string line;
  size_t scanned = 0;

  for (;;) {
    const uint8_t* begin = buf_.data() + start_ + scanned;
    const uint8_t* end = buf_.data() + end_;
    const uint8_t* found = std::find(begin, end, delim);
    size_t n = static_cast<size_t>(found - (buf_.data() + start_)) + 1;
    if (found != end && (max_len == 0 || n <= max_len)) {
      line.append(reinterpret_cast<const char*>(buf_.data() + start_), n);
      start_ += n;
      return {std::move(line), Error::OK};
    }
    if (max_len != 0 && Buffered() >= max_len) {
      return {std::move(line), Error::LineTooLong};
    }

    scanned = Buffered();
    Error err = Fill();
    if (err != Error::OK) {
      line.append(reinterpret_cast<const char*>(buf_.data() + start_),
                  Buffered());
      start_ = end_;
      return {std::move(line), err};
    }
  }
}

void BufferedReader::Append(const uint8_t* data, size_t len) {
  if (len == 0) {
    return;
  }

  if (start_ > 0) {
    std::memmove(buf_.data(), buf_.data() + start_, end_ - start_);
    end_ -= start_;
    start_ = 0;
  }
  if (end_ + len > buf_.size()) {
    buf_.resize(end_ + len);
  }
  std::memcpy(buf_.data() + end_, data, len);
  end_ += len;
}

}  // namespace netconn

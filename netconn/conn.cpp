#include "netconn/conn.hpp"

#include <mutex>

#include "netconn/log.hpp"

namespace netconn {

Conn::Conn(std::unique_ptr<Stream> stream, const ConnConfig& config)
    : config_(config),
      stream_(std::move(stream)),
      reader_(std::make_unique<BufferedReader>(stream_.get(),
                                               config_.read_buffer_size)) {}

Conn::~Conn() { Close(); }

std::unique_ptr<Conn> Conn::Wrap(std::unique_ptr<Stream> stream,
                                 const ConnConfig& config) {
  return std::unique_ptr<Conn>(new Conn(std::move(stream), config));
}

std::unique_ptr<Stream> Conn::ReplaceStream(
    std::unique_ptr<Stream> stream) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  std::unique_ptr<Stream> previous = std::move(stream_);
  stream_ = std::move(stream);
  reader_ = std::make_unique<BufferedReader>(stream_.get(),
                                             config_.read_buffer_size);
  state_ = ConnState::Open;
  return previous;
}

Result<size_t> Conn::Read(uint8_t* buf, size_t max_len) {
  return reader_->Read(buf, max_len);
}

Result<std::string> Conn::ReadLine(size_t max_len) {
  auto result = reader_->ReadUntil('\n', max_len);
  if (result.error == Error::EOF_ || result.error == Error::ConnectionReset) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    state_ = ConnState::Closed;
  }
  return result;
}

Result<size_t> Conn::Write(const uint8_t* data, size_t len) {
  return stream_->Write(data, len);
}

Error Conn::WriteString(const std::string& text) {
  return Write(reinterpret_cast<const uint8_t*>(text.data()), text.size())
      .error;
}

Error Conn::Close() {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (stream_ && state_ == ConnState::Open) {
    state_ = ConnState::Closed;
    Error err = stream_->Close();
    if (err != Error::OK) {
      NETCONN_LOG_DEBUG("close {}: {}", stream_->RemoteAddress(),
                        ErrorString(err));
    }
  }
  return Error::OK;
}

bool Conn::IsClosed() const { return State() == ConnState::Closed; }

ConnState Conn::State() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return state_;
}

bool Conn::CheckHalfClosed() {
  Stream* stream = nullptr;
  {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    if (state_ == ConnState::Closed || !stream_) {
      return true;
    }
    stream = stream_.get();
  }

  if (stream->SetReadDeadline(Clock::now() +
                              config_.half_close_probe_timeout) != Error::OK) {
    Close();
    return true;
  }

  // Read from the stream itself so buffered application data is untouched
  uint8_t probe = 0;
  auto result = stream->Read(&probe, 1);
  if (result.error == Error::EOF_) {
    NETCONN_LOG_DEBUG("peer {} closed its side", stream->RemoteAddress());
    Close();
    return true;
  }
  if (result.value > 0) {
    reader_->Append(&probe, result.value);
  }

  if (stream->SetReadDeadline(kNoDeadline) != Error::OK) {
    Close();
    return true;
  }
  return false;
}

std::string Conn::RemoteAddress() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return stream_ ? stream_->RemoteAddress() : std::string();
}

std::string Conn::LocalAddress() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return stream_ ? stream_->LocalAddress() : std::string();
}

Error Conn::SetDeadline(Deadline t) { return stream_->SetDeadline(t); }

Error Conn::SetReadDeadline(Deadline t) { return stream_->SetReadDeadline(t); }

}  // namespace netconn

#ifndef NETCONN_CHANNEL_HPP
#define NETCONN_CHANNEL_HPP

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "netconn/errors.hpp"
#include "netconn/types.hpp"

namespace netconn {

// Bounded FIFO hand-off between producer and consumer threads.
// Send blocks while `capacity` items are waiting; Close wakes everyone and
// drops undelivered items.
template <typename T>
class HandoffChannel {
 public:
  explicit HandoffChannel(size_t capacity = kDefaultPendingAccepts)
      : capacity_(std::max<size_t>(capacity, 1)) {}

  HandoffChannel(const HandoffChannel&) = delete;
  HandoffChannel& operator=(const HandoffChannel&) = delete;

  // Enqueue an item, blocking while the channel is full.
  // Returns Error::ChannelClosed (leaving `item` untouched) once closed.
  Error Send(T&& item) {
    std::unique_lock<std::mutex> lock(mtx_);
    send_cv_.wait(lock,
                  [this]() { return queue_.size() < capacity_ || closed_; });
    if (closed_) {
      return Error::ChannelClosed;
    }
    queue_.push_back(std::move(item));
    recv_cv_.notify_one();
    return Error::OK;
  }

  // Dequeue the oldest item, blocking until one arrives or the channel
  // closes.
  Result<T> Receive() {
    std::unique_lock<std::mutex> lock(mtx_);
    recv_cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
    if (closed_) {
      return {T{}, Error::ChannelClosed};
    }
    T item = std::move(queue_.front());
    queue_.pop_front();
    send_cv_.notify_one();
    return {std::move(item), Error::OK};
  }

  // Close the channel. Returns false if it was already closed.
  bool Close() {
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) {
        return false;
      }
      closed_ = true;
      dropped.swap(queue_);
    }
    send_cv_.notify_all();
    recv_cv_.notify_all();
    return true;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  size_t Capacity() const { return capacity_; }

 private:
  const size_t capacity_;

  mutable std::mutex mtx_;
  std::condition_variable send_cv_;
  std::condition_variable recv_cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

}  // namespace netconn

#endif  // NETCONN_CHANNEL_HPP

#ifndef UDSCORE_FRAME_QUEUE_HPP
#define UDSCORE_FRAME_QUEUE_HPP

/**
 * @file frame_queue.hpp
 * @brief Bounded FIFO channel between the receiver thread and the caller
 *
 * One producer (the Connection receiver), one consumer (the protocol
 * caller). Items come out in exactly the order they went in.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace udscore {

template <typename T>
class BoundedQueue {
public:
  /// Longer timeouts would overflow the steady_clock deadline
  static constexpr std::chrono::hours kMaxWait{24 * 365 * 100};

  explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  /**
   * @brief Append an item without blocking
   * @return false if the queue is full; the item is not stored
   */
  bool try_push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.size() >= capacity_) return false;
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Take the oldest item, waiting up to timeout for one to arrive
   *
   * A timeout above kMaxWait waits until an item arrives.
   * @return nullopt on timeout
   */
  std::optional<T> pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return !items_.empty(); };
    if (timeout > kMaxWait) {
      cv_.wait(lock, ready);
    } else if (!cv_.wait_for(lock, timeout, ready)) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  /// Take the oldest item if there is one
  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  /// Drop everything queued, returns how many items were discarded
  size_t clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = items_.size();
    items_.clear();
    return n;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }
  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  std::deque<T> items_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace udscore

#endif // UDSCORE_FRAME_QUEUE_HPP

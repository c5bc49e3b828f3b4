// Bounded drop-oldest queue between the capture and writer workers.
//
// The producer never blocks: when the queue is full the oldest element is
// evicted and handed back so the caller can account for it. The consumer
// waits with a bound, so shutdown is always observed.
//
// Sample:
//   DropOldestQueue<Frame> q(16);
//   if (auto evicted = q.push(std::move(frame))) { ++dropped; }
//   auto next = q.pop(std::chrono::milliseconds(200));

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace bathycat {

template <typename T>
class DropOldestQueue {
public:
  explicit DropOldestQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("DropOldestQueue capacity must be at least 1");
    }
  }

  DropOldestQueue(const DropOldestQueue&) = delete;
  DropOldestQueue& operator=(const DropOldestQueue&) = delete;

  /// Enqueue without blocking. Returns whatever did not stay in the queue:
  /// the evicted oldest element when full, or `item` itself once closed.
  std::optional<T> push(T item) {
    std::optional<T> rejected;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) {
        return std::optional<T>(std::move(item));
      }
      if (items_.size() >= capacity_) {
        rejected.emplace(std::move(items_.front()));
        items_.pop_front();
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return rejected;
  }

  /// Wait up to `timeout` for the oldest element. Empty result on timeout,
  /// or immediately once the queue is closed and drained.
  template <typename Rep, typename Period>
  std::optional<T> pop(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    return take_front_locked();
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mtx_);
    return take_front_locked();
  }

  /// No further pushes are accepted; queued elements can still be popped.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }
  std::size_t capacity() const { return capacity_; }

private:
  std::optional<T> take_front_locked() {
    if (items_.empty()) return std::nullopt;
    std::optional<T> out(std::move(items_.front()));
    items_.pop_front();
    return out;
  }

  const std::size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace bathycat

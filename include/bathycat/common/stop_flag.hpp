#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bathycat {

/// Stop request for one worker. Every sleep a worker does goes through
/// wait_for(), so a stop is seen within one call.
class StopFlag {
public:
  void request() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      stop_ = true;
    }
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    stop_ = false;
  }

  bool requested() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stop_;
  }

  /// Sleep up to `d`. Returns true if a stop was requested.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, d, [this] { return stop_; });
  }

  template <typename Clock, typename Duration>
  bool wait_until(std::chrono::time_point<Clock, Duration> t) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_until(lock, t, [this] { return stop_; });
  }

private:
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  bool stop_ = false;
};

}  // namespace bathycat

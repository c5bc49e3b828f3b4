#pragma once

#include <cstdint>
#include <mutex>

namespace bathycat {

/// Per-session counters. Plain value; copies are snapshots.
struct SessionStats {
  // Frames
  uint64_t frames_captured = 0;
  uint64_t frames_dropped_queue = 0;   // evicted by drop-oldest
  uint64_t frames_dropped_write = 0;   // storage failed after all retries
  uint64_t frames_written = 0;
  uint64_t frames_unpositioned = 0;
  uint64_t frames_untagged = 0;        // written without EXIF
  uint64_t bytes_written = 0;
  uint64_t storage_retries = 0;

  // Retention
  uint64_t cleanup_runs = 0;
  uint64_t cleanup_files_removed = 0;
  uint64_t cleanup_bytes_freed = 0;

  // Capture failures, total and by cause
  uint64_t capture_failures = 0;
  uint64_t capture_not_acquired = 0;
  uint64_t capture_not_ready = 0;
  uint64_t capture_empty_buffer = 0;
  uint64_t device_reinitializations = 0;

  // GPS input
  uint64_t sentences_parsed = 0;
  uint64_t sentences_rejected_checksum = 0;
  uint64_t sentences_rejected_malformed = 0;
  uint64_t sentences_unrecognized = 0;
  uint64_t time_regressions_rejected = 0;
  uint64_t gps_reopen_attempts = 0;

  // Clock
  uint64_t clock_corrections = 0;
  uint64_t clock_sync_failures = 0;

  uint64_t sentences_rejected() const {
    return sentences_rejected_checksum + sentences_rejected_malformed;
  }
  uint64_t frames_dropped() const {
    return frames_dropped_queue + frames_dropped_write;
  }
};

/// The single synchronization point every component updates counters through.
/// The lock is held only for the duration of the mutation.
class StatsRegistry {
public:
  template <typename Fn>
  void update(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    fn(stats_);
  }

  SessionStats snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stats_;
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    stats_ = SessionStats{};
  }

private:
  mutable std::mutex mtx_;
  SessionStats stats_;
};

}  // namespace bathycat

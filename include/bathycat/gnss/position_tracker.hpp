#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "bathycat/common/config.hpp"
#include "bathycat/common/measured.hpp"
#include "bathycat/common/time.hpp"
#include "bathycat/gnss/gps_fix.hpp"
#include "bathycat/gnss/nmea_decoder.hpp"

namespace bathycat::gnss {

/// The merged fix as it stood right after one position update.
struct PositionSample {
  GpsFix fix;
  Measured<WallTime> utc_time;   // absolute, needs a date from RMC
  SteadyTime received_at{};
};

/// Point-in-time copy of the tracker state.
struct PositionSnapshot {
  GpsFix fix;
  Measured<WallTime> utc_time;
  SteadyTime position_received_at{};  // meaningless until fix.has_position()
  SteadyTime time_received_at{};      // meaningless while utc_time is absent
  std::chrono::nanoseconds age{0};    // now - position_received_at
  bool valid = false;                 // position present and younger than staleness

  /// GPS time carried forward to `now` by the monotonic time since it was read.
  std::optional<WallTime> gps_time_at(SteadyTime now) const;
};

/// What a single update() changed.
struct UpdateResult {
  bool position_updated = false;
  bool time_updated = false;
  bool time_rejected = false;    // out-of-order time, left untouched
};

/// Owns the single best-known GPS fix. Writers are the GPS reader thread;
/// readers are the writer and clock-sync threads. Every access copies under
/// one short lock, so position and its timestamps always change together.
class PositionTracker {
public:
  explicit PositionTracker(const PositionParams& params = PositionParams{});

  PositionTracker(const PositionTracker&) = delete;
  PositionTracker& operator=(const PositionTracker&) = delete;

  UpdateResult update(const NmeaSentence& sentence, SteadyTime now);
  UpdateResult update(const NmeaSentence& sentence) {
    return update(sentence, SteadyClock::now());
  }

  PositionSnapshot snapshot(SteadyTime now) const;
  PositionSnapshot snapshot() const { return snapshot(SteadyClock::now()); }

  /// Freshest history entry received within `tolerance` of `t` (either side).
  std::optional<PositionSample> position_near(SteadyTime t,
                                              std::chrono::nanoseconds tolerance) const;

  /// Block until a position received after `t` exists, or until `deadline`.
  /// Returns true if one is available.
  bool wait_for_position_after(SteadyTime t, SteadyTime deadline) const;

  /// Wake every waiter, e.g. on shutdown.
  void notify_all() const { cv_.notify_all(); }

  std::size_t history_size() const;

private:
  UpdateResult merge_time_locked(const NmeaSentence& sentence, SteadyTime now);

  const std::chrono::nanoseconds staleness_;
  const std::size_t history_capacity_;

  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;

  GpsFix fix_;
  Measured<WallTime> utc_time_;
  std::optional<CivilDate> last_date_;
  SteadyTime position_received_at_{};
  SteadyTime time_received_at_{};
  bool gga_seen_ = false;

  std::deque<PositionSample> history_;
};

}  // namespace bathycat::gnss

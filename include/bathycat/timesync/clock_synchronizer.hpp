#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

#include <rclcpp/rclcpp.hpp>

#include "bathycat/common/config.hpp"
#include "bathycat/common/session_stats.hpp"
#include "bathycat/common/stop_flag.hpp"
#include "bathycat/common/time.hpp"
#include "bathycat/gnss/position_tracker.hpp"
#include "bathycat/timesync/system_clock.hpp"

namespace bathycat::timesync {

enum class SyncState : uint8_t {
  kIdle = 0,
  kEvaluating = 1,
  kCorrecting = 2,
};

enum class SyncOutcome : uint8_t {
  kNotQualified,     // no usable GPS time in the snapshot
  kWithinThreshold,
  kCoolingDown,
  kBusy,             // another correction is in progress
  kCorrected,
  kFailed,
};

const char* to_string(SyncOutcome o);

struct SyncResult {
  SyncOutcome outcome = SyncOutcome::kNotQualified;
  std::chrono::nanoseconds drift{0};   // system - gps, signed
  std::string error;                   // set for kFailed
};

/// Steps the system clock to GPS time when they drift apart.
///
/// At most one correction attempt per cooldown interval, successful or not.
/// The network-time client is suspended for the duration of the step and
/// put back the way it was afterwards.
class ClockSynchronizer {
public:
  /// `ntp` may be null when there is no network-time client to manage.
  ClockSynchronizer(gnss::PositionTracker& tracker,
                    SystemClock& clock,
                    NetworkTimeService* ntp,
                    StatsRegistry& stats,
                    const ClockSyncParams& params);
  ~ClockSynchronizer();

  ClockSynchronizer(const ClockSynchronizer&) = delete;
  ClockSynchronizer& operator=(const ClockSynchronizer&) = delete;

  /// One Idle -> Evaluating -> (Correcting) -> Idle pass over `snap`.
  SyncResult evaluate(const gnss::PositionSnapshot& snap, SteadyTime now);

  bool start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  SyncState state() const { return state_.load(std::memory_order_acquire); }

private:
  void run();
  SyncResult correct(WallTime gps_now, std::chrono::nanoseconds drift, SteadyTime now,
                     SteadyTime call_start);

  gnss::PositionTracker& tracker_;
  SystemClock& clock_;
  NetworkTimeService* ntp_;
  StatsRegistry& stats_;
  ClockSyncParams params_;

  std::atomic<SyncState> state_{SyncState::kIdle};
  std::optional<SteadyTime> last_attempt_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  StopFlag stop_;

  rclcpp::Logger logger_;
};

}  // namespace bathycat::timesync

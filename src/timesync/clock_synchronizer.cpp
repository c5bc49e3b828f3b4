#include "bathycat/timesync/clock_synchronizer.hpp"

#include "bathycat/common/errors.hpp"

namespace bathycat::timesync {

namespace {

/// Suspends the network-time client for its lifetime, then restores the
/// state it found. Restore runs on every exit path of a correction.
class NtpSuspension {
public:
  NtpSuspension(NetworkTimeService* ntp, const rclcpp::Logger& logger)
    : ntp_(ntp), logger_(logger) {
    if (!ntp_) return;
    try {
      if (ntp_->is_active()) {
        ntp_->set_active(false);
        suspended_ = true;
      }
    } catch (const TimeSyncError& e) {
      // Stepping can still work; timesyncd may just pull the clock back later.
      RCLCPP_WARN(logger_, "Could not suspend network time sync: %s", e.what());
    }
  }

  ~NtpSuspension() {
    if (!suspended_) return;
    try {
      ntp_->set_active(true);
    } catch (const TimeSyncError& e) {
      RCLCPP_ERROR(logger_, "Could not restore network time sync: %s", e.what());
    }
  }

  NtpSuspension(const NtpSuspension&) = delete;
  NtpSuspension& operator=(const NtpSuspension&) = delete;

private:
  NetworkTimeService* ntp_;
  rclcpp::Logger logger_;
  bool suspended_ = false;
};

/// Sets the state for one evaluation and drops back to Idle on scope exit.
class StateScope {
public:
  explicit StateScope(std::atomic<SyncState>& s) : s_(s) {}
  ~StateScope() { s_.store(SyncState::kIdle, std::memory_order_release); }
  StateScope(const StateScope&) = delete;
  StateScope& operator=(const StateScope&) = delete;

private:
  std::atomic<SyncState>& s_;
};

}  // namespace

const char* to_string(SyncOutcome o) {
  switch (o) {
    case SyncOutcome::kNotQualified:    return "not_qualified";
    case SyncOutcome::kWithinThreshold: return "within_threshold";
    case SyncOutcome::kCoolingDown:     return "cooling_down";
    case SyncOutcome::kBusy:            return "busy";
    case SyncOutcome::kCorrected:       return "corrected";
    case SyncOutcome::kFailed:          return "failed";
  }
  return "unknown";
}

ClockSynchronizer::ClockSynchronizer(gnss::PositionTracker& tracker,
                                     SystemClock& clock,
                                     NetworkTimeService* ntp,
                                     StatsRegistry& stats,
                                     const ClockSyncParams& params)
  : tracker_(tracker),
    clock_(clock),
    ntp_(params.manage_ntp ? ntp : nullptr),
    stats_(stats),
    params_(params),
    logger_(rclcpp::get_logger("bathycat.clock_sync")) {}

ClockSynchronizer::~ClockSynchronizer() {
  stop();
}

SyncResult ClockSynchronizer::evaluate(const gnss::PositionSnapshot& snap, SteadyTime now) {
  const SteadyTime call_start = SteadyClock::now();
  SyncResult result;

  SyncState expected = SyncState::kIdle;
  if (!state_.compare_exchange_strong(expected, SyncState::kEvaluating,
                                      std::memory_order_acq_rel)) {
    result.outcome = SyncOutcome::kBusy;
    return result;
  }
  StateScope scope(state_);

  if (!snap.valid || snap.fix.fix_quality == gnss::FixQuality::kNone) {
    return result;
  }
  const auto gps_now = snap.gps_time_at(now);
  if (!gps_now) {
    return result;
  }

  const WallTime system_now = clock_.now();
  result.drift = std::chrono::duration_cast<std::chrono::nanoseconds>(system_now - *gps_now);
  const auto magnitude = result.drift < std::chrono::nanoseconds::zero() ? -result.drift
                                                                         : result.drift;
  if (magnitude <= from_seconds(params_.drift_threshold_sec)) {
    result.outcome = SyncOutcome::kWithinThreshold;
    return result;
  }

  if (last_attempt_ && now - *last_attempt_ < from_seconds(params_.cooldown_sec)) {
    result.outcome = SyncOutcome::kCoolingDown;
    return result;
  }

  state_.store(SyncState::kCorrecting, std::memory_order_release);
  return correct(*gps_now, result.drift, now, call_start);
}

SyncResult ClockSynchronizer::correct(WallTime gps_now, std::chrono::nanoseconds drift,
                                      SteadyTime now, SteadyTime call_start) {
  SyncResult result;
  result.drift = drift;
  last_attempt_ = now;

  try {
    NtpSuspension suspension(ntp_, logger_);
    // Account for the time spent evaluating and talking to timesyncd.
    const auto spent = SteadyClock::now() - call_start;
    clock_.set(gps_now + std::chrono::duration_cast<WallClock::duration>(spent));
  } catch (const TimeSyncError& e) {
    stats_.update([](SessionStats& s) { ++s.clock_sync_failures; });
    RCLCPP_WARN(logger_, "System clock correction failed (drift %.3f s), retry in %.0f s: %s",
                to_seconds(drift), params_.cooldown_sec, e.what());
    result.outcome = SyncOutcome::kFailed;
    result.error = e.what();
    return result;
  }

  stats_.update([](SessionStats& s) { ++s.clock_corrections; });
  RCLCPP_INFO(logger_, "System clock stepped to GPS time %s (was off by %.3f s)",
              format_iso8601(gps_now).c_str(), to_seconds(drift));
  result.outcome = SyncOutcome::kCorrected;
  return result;
}

bool ClockSynchronizer::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  stop_.reset();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&ClockSynchronizer::run, this);
  RCLCPP_INFO(logger_, "Clock sync started (threshold %.1f s, cooldown %.0f s)",
              params_.drift_threshold_sec, params_.cooldown_sec);
  return true;
}

void ClockSynchronizer::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  stop_.request();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_.store(false, std::memory_order_release);
}

void ClockSynchronizer::run() {
  const auto interval = from_seconds(params_.check_interval_sec);
  while (!stop_.wait_for(interval)) {
    const SteadyTime now = SteadyClock::now();
    try {
      evaluate(tracker_.snapshot(now), now);
    } catch (const TimeSyncError& e) {
      RCLCPP_WARN(logger_, "Clock sync evaluation failed: %s", e.what());
    }
  }
}

}  // namespace bathycat::timesync

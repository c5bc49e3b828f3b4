#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "bathycat/common/time.hpp"

namespace bathycat::timesync {

/// The realtime clock the pipeline reads and, when allowed, sets.
class SystemClock {
public:
  virtual ~SystemClock() = default;

  virtual WallTime now() const = 0;

  /// Step the clock. Throws TimeSyncError if the OS refuses.
  virtual void set(WallTime t) = 0;
};

/// The network-time client that would otherwise fight a manual step.
class NetworkTimeService {
public:
  virtual ~NetworkTimeService() = default;

  /// Throws TimeSyncError if the state cannot be read.
  virtual bool is_active() = 0;

  /// Throws TimeSyncError if the change is refused.
  virtual void set_active(bool active) = 0;
};

/// CLOCK_REALTIME through clock_gettime / clock_settime.
/// Setting needs CAP_SYS_TIME.
class PosixSystemClock : public SystemClock {
public:
  WallTime now() const override;
  void set(WallTime t) override;
};

/// systemd-timesyncd through `timedatectl`.
class TimedatectlService : public NetworkTimeService {
public:
  explicit TimedatectlService(std::chrono::milliseconds command_timeout =
                                  std::chrono::milliseconds(5000));

  bool is_active() override;
  void set_active(bool active) override;

private:
  /// Runs timedatectl with `args`; returns its stdout. Throws TimeSyncError
  /// on spawn failure, non-zero exit, or timeout.
  std::string run(const std::vector<std::string>& args);

  std::chrono::milliseconds command_timeout_;
};

}  // namespace bathycat::timesync

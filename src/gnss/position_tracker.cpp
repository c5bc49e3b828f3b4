#include "bathycat/gnss/position_tracker.hpp"

#include <stdexcept>

namespace bathycat::gnss {

namespace {
// A date-less time of day wraps to the next UTC day only across midnight:
// the last one late in the day, the new one early.
constexpr auto kLateInDay = std::chrono::hours(23);
constexpr auto kEarlyInDay = std::chrono::hours(1);

WallClock::duration time_of_day(WallTime t) {
  return t - make_utc(civil_date_of(t), std::chrono::microseconds(0));
}
}  // namespace

std::optional<WallTime> PositionSnapshot::gps_time_at(SteadyTime now) const {
  if (!utc_time.is_valid()) return std::nullopt;
  return utc_time.value() +
         std::chrono::duration_cast<WallClock::duration>(now - time_received_at);
}

PositionTracker::PositionTracker(const PositionParams& params)
  : staleness_(from_seconds(params.staleness_sec)),
    history_capacity_(params.history_size) {
  if (history_capacity_ == 0) {
    throw std::invalid_argument("PositionTracker history_size must be at least 1");
  }
}

UpdateResult PositionTracker::update(const NmeaSentence& sentence, SteadyTime now) {
  if (sentence.type == SentenceType::kUnrecognized) {
    return {};
  }

  const GpsFix& in = sentence.fix;
  const bool is_gga = sentence.type == SentenceType::kGga;

  std::unique_lock<std::mutex> lock(mtx_);

  UpdateResult result = merge_time_locked(sentence, now);

  // Receiver status
  if (is_gga) {
    gga_seen_ = true;
    fix_.fix_quality = in.fix_quality;
    fix_.satellites_used = in.satellites_used;
    fix_.horizontal_dilution = in.horizontal_dilution;
  } else if (!sentence.fix_valid) {
    fix_.fix_quality = FixQuality::kNone;
  } else if (!gga_seen_) {
    fix_.fix_quality = FixQuality::kGps;
  }

  // Position: latitude and longitude move as one unit, only on a real fix.
  if (sentence.fix_valid && in.has_position()) {
    fix_.latitude_deg = in.latitude_deg;
    fix_.longitude_deg = in.longitude_deg;
    if (is_gga) {
      fix_.altitude_m = in.altitude_m;
    }
    position_received_at_ = now;

    history_.push_back(PositionSample{fix_, utc_time_, now});
    while (history_.size() > history_capacity_) {
      history_.pop_front();
    }
    result.position_updated = true;
  }

  lock.unlock();
  if (result.position_updated) {
    cv_.notify_all();
  }
  return result;
}

UpdateResult PositionTracker::merge_time_locked(const NmeaSentence& sentence, SteadyTime now) {
  UpdateResult result;
  const GpsFix& in = sentence.fix;
  // Receivers without a fix report RTC or default times; never trust them.
  if (!sentence.fix_valid || !in.utc_time_of_day.is_valid()) {
    return result;
  }

  const bool dated = in.utc_date.is_valid();
  if (!dated && !last_date_) {
    // Time of day only, until the first RMC supplies a date.
    fix_.utc_time_of_day = in.utc_time_of_day;
    time_received_at_ = now;
    result.time_updated = true;
    return result;
  }

  const CivilDate date = dated ? in.utc_date.value() : *last_date_;
  WallTime candidate = make_utc(date, in.utc_time_of_day.value());
  if (utc_time_.is_valid() && candidate < utc_time_.value()) {
    const WallTime last = utc_time_.value();
    const bool rollover = !dated && time_of_day(last) >= kLateInDay &&
                          in.utc_time_of_day.value() < kEarlyInDay;
    if (!rollover) {
      result.time_rejected = true;
      return result;
    }
    candidate += std::chrono::hours(24);
  }

  utc_time_ = Measured<WallTime>::valid(candidate);
  last_date_ = civil_date_of(candidate);
  fix_.utc_time_of_day = in.utc_time_of_day;
  fix_.utc_date = Measured<CivilDate>::valid(*last_date_);
  time_received_at_ = now;
  result.time_updated = true;
  return result;
}

PositionSnapshot PositionTracker::snapshot(SteadyTime now) const {
  std::lock_guard<std::mutex> lock(mtx_);
  PositionSnapshot s;
  s.fix = fix_;
  s.utc_time = utc_time_;
  s.position_received_at = position_received_at_;
  s.time_received_at = time_received_at_;
  if (fix_.has_position()) {
    s.age = now - position_received_at_;
    s.valid = s.age < staleness_;
  }
  return s;
}

std::optional<PositionSample> PositionTracker::position_near(
    SteadyTime t, std::chrono::nanoseconds tolerance) const {
  std::lock_guard<std::mutex> lock(mtx_);
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    const auto diff = (it->received_at > t) ? (it->received_at - t) : (t - it->received_at);
    if (diff <= tolerance) {
      return *it;
    }
  }
  return std::nullopt;
}

bool PositionTracker::wait_for_position_after(SteadyTime t, SteadyTime deadline) const {
  std::unique_lock<std::mutex> lock(mtx_);
  return cv_.wait_until(lock, deadline, [&] {
    return !history_.empty() && history_.back().received_at > t;
  });
}

std::size_t PositionTracker::history_size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return history_.size();
}

}  // namespace bathycat::gnss

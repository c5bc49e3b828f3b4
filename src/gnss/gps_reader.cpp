#include "bathycat/gnss/gps_reader.hpp"

#include <algorithm>

#include "bathycat/common/errors.hpp"
#include "bathycat/gnss/nmea_decoder.hpp"

namespace bathycat::gnss {

GpsReader::GpsReader(std::unique_ptr<LineSource> source,
                     PositionTracker& tracker,
                     StatsRegistry& stats,
                     const GpsParams& params)
  : source_(std::move(source)),
    tracker_(tracker),
    stats_(stats),
    params_(params),
    backoff_(from_seconds(params.reopen_backoff_sec)),
    logger_(rclcpp::get_logger("bathycat.gps")) {}

GpsReader::~GpsReader() {
  stop();
}

bool GpsReader::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  stop_.reset();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&GpsReader::run, this);
  RCLCPP_INFO(logger_, "GPS reader started on %s", source_->describe().c_str());
  return true;
}

void GpsReader::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  stop_.request();
  if (thread_.joinable()) {
    thread_.join();
  }
  source_->close();
  running_.store(false, std::memory_order_release);
  RCLCPP_INFO(logger_, "GPS reader stopped");
}

bool GpsReader::try_open() {
  if (opened_once_) {
    stats_.update([](SessionStats& s) { ++s.gps_reopen_attempts; });
  }

  try {
    source_->open();
  } catch (const DeviceError& e) {
    RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 10000,
                         "GPS open failed, retrying in %.1f s: %s",
                         to_seconds(backoff_), e.what());
    stop_.wait_for(backoff_);
    backoff_ = std::min(backoff_ * 2, from_seconds(params_.reopen_backoff_max_sec));
    return false;
  }

  RCLCPP_INFO(logger_, "GPS source %s open", source_->describe().c_str());
  opened_once_ = true;
  backoff_ = from_seconds(params_.reopen_backoff_sec);
  return true;
}

void GpsReader::run() {
  const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
      from_seconds(params_.read_timeout_sec));

  while (!stop_.requested()) {
    if (!source_->is_open() && !try_open()) {
      continue;
    }

    try {
      auto line = source_->read_line(timeout);
      if (line) {
        process_line(*line, SteadyClock::now());
      }
    } catch (const DeviceError& e) {
      RCLCPP_WARN(logger_, "GPS device error, reopening: %s", e.what());
      source_->close();
    }
  }
}

bool GpsReader::process_line(const std::string& line, SteadyTime now) {
  NmeaSentence sentence;
  try {
    sentence = decode_nmea(line);
  } catch (const ChecksumError& e) {
    stats_.update([](SessionStats& s) { ++s.sentences_rejected_checksum; });
    RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 5000, "%s", e.what());
    return false;
  } catch (const MalformedSentenceError& e) {
    stats_.update([](SessionStats& s) { ++s.sentences_rejected_malformed; });
    RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 5000, "%s", e.what());
    return false;
  }

  if (sentence.type == SentenceType::kUnrecognized) {
    stats_.update([](SessionStats& s) { ++s.sentences_unrecognized; });
    return false;
  }

  const UpdateResult r = tracker_.update(sentence, now);
  stats_.update([&r](SessionStats& s) {
    ++s.sentences_parsed;
    if (r.time_rejected) ++s.time_regressions_rejected;
  });

  if (r.time_rejected) {
    RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 5000,
                         "Out-of-order GPS time in %s%s ignored",
                         sentence.talker.c_str(), sentence.formatter.c_str());
  }

  // Log fix transitions only, not every sentence.
  if (sentence.fix_valid && r.position_updated && !had_fix_) {
    had_fix_ = true;
    RCLCPP_INFO(logger_, "GPS fix acquired (%s): %.6f, %.6f",
                to_string(sentence.fix.fix_quality),
                sentence.fix.latitude_deg.value(), sentence.fix.longitude_deg.value());
  } else if (!sentence.fix_valid && had_fix_) {
    had_fix_ = false;
    RCLCPP_WARN(logger_, "GPS fix lost (%s%s reports no fix)",
                sentence.talker.c_str(), sentence.formatter.c_str());
  }
  return true;
}

}  // namespace bathycat::gnss

#include "bathycat/storage/geotag_writer.hpp"

#include "bathycat/common/errors.hpp"
#include "bathycat/storage/exif_tagger.hpp"

namespace bathycat::storage {

GeotagWriter::GeotagWriter(camera::FrameQueue& queue,
                           gnss::PositionTracker& tracker,
                           Storage& storage,
                           StatsRegistry& stats,
                           const WriterParams& params)
  : queue_(queue),
    tracker_(tracker),
    storage_(storage),
    stats_(stats),
    params_(params),
    logger_(rclcpp::get_logger("bathycat.writer")) {}

GeotagWriter::~GeotagWriter() {
  abort();
  stop();
}

bool GeotagWriter::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  abort_.reset();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&GeotagWriter::run, this);
  RCLCPP_INFO(logger_, "Writer started, storage root %s", storage_.root().c_str());
  return true;
}

void GeotagWriter::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  queue_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_.store(false, std::memory_order_release);
  RCLCPP_INFO(logger_, "Writer stopped");
}

void GeotagWriter::abort() {
  abort_.request();
  tracker_.notify_all();
}

void GeotagWriter::run() {
  const auto timeout = from_seconds(params_.dequeue_timeout_sec);
  while (true) {
    auto frame = queue_.pop(timeout);
    if (frame) {
      process(std::move(*frame));
    } else if (queue_.closed()) {
      break;  // closed and drained
    }
  }
}

std::optional<PositionAtCapture> GeotagWriter::pair(const camera::Frame& frame) {
  const auto tolerance = from_seconds(params_.pairing_tolerance_sec);
  const SteadyTime capture = frame.captured_steady;

  auto sample = tracker_.position_near(capture, tolerance);
  if (!sample) {
    // Only worth waiting while the receiver is producing fixes at all.
    const SteadyTime deadline = capture + tolerance;
    if (SteadyClock::now() < deadline && tracker_.snapshot().valid && !abort_.requested() &&
        tracker_.wait_for_position_after(capture, deadline)) {
      sample = tracker_.position_near(capture, tolerance);
    }
  }
  if (!sample) {
    return std::nullopt;
  }

  PositionAtCapture p;
  p.latitude_deg = sample->fix.latitude_deg.value();
  p.longitude_deg = sample->fix.longitude_deg.value();
  p.altitude_m = sample->fix.altitude_m;
  p.fix_quality = sample->fix.fix_quality;
  p.satellites_used = sample->fix.satellites_used;
  p.horizontal_dilution = sample->fix.horizontal_dilution;
  p.gps_utc_time = sample->utc_time;
  p.age = capture - sample->received_at;
  return p;
}

GeotaggedRecord GeotagWriter::process(camera::Frame frame) {
  GeotaggedRecord record;
  record.image_path = image_path_for(frame, params_.filename_prefix);
  record.sidecar_path = sidecar_path_for(record.image_path);

  if (storage_failed()) {
    record.frame = std::move(frame);
    record.outcome = WriteOutcome::kDropped;
    stats_.update([](SessionStats& s) { ++s.frames_dropped_write; });
    return record;
  }

  record.position = pair(frame);
  record.frame = std::move(frame);
  tag_image(record);
  ensure_headroom();

  if (write_record(record)) {
    consecutive_drops_ = 0;
    return record;
  }

  record.outcome = WriteOutcome::kDropped;
  stats_.update([](SessionStats& s) { ++s.frames_dropped_write; });
  ++consecutive_drops_;
  if (consecutive_drops_ >= params_.max_consecutive_storage_drops && !storage_failed()) {
    storage_failed_.store(true, std::memory_order_release);
    const std::string what = "storage target " + storage_.root() + " unrecoverable after " +
                             std::to_string(consecutive_drops_) + " dropped records";
    RCLCPP_ERROR(logger_, "%s", what.c_str());
    if (on_fatal_) on_fatal_(what);
  }
  return record;
}

void GeotagWriter::tag_image(GeotaggedRecord& record) {
  if (!params_.embed_exif) return;
  try {
    record.frame.data = embed_exif(record.frame.data, record);
    record.exif_tagged = true;
  } catch (const MetadataError& e) {
    stats_.update([](SessionStats& s) { ++s.frames_untagged; });
    RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 10000,
                         "Frame %lu written without EXIF: %s",
                         static_cast<unsigned long>(record.frame.sequence), e.what());
  }
}

void GeotagWriter::ensure_headroom() {
  if (!params_.auto_cleanup) return;
  const SteadyTime now = SteadyClock::now();
  if (cleanup_ran_ && now - last_cleanup_ < from_seconds(params_.cleanup_interval_sec)) {
    return;
  }

  try {
    const uint64_t free = storage_.free_bytes();
    if (free >= params_.cleanup_free_mb * 1024 * 1024) return;

    cleanup_ran_ = true;
    last_cleanup_ = now;
    RCLCPP_INFO(logger_, "Only %lu MB free on %s, removing images older than %d days",
                static_cast<unsigned long>(free / (1024 * 1024)), storage_.root().c_str(),
                params_.days_to_keep);
    const CleanupResult r =
        storage_.remove_older_than(std::chrono::hours(24) * params_.days_to_keep);
    stats_.update([&r](SessionStats& s) {
      ++s.cleanup_runs;
      s.cleanup_files_removed += r.files;
      s.cleanup_bytes_freed += r.bytes;
    });
    if (r.files > 0) {
      RCLCPP_INFO(logger_, "Cleanup removed %lu files, %.1f MB freed",
                  static_cast<unsigned long>(r.files), r.bytes / (1024.0 * 1024.0));
    } else {
      RCLCPP_WARN(logger_, "Cleanup found no images older than %d days", params_.days_to_keep);
    }
  } catch (const StorageError& e) {
    RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 10000, "Cleanup failed: %s", e.what());
  }
}

bool GeotagWriter::write_record(GeotaggedRecord& record) {
  const camera::Frame& f = record.frame;
  const std::string sidecar = sidecar_json(record).dump(2);
  const auto delay = from_seconds(params_.storage_retry_delay_sec);

  for (int attempt = 1; attempt <= params_.storage_retries; ++attempt) {
    bool image_done = false;
    try {
      storage_.check_ready();
      storage_.write_atomic(record.image_path, f.data.data(), f.data.size());
      image_done = true;
      storage_.write_atomic(record.sidecar_path, sidecar);

      record.outcome = WriteOutcome::kWritten;
      const bool positioned = record.position.has_value();
      const uint64_t bytes = f.data.size() + sidecar.size();
      stats_.update([positioned, bytes](SessionStats& s) {
        ++s.frames_written;
        if (!positioned) ++s.frames_unpositioned;
        s.bytes_written += bytes;
      });
      RCLCPP_DEBUG(logger_, "Wrote %s (%s)", record.image_path.c_str(),
                   positioned ? "positioned" : "unpositioned");
      return true;
    } catch (const StorageError& e) {
      if (image_done) {
        // Never leave an image without its sidecar.
        try {
          storage_.remove(record.image_path);
        } catch (const StorageError& re) {
          RCLCPP_WARN(logger_, "Could not remove orphan image: %s", re.what());
        }
      }
      RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 2000,
                           "Write of frame %lu failed (attempt %d/%d): %s",
                           static_cast<unsigned long>(f.sequence), attempt,
                           params_.storage_retries, e.what());
    }

    if (attempt == params_.storage_retries) break;
    stats_.update([](SessionStats& s) { ++s.storage_retries; });
    if (abort_.wait_for(delay)) break;
  }

  RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 2000,
                       "Dropped frame %lu after %d write attempts",
                       static_cast<unsigned long>(f.sequence), params_.storage_retries);
  return false;
}

}  // namespace bathycat::storage

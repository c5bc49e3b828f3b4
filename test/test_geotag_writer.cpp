// Geotag Writer Test
//
// Purpose: Validate frame / position pairing, sidecar contents, write
// retries, orphan cleanup, storage-failure escalation, EXIF embedding and
// retention cleanup. One test runs the capture and writer workers together
// against a stalled medium.

#include <atomic>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "bathycat/camera/capture_loop.hpp"
#include "bathycat/gnss/nmea_decoder.hpp"
#include "bathycat/gnss/position_tracker.hpp"
#include "bathycat/storage/geotag_writer.hpp"
#include "test_support.hpp"

using namespace bathycat;
using namespace bathycat::storage;
using namespace std::chrono_literals;
using bathycat::test::FakeCamera;
using bathycat::test::gga;
using bathycat::test::make_frame;
using bathycat::test::MemoryStorage;
using bathycat::test::near;
using bathycat::test::tiny_jpeg;

namespace {

WriterParams writer_params() {
  WriterParams p;
  p.pairing_tolerance_sec = 1.0;
  p.filename_prefix = "bathycat";
  p.storage_retries = 3;
  p.storage_retry_delay_sec = 0.01;
  p.max_consecutive_storage_drops = 3;
  p.dequeue_timeout_sec = 0.05;
  return p;
}

gnss::NmeaSentence fix_at(const std::string& lat) {
  return gnss::decode_nmea(gga("101010", lat, 'N', "00007.500", 'W'));
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

// Test 1: Paths follow the dated layout
bool test_paths() {
  camera::Frame f = make_frame(42, SteadyClock::now());
  f.captured_wall = make_utc(CivilDate{2024, 5, 1}, 12h + 34min + 56s + 789ms);
  const std::string image = image_path_for(f, "bathycat");
  CHECK(image == "images/20240501/bathycat_20240501-123456-789_000042.jpg");
  CHECK(sidecar_path_for(image) == "images/20240501/bathycat_20240501-123456-789_000042.json");
  std::cout << "✓ Test 1: Paths - PASSED" << std::endl;
  return true;
}

// Test 2: A fix received half a second after capture is used
bool test_pairs_with_later_fix() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  const SteadyTime capture = SteadyClock::now();
  tracker.update(fix_at("5000.000"), capture - 2s);
  tracker.update(fix_at("5130.000"), capture + 500ms);

  auto p = writer.pair(make_frame(0, capture));
  CHECK(p.has_value());
  CHECK(near(p->latitude_deg, 51.5));
  CHECK(p->age == std::chrono::nanoseconds(-500ms));
  CHECK(p->fix_quality == gnss::FixQuality::kGps);
  CHECK(p->satellites_used.value() == 8);

  // Outside the tolerance: unpositioned.
  CHECK(!writer.pair(make_frame(1, capture - 3s)).has_value());
  std::cout << "✓ Test 2: Pairs with later fix - PASSED" << std::endl;
  return true;
}

// Test 3: The writer waits for a fix still on its way
bool test_waits_for_arriving_fix() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  const SteadyTime capture = SteadyClock::now();
  tracker.update(fix_at("5000.000"), capture - 2s);   // valid, but too old to pair

  std::thread gps([&tracker] {
    std::this_thread::sleep_for(300ms);
    tracker.update(fix_at("5130.000"));
  });
  auto p = writer.pair(make_frame(0, capture));
  gps.join();

  CHECK(p.has_value());
  CHECK(near(p->latitude_deg, 51.5));
  CHECK(p->age < std::chrono::nanoseconds::zero());
  std::cout << "✓ Test 3: Waits for arriving fix - PASSED" << std::endl;
  return true;
}

// Test 4: Positioned and unpositioned sidecars
bool test_sidecar_contents() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  const SteadyTime t = SteadyClock::now();
  auto unpositioned = writer.process(make_frame(0, t - 10s, 100));
  CHECK(unpositioned.outcome == WriteOutcome::kWritten);
  CHECK(!unpositioned.position.has_value());

  tracker.update(fix_at("5130.000"), t);
  auto positioned = writer.process(make_frame(1, t, 200));
  CHECK(positioned.outcome == WriteOutcome::kWritten);
  CHECK(positioned.position.has_value());

  const auto files = storage.files();
  CHECK(files.size() == 4);
  CHECK(files.at(unpositioned.image_path).size() == 100);

  const auto u = nlohmann::json::parse(files.at(unpositioned.sidecar_path));
  CHECK(u.at("positioned") == false);
  CHECK(u.at("sequence") == 0);
  CHECK(u.at("file_size_bytes") == 100);
  CHECK(u.at("device_state") == "ok");
  CHECK(!u.contains("latitude"));
  CHECK(!u.contains("longitude"));
  CHECK(!u.contains("altitude_m"));
  CHECK(!u.contains("fix_quality"));

  const auto j = nlohmann::json::parse(files.at(positioned.sidecar_path));
  CHECK(j.at("positioned") == true);
  CHECK(near(j.at("latitude").get<double>(), 51.5));
  CHECK(near(j.at("longitude").get<double>(), -(7.5 / 60.0)));
  CHECK(near(j.at("altitude_m").get<double>(), 12.5));
  CHECK(j.at("fix_quality") == "gps");
  CHECK(j.at("satellites_used") == 8);
  CHECK(ends_with(positioned.image_path, j.at("filename").get<std::string>()));

  const auto s = stats.snapshot();
  CHECK(s.frames_written == 2);
  CHECK(s.frames_unpositioned == 1);
  CHECK(s.bytes_written > 300);
  std::cout << "✓ Test 4: Sidecar contents - PASSED" << std::endl;
  return true;
}

// Test 5: Transient write failures are retried
bool test_retry() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  storage.fail_writes(2);
  auto r = writer.process(make_frame(0, SteadyClock::now() - 10s));
  CHECK(r.outcome == WriteOutcome::kWritten);
  CHECK(stats.snapshot().storage_retries == 2);
  CHECK(stats.snapshot().frames_written == 1);
  CHECK(storage.files().size() == 2);
  std::cout << "✓ Test 5: Retry - PASSED" << std::endl;
  return true;
}

// Test 6: A failing sidecar never leaves its image behind
bool test_sidecar_failure_removes_image() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  storage.fail_writes_ending_with(".json", 3);
  auto r = writer.process(make_frame(0, SteadyClock::now() - 10s));
  CHECK(r.outcome == WriteOutcome::kDropped);
  CHECK(storage.files().empty());
  CHECK(storage.removed().size() == 3);
  CHECK(storage.removed().front() == r.image_path);

  const auto s = stats.snapshot();
  CHECK(s.frames_dropped_write == 1);
  CHECK(s.frames_written == 0);
  CHECK(s.storage_retries == 2);
  std::cout << "✓ Test 6: Sidecar failure removes image - PASSED" << std::endl;
  return true;
}

// Test 7: Repeated drops mark storage failed and report once
bool test_escalation() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  int fatal_calls = 0;
  std::string fatal_what;
  writer.set_fatal_handler([&](const std::string& what) {
    ++fatal_calls;
    fatal_what = what;
  });

  storage.set_unmounted(true);
  const SteadyTime t = SteadyClock::now() - 10s;
  writer.process(make_frame(0, t));
  writer.process(make_frame(1, t));
  CHECK(!writer.storage_failed());
  writer.process(make_frame(2, t));
  CHECK(writer.storage_failed());
  CHECK(fatal_calls == 1);
  CHECK(fatal_what.find("/mem") != std::string::npos);

  // Once failed, frames are dropped without touching the medium.
  storage.set_unmounted(false);
  auto r = writer.process(make_frame(3, t));
  CHECK(r.outcome == WriteOutcome::kDropped);
  CHECK(storage.files().empty());
  CHECK(fatal_calls == 1);
  CHECK(stats.snapshot().frames_dropped_write == 4);
  std::cout << "✓ Test 7: Escalation - PASSED" << std::endl;
  return true;
}

// Test 8: One success resets the consecutive-drop count
bool test_success_resets_drops() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  const SteadyTime t = SteadyClock::now() - 10s;
  for (int round = 0; round < 3; ++round) {
    storage.fail_writes(6);   // two frames' worth of attempts
    writer.process(make_frame(round * 3, t));
    writer.process(make_frame(round * 3 + 1, t));
    CHECK(writer.process(make_frame(round * 3 + 2, t)).outcome == WriteOutcome::kWritten);
  }
  CHECK(!writer.storage_failed());
  CHECK(stats.snapshot().frames_dropped_write == 6);
  std::cout << "✓ Test 8: Success resets drop count - PASSED" << std::endl;
  return true;
}

// Test 9: Slow storage sheds frames through the queue, never twice
bool test_stalled_storage_with_workers() {
  FakeCamera cam;
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  storage.set_write_delay(100ms);

  CaptureParams cp;
  cp.target_fps = 20.0;
  CameraParams camp;
  camp.read_timeout_sec = 0.05;
  camera::CaptureLoop capture(cam, queue, stats, cp, camp);
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  CHECK(writer.start());
  CHECK(capture.start());
  std::this_thread::sleep_for(1500ms);
  capture.stop();
  writer.stop();

  const auto s = stats.snapshot();
  CHECK(s.frames_dropped_queue > 0);
  CHECK(s.frames_dropped_write == 0);
  CHECK(s.frames_captured == s.frames_written + s.frames_dropped_queue);

  std::set<std::string> images;
  for (const auto& kv : storage.writes_per_path()) {
    CHECK(kv.second == 1);
    if (ends_with(kv.first, ".jpg")) images.insert(kv.first);
  }
  CHECK(images.size() == s.frames_written);
  std::cout << "✓ Test 9: Stalled storage (" << s.frames_captured << " captured, "
            << s.frames_dropped_queue << " evicted) - PASSED" << std::endl;
  return true;
}

// Test 10: JPEG frames are written with EXIF, anything else untagged
bool test_exif_embedding() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  GeotagWriter writer(queue, tracker, storage, stats, writer_params());

  const SteadyTime t = SteadyClock::now();
  tracker.update(fix_at("5130.000"), t);
  camera::Frame jpeg = make_frame(0, t);
  jpeg.data = tiny_jpeg();
  auto tagged = writer.process(std::move(jpeg));
  CHECK(tagged.outcome == WriteOutcome::kWritten);
  CHECK(tagged.exif_tagged);

  const auto files = storage.files();
  const std::string& image = files.at(tagged.image_path);
  CHECK(image.size() > tiny_jpeg().size());
  CHECK(image.find(std::string("Exif\0\0", 6)) != std::string::npos);
  const auto j = nlohmann::json::parse(files.at(tagged.sidecar_path));
  CHECK(j.at("exif_tagged") == true);
  CHECK(j.at("file_size_bytes") == image.size());

  auto raw = writer.process(make_frame(1, t, 300));
  CHECK(raw.outcome == WriteOutcome::kWritten);
  CHECK(!raw.exif_tagged);
  CHECK(storage.files().at(raw.image_path).size() == 300);

  auto params = writer_params();
  params.embed_exif = false;
  GeotagWriter plain(queue, tracker, storage, stats, params);
  camera::Frame untouched = make_frame(2, t);
  untouched.data = tiny_jpeg();
  CHECK(!plain.process(std::move(untouched)).exif_tagged);

  const auto s = stats.snapshot();
  CHECK(s.frames_written == 3);
  CHECK(s.frames_untagged == 1);
  std::cout << "✓ Test 10: EXIF embedding - PASSED" << std::endl;
  return true;
}

// Test 11: Low headroom removes old images, at most once per interval
bool test_cleanup_on_low_headroom() {
  camera::FrameQueue queue(4);
  gnss::PositionTracker tracker;
  MemoryStorage storage;
  StatsRegistry stats;
  auto params = writer_params();
  params.cleanup_free_mb = 50;
  params.days_to_keep = 30;
  params.cleanup_interval_sec = 60.0;
  GeotagWriter writer(queue, tracker, storage, stats, params);

  const WallTime now = WallClock::now();
  storage.put("images/20240301/old.jpg", std::string(4096, 'a'), now - std::chrono::hours(24 * 40));
  storage.put("images/20240301/old.json", std::string(64, 'b'), now - std::chrono::hours(24 * 40));
  storage.put("images/20240420/recent.jpg", std::string(10, 'c'), now - std::chrono::hours(24 * 10));
  storage.put("sessions/session_20240301-000000.json", "{}", now - std::chrono::hours(24 * 40));

  // Plenty of room: nothing happens.
  writer.process(make_frame(0, SteadyClock::now() - 10s));
  CHECK(storage.cleanup_calls() == 0);

  storage.set_free_bytes(10 * 1024 * 1024);
  auto r = writer.process(make_frame(1, SteadyClock::now() - 10s));
  CHECK(r.outcome == WriteOutcome::kWritten);
  CHECK(storage.cleanup_calls() == 1);

  const auto files = storage.files();
  CHECK(files.count("images/20240301/old.jpg") == 0);
  CHECK(files.count("images/20240301/old.json") == 0);
  CHECK(files.count("images/20240420/recent.jpg") == 1);
  CHECK(files.count("sessions/session_20240301-000000.json") == 1);
  CHECK(files.count(r.image_path) == 1);

  // Still short of room, but the interval has not passed.
  writer.process(make_frame(2, SteadyClock::now() - 10s));
  CHECK(storage.cleanup_calls() == 1);

  const auto s = stats.snapshot();
  CHECK(s.cleanup_runs == 1);
  CHECK(s.cleanup_files_removed == 2);
  CHECK(s.cleanup_bytes_freed == 4160);

  params.auto_cleanup = false;
  GeotagWriter no_cleanup(queue, tracker, storage, stats, params);
  no_cleanup.ensure_headroom();
  CHECK(storage.cleanup_calls() == 1);
  std::cout << "✓ Test 11: Cleanup on low headroom - PASSED" << std::endl;
  return true;
}

int main() {
  std::cout << "=== Geotag Writer Test ===" << std::endl;

  if (!test_paths()) return 1;
  if (!test_pairs_with_later_fix()) return 1;
  if (!test_waits_for_arriving_fix()) return 1;
  if (!test_sidecar_contents()) return 1;
  if (!test_retry()) return 1;
  if (!test_sidecar_failure_removes_image()) return 1;
  if (!test_escalation()) return 1;
  if (!test_success_resets_drops()) return 1;
  if (!test_stalled_storage_with_workers()) return 1;
  if (!test_exif_embedding()) return 1;
  if (!test_cleanup_on_low_headroom()) return 1;

  std::cout << "\nAll geotag writer tests passed" << std::endl;
  return 0;
}

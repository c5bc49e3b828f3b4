// Session End-to-End Test
//
// Purpose: Run a full session on simulated devices: a receiver emitting one
// fix per second, a camera at 2 fps and in-memory storage. Checks frame
// accounting, positioning and the session summary.

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "bathycat/common/errors.hpp"
#include "bathycat/session/session.hpp"
#include "test_support.hpp"

using namespace bathycat;
using namespace std::chrono_literals;
using bathycat::test::FakeCamera;
using bathycat::test::FakeLineSource;
using bathycat::test::gga;
using bathycat::test::MemoryStorage;
using bathycat::test::rmc;

namespace {

Config session_config() {
  Config c;
  c.gps.read_timeout_sec = 0.05;
  c.clock_sync.enabled = false;
  c.camera.read_timeout_sec = 0.5;
  c.capture.target_fps = 2.0;
  c.capture.queue_capacity = 8;
  c.writer.storage_retry_delay_sec = 0.05;
  return c;
}

std::string hhmmss(int seconds_of_day) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d%02d%02d", seconds_of_day / 3600,
                (seconds_of_day / 60) % 60, seconds_of_day % 60);
  return buf;
}

}  // namespace

// Test 1: Thirty seconds of acquisition
bool test_thirty_second_session() {
  auto gps = std::make_unique<FakeLineSource>();
  auto cam = std::make_unique<FakeCamera>();
  auto mem = std::make_unique<MemoryStorage>();
  FakeLineSource* gps_raw = gps.get();
  MemoryStorage* mem_raw = mem.get();

  SessionDevices devices;
  devices.gps = std::move(gps);
  devices.camera = std::move(cam);
  devices.storage = std::move(mem);

  Session session(session_config(), std::move(devices));
  session.start();
  CHECK(session.running());

  std::atomic<bool> feeding{true};
  std::thread receiver([&] {
    int t = 10 * 3600;
    while (feeding.load()) {
      gps_raw->push(rmc(hhmmss(t), 'A', "5130.000", 'N', "00007.500", 'W', "010524"));
      gps_raw->push(gga(hhmmss(t), "5130.000", 'N', "00007.500", 'W'));
      ++t;
      std::this_thread::sleep_for(1s);
    }
  });

  std::this_thread::sleep_for(30s);
  session.stop();
  feeding.store(false);
  receiver.join();

  CHECK(!session.running());
  CHECK(!session.fatal_error().has_value());

  const SessionStats s = session.stats();
  std::cout << "  captured=" << s.frames_captured << " written=" << s.frames_written
            << " dropped=" << s.frames_dropped() << " unpositioned=" << s.frames_unpositioned
            << std::endl;
  CHECK(s.frames_written >= 55);
  CHECK(s.frames_unpositioned <= 5);
  CHECK(s.frames_captured == s.frames_written + s.frames_dropped());
  CHECK(s.sentences_rejected() == 0);
  CHECK(s.sentences_parsed >= 58);

  const auto files = mem_raw->files();
  const auto summary_it = files.find(session.summary_path());
  CHECK(summary_it != files.end());
  const auto j = nlohmann::json::parse(summary_it->second);
  CHECK(j.at("frames").at("written") == s.frames_written);
  CHECK(j.at("frames").at("captured") == s.frames_captured);
  CHECK(j.at("target_fps") == 2.0);
  CHECK(j.at("fatal_error").is_null());
  CHECK(j.at("duration_s").get<double>() >= 29.0);
  CHECK(j.at("achieved_fps").get<double>() > 1.5);

  // Image + sidecar per written frame, plus the summary.
  CHECK(files.size() == 2 * s.frames_written + 1);

  // Stopping again changes nothing.
  session.stop();
  CHECK(session.stats().frames_written == s.frames_written);
  std::cout << "✓ Test 1: Thirty-second session - PASSED" << std::endl;
  return true;
}

// Test 2: A session cannot start on unusable storage
bool test_start_requires_storage() {
  SessionDevices devices;
  devices.gps = std::make_unique<FakeLineSource>();
  devices.camera = std::make_unique<FakeCamera>();
  auto mem = std::make_unique<MemoryStorage>();
  mem->set_unmounted(true);
  devices.storage = std::move(mem);

  Session session(session_config(), std::move(devices));
  bool threw = false;
  try {
    session.start();
  } catch (const StorageError&) {
    threw = true;
  }
  CHECK(threw);
  CHECK(!session.running());
  std::cout << "✓ Test 2: Start requires storage - PASSED" << std::endl;
  return true;
}

// Test 3: A camera that will not open aborts start and stops the rest
bool test_start_requires_camera() {
  SessionDevices devices;
  devices.gps = std::make_unique<FakeLineSource>();
  auto cam = std::make_unique<FakeCamera>();
  cam->fail_opens_ = 1;
  devices.camera = std::move(cam);
  devices.storage = std::make_unique<MemoryStorage>();

  Session session(session_config(), std::move(devices));
  bool threw = false;
  try {
    session.start();
  } catch (const DeviceError&) {
    threw = true;
  }
  CHECK(threw);
  CHECK(!session.running());
  std::cout << "✓ Test 3: Start requires camera - PASSED" << std::endl;
  return true;
}

// Test 4: Losing the camera ends the session with a fatal error
bool test_camera_lost() {
  SessionDevices devices;
  devices.gps = std::make_unique<FakeLineSource>();
  auto cam = std::make_unique<FakeCamera>();
  FakeCamera* cam_raw = cam.get();
  devices.camera = std::move(cam);
  devices.storage = std::make_unique<MemoryStorage>();

  Config cfg = session_config();
  cfg.capture.target_fps = 20.0;
  cfg.capture.failure_threshold = 2;
  cfg.capture.max_reinit_attempts = 1;
  cfg.capture.reinit_backoff_sec = 0.01;
  cam_raw->always_fail_ = true;
  cam_raw->fail_reinits_ = true;

  Session session(cfg, std::move(devices));
  session.start();

  const SteadyTime deadline = SteadyClock::now() + 5s;
  while (!session.fatal_error() && SteadyClock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  CHECK(session.fatal_error().has_value());
  CHECK(session.fatal_error()->rfind("capture:", 0) == 0);

  session.stop();
  CHECK(session.summary_json().at("fatal_error").is_string());

  bool threw = false;
  try {
    session.start();
  } catch (const std::logic_error&) {
    threw = true;
  }
  CHECK(threw);
  std::cout << "✓ Test 4: Camera lost - PASSED" << std::endl;
  return true;
}

int main() {
  std::cout << "=== Session End-to-End Test ===" << std::endl;

  if (!test_start_requires_storage()) return 1;
  if (!test_start_requires_camera()) return 1;
  if (!test_camera_lost()) return 1;
  if (!test_thirty_second_session()) return 1;

  std::cout << "\nAll session tests passed" << std::endl;
  return 0;
}

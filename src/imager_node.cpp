#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "sensor_msgs/msg/nav_sat_fix.hpp"
#include "sensor_msgs/msg/nav_sat_status.hpp"
#include "std_msgs/msg/string.hpp"
#include "std_srvs/srv/trigger.hpp"

#include "bathycat/common/config.hpp"
#include "bathycat/common/errors.hpp"
#include "bathycat/session/session.hpp"

namespace bathycat {

using std::placeholders::_1;
using std::placeholders::_2;

class ImagerNode : public rclcpp::Node {
public:
  ImagerNode()
  : Node("bathycat_imager_node") {
    cfg_ = load_config();

    const auto problems = validate_config(cfg_);
    if (!problems.empty()) {
      for (const auto& p : problems) {
        RCLCPP_FATAL(get_logger(), "Invalid configuration: %s", p.c_str());
      }
      throw std::runtime_error("invalid configuration: " + problems.front());
    }

    double status_rate_hz = declare_parameter<double>("status_rate_hz", 1.0);

    // Publishers / services
    fix_pub_ = create_publisher<sensor_msgs::msg::NavSatFix>("/bathycat/fix", 10);
    stats_pub_ = create_publisher<std_msgs::msg::String>("/bathycat/session_stats", 10);
    stats_srv_ = create_service<std_srvs::srv::Trigger>(
      "/bathycat/get_stats",
      std::bind(&ImagerNode::handle_get_stats, this, _1, _2));

    session_ = std::make_unique<Session>(cfg_, make_linux_devices(cfg_));
    try {
      session_->start();
    } catch (const PipelineError& e) {
      RCLCPP_FATAL(get_logger(), "Session start failed: %s", e.what());
      throw;
    }

    auto period = std::chrono::duration<double>(1.0 / status_rate_hz);
    timer_ = create_wall_timer(
      std::chrono::duration_cast<std::chrono::nanoseconds>(period),
      std::bind(&ImagerNode::tick, this));

    RCLCPP_INFO(get_logger(), "BathyCat imager running at %.1f fps", cfg_.capture.target_fps);
  }

  ~ImagerNode() override {
    if (session_) {
      session_->stop();
    }
  }

private:
  Config load_config() {
    Config c;

    c.gps.port = declare_parameter<std::string>("gps.port", c.gps.port);
    c.gps.baud = declare_parameter<int>("gps.baud", c.gps.baud);
    c.gps.read_timeout_sec = declare_parameter<double>("gps.read_timeout_sec", c.gps.read_timeout_sec);
    c.gps.replay_file = declare_parameter<std::string>("gps.replay_file", c.gps.replay_file);
    c.gps.replay_rate_hz = declare_parameter<double>("gps.replay_rate_hz", c.gps.replay_rate_hz);
    c.gps.reopen_backoff_sec =
      declare_parameter<double>("gps.reopen_backoff_sec", c.gps.reopen_backoff_sec);
    c.gps.reopen_backoff_max_sec =
      declare_parameter<double>("gps.reopen_backoff_max_sec", c.gps.reopen_backoff_max_sec);

    c.position.staleness_sec =
      declare_parameter<double>("position.staleness_sec", c.position.staleness_sec);
    c.position.history_size = static_cast<std::size_t>(std::max<int64_t>(0,
      declare_parameter<int64_t>("position.history_size",
                                 static_cast<int64_t>(c.position.history_size))));

    c.clock_sync.enabled = declare_parameter<bool>("clock_sync.enabled", c.clock_sync.enabled);
    c.clock_sync.drift_threshold_sec =
      declare_parameter<double>("clock_sync.drift_threshold_sec", c.clock_sync.drift_threshold_sec);
    c.clock_sync.cooldown_sec =
      declare_parameter<double>("clock_sync.cooldown_sec", c.clock_sync.cooldown_sec);
    c.clock_sync.check_interval_sec =
      declare_parameter<double>("clock_sync.check_interval_sec", c.clock_sync.check_interval_sec);
    c.clock_sync.manage_ntp = declare_parameter<bool>("clock_sync.manage_ntp", c.clock_sync.manage_ntp);

    c.camera.device = declare_parameter<std::string>("camera.device", c.camera.device);
    c.camera.width = declare_parameter<int>("camera.width", c.camera.width);
    c.camera.height = declare_parameter<int>("camera.height", c.camera.height);
    c.camera.fps = declare_parameter<int>("camera.fps", c.camera.fps);
    c.camera.pixel_format = declare_parameter<std::string>("camera.pixel_format", c.camera.pixel_format);
    c.camera.read_timeout_sec =
      declare_parameter<double>("camera.read_timeout_sec", c.camera.read_timeout_sec);
    c.camera.buffer_count = declare_parameter<int>("camera.buffer_count", c.camera.buffer_count);

    c.capture.target_fps = declare_parameter<double>("capture.target_fps", c.capture.target_fps);
    c.capture.failure_threshold =
      declare_parameter<int>("capture.failure_threshold", c.capture.failure_threshold);
    c.capture.max_reinit_attempts =
      declare_parameter<int>("capture.max_reinit_attempts", c.capture.max_reinit_attempts);
    c.capture.reinit_backoff_sec =
      declare_parameter<double>("capture.reinit_backoff_sec", c.capture.reinit_backoff_sec);
    c.capture.reinit_backoff_max_sec =
      declare_parameter<double>("capture.reinit_backoff_max_sec", c.capture.reinit_backoff_max_sec);
    c.capture.queue_capacity = static_cast<std::size_t>(std::max<int64_t>(0,
      declare_parameter<int64_t>("capture.queue_capacity",
                                 static_cast<int64_t>(c.capture.queue_capacity))));

    c.writer.pairing_tolerance_sec =
      declare_parameter<double>("writer.pairing_tolerance_sec", c.writer.pairing_tolerance_sec);
    c.writer.filename_prefix =
      declare_parameter<std::string>("writer.filename_prefix", c.writer.filename_prefix);
    c.writer.storage_retries = declare_parameter<int>("writer.storage_retries", c.writer.storage_retries);
    c.writer.storage_retry_delay_sec =
      declare_parameter<double>("writer.storage_retry_delay_sec", c.writer.storage_retry_delay_sec);
    c.writer.max_consecutive_storage_drops = declare_parameter<int>(
      "writer.max_consecutive_storage_drops", c.writer.max_consecutive_storage_drops);
    c.writer.dequeue_timeout_sec =
      declare_parameter<double>("writer.dequeue_timeout_sec", c.writer.dequeue_timeout_sec);
    c.writer.embed_exif = declare_parameter<bool>("writer.embed_exif", c.writer.embed_exif);
    c.writer.auto_cleanup = declare_parameter<bool>("writer.auto_cleanup", c.writer.auto_cleanup);
    c.writer.cleanup_free_mb = static_cast<uint64_t>(std::max<int64_t>(0,
      declare_parameter<int64_t>("writer.cleanup_free_mb",
                                 static_cast<int64_t>(c.writer.cleanup_free_mb))));
    c.writer.days_to_keep = declare_parameter<int>("writer.days_to_keep", c.writer.days_to_keep);
    c.writer.cleanup_interval_sec =
      declare_parameter<double>("writer.cleanup_interval_sec", c.writer.cleanup_interval_sec);

    c.storage.local_path = declare_parameter<std::string>("storage.local_path", c.storage.local_path);
    c.storage.mount_prefixes = declare_parameter<std::vector<std::string>>(
      "storage.mount_prefixes", c.storage.mount_prefixes);
    c.storage.prefer_removable =
      declare_parameter<bool>("storage.prefer_removable", c.storage.prefer_removable);
    c.storage.min_free_mb = static_cast<uint64_t>(std::max<int64_t>(0,
      declare_parameter<int64_t>("storage.min_free_mb", static_cast<int64_t>(c.storage.min_free_mb))));

    return c;
  }

  void tick() {
    if (auto fatal = session_->fatal_error()) {
      RCLCPP_FATAL(get_logger(), "Stopping acquisition: %s", fatal->c_str());
      timer_->cancel();
      session_->stop();
      rclcpp::shutdown();
      return;
    }

    publish_fix();

    std_msgs::msg::String msg;
    msg.data = session_->summary_json().dump();
    stats_pub_->publish(msg);
  }

  void publish_fix() {
    const gnss::PositionSnapshot snap = session_->position();
    if (!snap.fix.has_position()) {
      return;
    }

    sensor_msgs::msg::NavSatFix msg;
    msg.header.stamp = now();
    msg.header.frame_id = "gps";

    using Status = sensor_msgs::msg::NavSatStatus;
    msg.status.service = Status::SERVICE_GPS;
    if (!snap.valid) {
      msg.status.status = Status::STATUS_NO_FIX;
    } else if (snap.fix.fix_quality == gnss::FixQuality::kDgps) {
      msg.status.status = Status::STATUS_SBAS_FIX;
    } else if (snap.fix.fix_quality == gnss::FixQuality::kGps) {
      msg.status.status = Status::STATUS_FIX;
    } else {
      msg.status.status = Status::STATUS_NO_FIX;
    }

    msg.latitude = snap.fix.latitude_deg.value();
    msg.longitude = snap.fix.longitude_deg.value();
    msg.altitude = snap.fix.altitude_m.value_or(std::nan(""));
    msg.position_covariance_type = sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_UNKNOWN;
    fix_pub_->publish(msg);
  }

  void handle_get_stats(const std::shared_ptr<std_srvs::srv::Trigger::Request> /*req*/,
                        std::shared_ptr<std_srvs::srv::Trigger::Response> res) {
    res->success = !session_->fatal_error().has_value();
    res->message = session_->summary_json().dump();
  }

  Config cfg_;
  std::unique_ptr<Session> session_;

  rclcpp::Publisher<sensor_msgs::msg::NavSatFix>::SharedPtr fix_pub_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr stats_pub_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr stats_srv_;
  rclcpp::TimerBase::SharedPtr timer_;
};

}  // namespace bathycat

int main(int argc, char **argv) {
  rclcpp::init(argc, argv);
  auto node = std::make_shared<bathycat::ImagerNode>();
  rclcpp::spin(node);
  node.reset();
  rclcpp::shutdown();
  return 0;
}

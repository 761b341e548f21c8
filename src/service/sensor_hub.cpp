// Sensor Hub Implementation
//
// Cooperative polling loop over camera, microphone, IMU and battery

#include "sensor_hub.hpp"
#include "utils/logger.hpp"

#include <cinttypes>
#include <cmath>
#include <stdexcept>

namespace sensemu {

void log_hub_stats(const HubStats& stats) {
    LOG_INFO("Hub stats: ticks=%" PRIu64 " camera=%" PRIu64 "/%" PRIu64
             " audio=%" PRIu64 "/%" PRIu64 " imu=%" PRIu64
             " (coalesced %" PRIu64 ") body_unavailable=%" PRIu64 " clamps=%u",
             stats.tick_count,
             stats.camera_frames, stats.camera_not_ready,
             stats.audio_frames, stats.audio_not_ready,
             stats.imu_readings, stats.imu_coalesced,
             stats.body_unavailable, stats.clamp_events);
}

// === Constructor/Destructor ===

SensorHub::SensorHub(const EmulatorConfig& config)
    : config_(config),
      camera_(config.camera),
      microphone_(config.microphone),
      imu_(config.imu),
      battery_(config.battery),
      running_(false),
      time_(0.0) {

    if (!config_.validate()) {
        throw std::invalid_argument("Invalid emulator configuration");
    }

    LOG_INFO("SensorHub created (camera %dx%d @ %d fps, mic %d Hz, imu %.1f Hz)",
             config_.camera.target_width, config_.camera.target_height,
             config_.camera.target_fps, config_.microphone.sample_rate,
             config_.imu.update_rate_hz);
}

SensorHub::~SensorHub() {
    if (running_) {
        LOG_WARN("SensorHub destroyed while running, stopping...");
        stop();
    }
}

// === Lifecycle ===

bool SensorHub::start(const std::vector<std::shared_ptr<FrameSource>>& cameras,
                      const std::vector<std::shared_ptr<CaptureRingBuffer>>& microphones,
                      const std::shared_ptr<BodyStateProvider>& body) {
    if (running_) {
        LOG_WARN("SensorHub already running");
        return false;
    }

    // A missing device disables that device only
    if (!camera_.start(cameras)) {
        LOG_WARN("SensorHub: camera disabled (%s)",
                 sensor_fault_name(camera_.last_fault()));
    }
    if (!microphone_.start(microphones)) {
        LOG_WARN("SensorHub: microphone disabled (%s)",
                 sensor_fault_name(microphone_.last_fault()));
    }

    body_ = body;
    if (!body_) {
        LOG_WARN("SensorHub: no body state provider, IMU will hold its last reading");
    }

    output_ = HubOutput();
    output_.battery_percent = battery_.percentage();
    running_ = true;

    LOG_INFO("SensorHub started");
    return true;
}

void SensorHub::stop() {
    if (!running_) {
        return;
    }

    camera_.stop();
    microphone_.stop();
    running_ = false;

    LOG_INFO("SensorHub stopped (total ticks: %" PRIu64 ")", stats_.tick_count);
    log_hub_stats(stats_);
}

// === Main Tick ===

const HubOutput& SensorHub::tick(double dt) {
    if (!running_) {
        LOG_WARN("SensorHub::tick called while stopped");
        return output_;
    }

    if (!std::isfinite(dt) || dt < 0.0) {
        LOG_WARN("SensorHub: invalid dt %.6f treated as 0", dt);
        dt = 0.0;
    }

    time_ += dt;
    stats_.tick_count++;
    output_.time_s = time_;

    // Camera
    output_.camera_frame = camera_.poll_wire_frame(time_);
    if (output_.camera_frame) {
        stats_.camera_frames++;
    } else {
        stats_.camera_not_ready++;
    }

    // Microphone
    output_.audio_frame = microphone_.extract_frame();
    if (output_.audio_frame) {
        stats_.audio_frames++;
        if (config_.microphone.log_volume) {
            microphone_.log_frame_volume(*output_.audio_frame);
        }
    } else {
        stats_.audio_not_ready++;
    }

    // IMU: the synthesizer keeps its own sim clock and rate limiter, which
    // advance on every tick whether or not a body state is available
    uint64_t readings_before = imu_.stats().readings_emitted;
    if (body_ && body_->sample(body_state_)) {
        output_.imu = imu_.tick(body_state_, dt);
    } else {
        stats_.body_unavailable++;
        output_.imu = imu_.hold(dt);
    }
    output_.imu_fresh = imu_.stats().readings_emitted != readings_before;
    if (output_.imu_fresh) {
        stats_.imu_readings++;
    }
    stats_.imu_coalesced = imu_.coalesced_intervals();

    // Battery
    battery_.update(dt);
    output_.battery_percent = battery_.percentage();
    if (config_.battery.log_battery) {
        battery_.log_status();
    }

    stats_.clamp_events = microphone_.stats().clamp_events
                        + camera_.codec().invariant_violations();

    LOG_DEBUG("Hub tick %" PRIu64 " t=%.3f camera=%s audio=%s imu=%s battery=%d%%",
              stats_.tick_count, time_,
              output_.camera_frame ? "yes" : "no",
              output_.audio_frame ? "yes" : "no",
              output_.imu_fresh ? "fresh" : "held",
              output_.battery_percent);

    return output_;
}

}  // namespace sensemu

// Sensor Hub - Cooperative single-threaded driver of all emulated devices
//
// Purpose: Own one instance of each emulated device and poll each exactly
// once per simulation tick, the way the robot's firmware main loop would.
//
// Key Features:
// - No threads, no blocking: tick() runs to completion every call
// - Configuration faults disable only the affected device
// - Frame-rate decoupling per device (camera fps, IMU rate)
// - Per-tick output plus running statistics
//
// Sample Usage:
//   SensorHub hub(config);
//   hub.start(cameras, microphones, body);
//   for (...) {
//       body->advance(dt);
//       mic->advance(dt);
//       const HubOutput& out = hub.tick(dt);
//   }
//   hub.stop();
//
// Expected Output:
//   - Default config, dt = 10 ms: IMU fresh every tick, camera frame every
//     ~3.3 ticks (held in between), one 640-byte audio frame per tick

#pragma once

#include "audio/audio_digitizer.hpp"
#include "camera/camera_emulator.hpp"
#include "core/emulator_config.hpp"
#include "imu/body_state_provider.hpp"
#include "imu/imu_synthesizer.hpp"
#include "power/battery_emulator.hpp"
#include "service_types.hpp"

#include <memory>
#include <vector>

namespace sensemu {

class SensorHub {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    /**
     * @brief Constructor
     * @throws std::invalid_argument if config fails validation
     */
    explicit SensorHub(const EmulatorConfig& config = EmulatorConfig());

    ~SensorHub();

    SensorHub(const SensorHub&) = delete;
    SensorHub& operator=(const SensorHub&) = delete;

    /**
     * @brief Start all devices
     *
     * Devices whose capture source is missing stay disabled; the hub still
     * runs the others.
     *
     * @return false if already running
     */
    bool start(const std::vector<std::shared_ptr<FrameSource>>& cameras,
               const std::vector<std::shared_ptr<CaptureRingBuffer>>& microphones,
               const std::shared_ptr<BodyStateProvider>& body);

    /**
     * @brief Stop all devices
     */
    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief Advance simulation time by dt and poll every device once
     */
    const HubOutput& tick(double dt);

    // === Device access ===

    CameraEmulator& camera() { return camera_; }
    AudioDigitizer& microphone() { return microphone_; }
    ImuSynthesizer& imu() { return imu_; }
    BatteryEmulator& battery() { return battery_; }

    const HubOutput& last_output() const { return output_; }
    const HubStats& stats() const { return stats_; }
    const EmulatorConfig& config() const { return config_; }

private:
    EmulatorConfig config_;

    CameraEmulator camera_;
    AudioDigitizer microphone_;
    ImuSynthesizer imu_;
    BatteryEmulator battery_;
    std::shared_ptr<BodyStateProvider> body_;

    bool running_;
    sim_time_t time_;
    PhysicalBodyState body_state_;
    HubOutput output_;
    HubStats stats_;
};

}  // namespace sensemu

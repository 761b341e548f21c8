// Emulated Sensor Session
//
// Purpose: Run the sensor hub against the synthetic devices for a number of
// simulated seconds and dump the last frames for inspection.
//
// Usage:
//   emulate_session [seconds] [output_prefix] [--log-battery]
//
//   seconds        Simulated duration (default: 5)
//   output_prefix  If given, writes <prefix>_camera.rgb565 (wire, big-endian),
//                  <prefix>_display.rgb565 (little-endian) and
//                  <prefix>_audio.pcm (PCM16 mono little-endian)
//   --log-battery  Log the battery charge on every tick
//
// Expected Output:
//   - Hub stats line, final IMU reading, battery percentage

#include "service/sensor_hub.hpp"
#include "utils/logger.hpp"
#include "validation/spin_servo_body.hpp"
#include "validation/synthetic_camera.hpp"
#include "validation/synthetic_microphone.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace sensemu;

namespace {

bool write_file(const std::string& path, const std::vector<uint8_t>* bytes) {
    if (bytes == nullptr) {
        LOG_WARN("Nothing to write for %s", path.c_str());
        return false;
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        LOG_ERROR("Cannot open %s for writing", path.c_str());
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes->data()),
              static_cast<std::streamsize>(bytes->size()));
    LOG_INFO("Wrote %zu bytes to %s", bytes->size(), path.c_str());
    return static_cast<bool>(out);
}

}  // namespace

int main(int argc, char** argv) {
    double seconds = 5.0;
    if (argc > 1) {
        seconds = std::atof(argv[1]);
        if (!(seconds > 0.0)) {
            LOG_ERROR("Duration must be positive, got '%s'", argv[1]);
            return 1;
        }
    }
    const std::string prefix = argc > 2 ? argv[2] : "";

    EmulatorConfig config;
    config.body.target_spin_deg_s = 180.0;
    config.imu.seed = 2024;
    config.battery.log_battery = argc > 3 && std::string(argv[3]) == "--log-battery";

    auto camera = std::make_shared<SyntheticCamera>("webcam", 640, 480, 5);
    camera->set_pattern(SyntheticCamera::Pattern::GRADIENT);
    auto mic = std::make_shared<SyntheticMicrophone>("mic", 2, 440.0, 0.3);
    auto body = std::make_shared<SpinServoBody>(config.body);

    SensorHub hub(config);
    if (!hub.start({camera}, {mic}, body)) {
        return 1;
    }

    const double dt = 0.01;
    const int ticks = static_cast<int>(seconds / dt + 0.5);
    for (int i = 0; i < ticks; i++) {
        body->advance(dt);
        mic->advance(dt);
        const HubOutput& tick_out = hub.tick(dt);

        if ((i + 1) % 100 == 0 && tick_out.audio_frame != nullptr) {
            hub.microphone().log_frame_volume(*tick_out.audio_frame);
        }
    }

    const HubOutput& out = hub.last_output();
    LOG_INFO("t = %.2f s, battery %d%%", out.time_s, out.battery_percent);
    LOG_INFO("IMU #%u accel [%.3f %.3f %.3f] m/s², gyro [%.3f %.3f %.3f] rad/s",
             out.imu.sequence,
             out.imu.accel.x(), out.imu.accel.y(), out.imu.accel.z(),
             out.imu.gyro.x(), out.imu.gyro.y(), out.imu.gyro.z());

    bool ok = true;
    if (!prefix.empty()) {
        ok &= write_file(prefix + "_camera.rgb565", out.camera_frame);
        ok &= write_file(prefix + "_display.rgb565", hub.camera().display_frame());
        ok &= write_file(prefix + "_audio.pcm", out.audio_frame);
    }

    hub.stop();
    return ok ? 0 : 1;
}

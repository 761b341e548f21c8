/**
 * @file validate_emulator.cpp
 * @brief End-to-end validation executable for the sensor emulator
 *
 * Purpose: Validates every emulator layer in one run:
 * - Eigen integration and quaternion utilities
 * - Configuration validation
 * - Gaussian noise generator
 * - Device selection
 * - Camera, microphone and IMU wire formats
 * - Sensor hub session
 * - Logging infrastructure
 *
 * Success criteria:
 * - All tests pass with explicit verification
 * - Execution time < 5 seconds
 * - Output provides clear pass/fail evidence
 */

#include "core/device_select.hpp"
#include "core/emulator_config.hpp"
#include "core/quaternion.hpp"
#include "math/gaussian_noise.hpp"
#include "math/vector_math.hpp"
#include "service/sensor_hub.hpp"
#include "utils/logger.hpp"
#include "validation/spin_servo_body.hpp"
#include "validation/synthetic_camera.hpp"
#include "validation/synthetic_microphone.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

using namespace sensemu;

// Test result tracking
struct TestResult {
    std::string name;
    bool passed;
    std::string error_message;
};

std::vector<TestResult> test_results;

void run_test(const std::string& name, bool condition, const std::string& error = "") {
    TestResult result;
    result.name = name;
    result.passed = condition;
    result.error_message = error;
    test_results.push_back(result);

    if (condition) {
        LOG_INFO("✓ PASS: %s", name.c_str());
    } else {
        LOG_ERROR("✗ FAIL: %s - %s", name.c_str(), error.c_str());
    }
}

int main() {
    auto start_time = std::chrono::steady_clock::now();

    LOG_INFO("========================================");
    LOG_INFO("Sensor Emulator Validation");
    LOG_INFO("========================================");

    // ==================== Test 1: Quaternion Utilities ====================
    LOG_INFO("\n[Test Suite 1] Quaternion Utilities");
    {
        Quaterniond q = quaternion_from_axis_angle(Vector3d(1, 0, 0), M_PI / 2);
        Vector3d up_body = world_to_body(q, Vector3d(0, 1, 0));
        double rot_error = (up_body - Vector3d(0, 0, -1)).norm();
        run_test("Quaternion: world_to_body under 90° about X", rot_error < 1e-10,
                 "Error = " + std::to_string(rot_error));

        Vector3d v(0.3, -1.2, 4.0);
        double round_trip = (body_to_world(q, world_to_body(q, v)) - v).norm();
        run_test("Quaternion: body_to_world inverts world_to_body", round_trip < 1e-12,
                 "Error = " + std::to_string(round_trip));

        // Quarter turn at 1 rad/s
        Quaterniond q_int = Quaterniond::Identity();
        for (int i = 0; i < 1000; i++) {
            q_int = integrate_orientation(q_int, Vector3d(0, 0, 1), M_PI / 2000.0);
        }
        double angle_error = q_int.angularDistance(
            quaternion_from_axis_angle(Vector3d(0, 0, 1), M_PI / 2));
        run_test("Quaternion: Integration of constant rate", angle_error < 1e-9,
                 "Error = " + std::to_string(angle_error) + " rad");
        run_test("Quaternion: Unit norm after integration",
                 std::abs(q_int.norm() - 1.0) < 1e-12, "");
    }

    // ==================== Test 2: Configuration ====================
    LOG_INFO("\n[Test Suite 2] Configuration");
    {
        EmulatorConfig config;
        run_test("Config: Defaults validate", config.validate(), "");
        run_test("Config: Default mic frame is 320 samples",
                 config.microphone.frame_samples() == 320,
                 "Samples = " + std::to_string(config.microphone.frame_samples()));

        EmulatorConfig bad;
        bad.camera.target_fps = 0;
        bad.imu.accel.range = -1.0;
        bad.battery.drain_rate = -1.0;
        run_test("Config: Invalid sections rejected", !bad.validate(), "");

        MicrophoneConfig long_frame;
        long_frame.frame_ms = 5000;
        run_test("Config: Frame longer than ring rejected", !long_frame.validate(), "");
    }

    // ==================== Test 3: Gaussian Noise ====================
    LOG_INFO("\n[Test Suite 3] Gaussian Noise Generator");
    {
        GaussianNoise noise(1234);
        std::vector<Vector3d> samples;
        for (int i = 0; i < 20000; i++) {
            samples.push_back(noise.sample_vector(0.5));
        }
        Vector3d mean = compute_mean(samples);
        Vector3d std_dev = compute_std_dev(samples);

        run_test("Noise: Mean ≈ 0", mean.norm() < 0.02,
                 "Mean norm = " + std::to_string(mean.norm()));
        run_test("Noise: Std ≈ 0.5 on every axis",
                 (std_dev - Vector3d::Constant(0.5)).cwiseAbs().maxCoeff() < 0.025,
                 "Std = [" + std::to_string(std_dev.x()) + ", " +
                 std::to_string(std_dev.y()) + ", " + std::to_string(std_dev.z()) + "]");
        run_test("Noise: Zero std yields zero", noise.sample(0.0) == 0.0, "");

        GaussianNoise a(99);
        GaussianNoise b(99);
        bool same = true;
        for (int i = 0; i < 100; i++) {
            same = same && a.sample(1.0) == b.sample(1.0);
        }
        run_test("Noise: Same seed reproduces sequence", same, "");
    }

    // ==================== Test 4: Device Selection ====================
    LOG_INFO("\n[Test Suite 4] Device Selection");
    {
        auto front = std::make_shared<SyntheticCamera>("front", 64, 48);
        auto rear = std::make_shared<SyntheticCamera>("rear", 64, 48);
        std::vector<std::shared_ptr<SyntheticCamera>> devices = {nullptr, front, rear};
        SensorFault fault = SensorFault::NONE;

        run_test("Devices: Blank name picks first device",
                 select_device(devices, "", fault) == front && fault == SensorFault::NONE, "");
        run_test("Devices: Name match",
                 select_device(devices, "rear", fault) == rear, "");
        run_test("Devices: Unknown name",
                 select_device(devices, "side", fault) == nullptr &&
                 fault == SensorFault::DEVICE_NOT_FOUND,
                 sensor_fault_name(fault));

        std::vector<std::shared_ptr<SyntheticCamera>> empty;
        run_test("Devices: Empty registry",
                 select_device(empty, "", fault) == nullptr && fault == SensorFault::NO_DEVICE,
                 sensor_fault_name(fault));
    }

    // ==================== Test 5: Wire Formats ====================
    LOG_INFO("\n[Test Suite 5] Wire Formats");
    {
        PixelCodec codec(320, 240);
        std::vector<uint8_t> red(640 * 480 * 3, 0);
        for (size_t i = 0; i < red.size(); i += 3) {
            red[i] = 255;
        }
        const std::vector<uint8_t>* wire = codec.produce_wire_frame(
            RawColorFrame(red.data(), 640, 480, 3));
        const std::vector<uint8_t>* display = codec.display_frame();

        run_test("Camera: 320x240 frame is 153600 bytes",
                 wire != nullptr && wire->size() == 153600, "");
        run_test("Camera: Wire pixel F8 00, display pixel 00 F8",
                 wire != nullptr && display != nullptr &&
                 (*wire)[0] == 0xF8 && (*wire)[1] == 0x00 &&
                 (*display)[0] == 0x00 && (*display)[1] == 0xF8, "");

        int16_t pcm = quantize_pcm16(-1.0f);
        uint8_t bytes[2] = {0, 0};
        pack_pcm16_le(&pcm, 1, bytes);
        run_test("Audio: -1.0 packs to 01 80", bytes[0] == 0x01 && bytes[1] == 0x80, "");
        run_test("Audio: 0.0 packs to 00 00", quantize_pcm16(0.0f) == 0, "");

        ImuConfig imu_config;
        imu_config.accel.noise_std = 0.0;
        imu_config.gyro.noise_std = 0.0;
        ImuSynthesizer imu(imu_config);
        const ImuReading& reading = imu.tick(PhysicalBodyState(), 0.01);
        run_test("IMU: Upright body reads +9.81 on y",
                 (reading.accel - Vector3d(0, SIM_GRAVITY, 0)).norm() < 1e-9,
                 "Accel y = " + std::to_string(reading.accel.y()));
    }

    // ==================== Test 6: Sensor Hub Session ====================
    LOG_INFO("\n[Test Suite 6] Sensor Hub Session");
    {
        EmulatorConfig config;
        config.body.target_spin_deg_s = 90.0;
        SensorHub hub(config);

        auto camera = std::make_shared<SyntheticCamera>("webcam", 640, 480, 3);
        camera->set_pattern(SyntheticCamera::Pattern::GRADIENT);
        auto mic = std::make_shared<SyntheticMicrophone>("mic", 1, 440.0, 0.25);
        auto body = std::make_shared<SpinServoBody>(config.body);

        bool started = hub.start({camera}, {mic}, body);
        run_test("Hub: Started with all devices", started, "");

        for (int i = 0; i < 200; i++) {
            body->advance(0.01);
            mic->advance(0.01);
            hub.tick(0.01);
        }

        const HubStats& stats = hub.stats();
        log_hub_stats(stats);

        run_test("Hub: 200 ticks", stats.tick_count == 200, "");
        run_test("Hub: Camera warm-up reported as not ready",
                 stats.camera_not_ready > 0 && stats.camera_frames > 0,
                 "Not ready = " + std::to_string(stats.camera_not_ready));
        run_test("Hub: One IMU reading per tick at 100 Hz", stats.imu_readings == 200,
                 "Readings = " + std::to_string(stats.imu_readings));
        run_test("Hub: Audio every tick", stats.audio_frames == 200, "");
        run_test("Hub: Battery drained 2 %", hub.last_output().battery_percent == 98,
                 "Battery = " + std::to_string(hub.last_output().battery_percent));
        run_test("Hub: No clamp events", stats.clamp_events == 0, "");

        hub.stop();
    }

    // ==================== Test 7: Logging Infrastructure ====================
    LOG_INFO("\n[Test Suite 7] Logging Infrastructure");
    {
        LOG_DEBUG("Debug message test");
        LOG_INFO("Info message test");
        LOG_WARN("Warning message test");
        LOG_ERROR("Error message test");

        HubStats stats;
        stats.tick_count = 3;
        stats.imu_readings = 3;
        log_hub_stats(stats);

        run_test("Logging: All log levels functional", true, "");
    }

    // ==================== Final Results ====================
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    LOG_INFO("\n========================================");
    LOG_INFO("Validation Results Summary");
    LOG_INFO("========================================");

    int total_tests = static_cast<int>(test_results.size());
    int passed_tests = 0;
    int failed_tests = 0;

    for (const auto& result : test_results) {
        if (result.passed) {
            passed_tests++;
        } else {
            failed_tests++;
            LOG_ERROR("Failed: %s - %s", result.name.c_str(), result.error_message.c_str());
        }
    }

    LOG_INFO("Total tests: %d", total_tests);
    LOG_INFO("Passed: %d", passed_tests);
    LOG_INFO("Failed: %d", failed_tests);
    LOG_INFO("Execution time: %lld ms", static_cast<long long>(duration.count()));
    LOG_INFO("========================================");

    if (failed_tests > 0) {
        LOG_ERROR("❌ EMULATOR VALIDATION FAILED - %d of %d tests failed", failed_tests, total_tests);
        return 1;
    }

    LOG_INFO("✅ EMULATOR VALIDATION PASSED - All %d tests successful!", total_tests);
    return 0;
}

// Camera Emulator - Rate-limited RGB565 camera on top of a frame source
//
// Purpose: Present a rendered image stream as the robot's camera: fixed
// resolution, fixed frame rate, RGB565 big-endian raw frames, plus a
// little-endian copy for local preview.
//
// Key Features:
// - Device selection by name; a missing device disables the camera
// - Frame-rate decoupling: between capture instants the last frame is served
// - Warm-up handling: degenerate source sizes report "not ready" (nullptr)
//
// Sample Usage:
//   CameraEmulator camera(config.camera);
//   if (!camera.start(devices)) { ...camera disabled... }
//   const auto* wire = camera.poll_wire_frame(now);   // nullptr = not ready
//   const auto* preview = camera.display_frame();
//
// Expected Output:
//   - 153600-byte frames at 30 Hz for the default 320x240 configuration

#pragma once

#include "camera/frame_source.hpp"
#include "camera/pixel_codec.hpp"
#include "core/emulator_config.hpp"
#include "core/rate_limiter.hpp"
#include "core/sensor_types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace sensemu {

/**
 * @brief Camera poll counters
 */
struct CameraStats {
    uint64_t frames_encoded;      ///< Fresh frames written to the wire buffer
    uint64_t cached_polls;        ///< Polls served from the previous frame
    uint64_t not_ready_polls;     ///< Polls that returned nullptr

    CameraStats()
        : frames_encoded(0), cached_polls(0), not_ready_polls(0) {}
};

class CameraEmulator {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if config fails validation
     */
    explicit CameraEmulator(const CameraConfig& config = CameraConfig());

    ~CameraEmulator();

    CameraEmulator(const CameraEmulator&) = delete;
    CameraEmulator& operator=(const CameraEmulator&) = delete;

    /**
     * @brief Select and start the capture device
     *
     * @param devices Available capture devices
     * @return false on a configuration fault (camera stays disabled)
     */
    bool start(const std::vector<std::shared_ptr<FrameSource>>& devices);

    /**
     * @brief Stop the capture device; the camera becomes disabled
     */
    void stop();

    /**
     * @brief Wire frame for this tick
     *
     * Captures and encodes a new frame when a frame interval has elapsed,
     * otherwise returns the previous frame unchanged.
     *
     * @param now Simulation time [s]
     * @return RGB565 big-endian buffer, or nullptr if disabled / not ready
     */
    const std::vector<uint8_t>* poll_wire_frame(sim_time_t now);

    /**
     * @brief Display copy for this tick (same capture rules as poll_wire_frame)
     */
    const std::vector<uint8_t>* poll_display_frame(sim_time_t now);

    /**
     * @brief Display copy of the most recent wire frame, nullptr if none
     */
    const std::vector<uint8_t>* display_frame() { return codec_.display_frame(); }

    /**
     * @brief True when enabled and the device is currently delivering live frames
     */
    bool is_ready() const;

    bool is_enabled() const { return enabled_; }
    SensorFault last_fault() const { return fault_; }
    const CameraStats& stats() const { return stats_; }
    const CameraConfig& config() const { return config_; }
    const PixelCodec& codec() const { return codec_; }

private:
    CameraConfig config_;
    PixelCodec codec_;
    UpdateRateLimiter frame_clock_;

    std::shared_ptr<FrameSource> device_;
    bool enabled_;
    bool last_grab_live_;
    SensorFault fault_;
    CameraStats stats_;
};

}  // namespace sensemu

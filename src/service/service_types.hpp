// Service Data Types for the Sensor Hub
//
// Purpose: Per-tick output and running counters of the cooperative sensor
// hub that polls every emulated device once per simulation tick.
//
// Key Features:
// - HubOutput: what a protocol encoder / telemetry sink consumes each tick
// - HubStats: counters for diagnostics and tests
//
// Sample Usage:
//   const HubOutput& out = hub.tick(0.01);
//   if (out.camera_frame) { send(*out.camera_frame); }
//   log_hub_stats(hub.stats());

#pragma once

#include "core/sensor_types.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <vector>

namespace sensemu {

/**
 * @brief Everything the hub produced on one tick
 *
 * Buffer pointers stay valid until the next tick and are nullptr when the
 * device was disabled or not ready.
 */
struct HubOutput {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    const std::vector<uint8_t>* camera_frame;   ///< RGB565 big-endian
    const std::vector<uint8_t>* audio_frame;    ///< PCM16 mono little-endian
    ImuReading imu;                              ///< Latest IMU reading
    bool imu_fresh;                              ///< imu computed on this tick
    int battery_percent;                         ///< Fuel gauge [%]
    sim_time_t time_s;                           ///< Simulation time [s]

    HubOutput()
        : camera_frame(nullptr),
          audio_frame(nullptr),
          imu(),
          imu_fresh(false),
          battery_percent(0),
          time_s(0.0) {}
};

/**
 * @brief Hub statistics and diagnostics
 */
struct HubStats {
    uint64_t tick_count;              ///< Total ticks
    uint64_t camera_frames;           ///< Ticks with a camera frame (fresh or held)
    uint64_t camera_not_ready;        ///< Ticks without a camera frame
    uint64_t audio_frames;            ///< Ticks with an audio frame
    uint64_t audio_not_ready;         ///< Ticks without an audio frame
    uint64_t imu_readings;            ///< Fresh IMU readings
    uint64_t imu_coalesced;           ///< IMU intervals folded into a later reading
    uint64_t body_unavailable;        ///< Ticks without a body state
    uint32_t clamp_events;            ///< Invariant violations clamped by components

    HubStats()
        : tick_count(0),
          camera_frames(0),
          camera_not_ready(0),
          audio_frames(0),
          audio_not_ready(0),
          imu_readings(0),
          imu_coalesced(0),
          body_unavailable(0),
          clamp_events(0) {}
};

/**
 * @brief Log hub counters on one line
 */
void log_hub_stats(const HubStats& stats);

}  // namespace sensemu

/**
 * @file synthetic_camera.hpp
 * @brief Synthetic frame source for software-first camera validation
 *
 * Purpose: Stand-in for the renderer's capture device. Produces deterministic
 * test patterns at a fixed source resolution and mimics a webcam's warm-up by
 * reporting a 16x16 frame for the first few grabs.
 *
 * Sample Input:
 *   - 640x480 source, pattern SOLID (255, 0, 0), warm-up 2 grabs
 *
 * Expected Output:
 *   - grabs 1-2: 16x16 frames (camera emulator reports not ready)
 *   - grab 3+: 640x480 solid red frames
 */

#ifndef SENSEMU_VALIDATION_SYNTHETIC_CAMERA_HPP
#define SENSEMU_VALIDATION_SYNTHETIC_CAMERA_HPP

#include "camera/frame_source.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sensemu {

class SyntheticCamera : public FrameSource {
public:
    enum class Pattern : uint8_t {
        SOLID = 0,          ///< One color everywhere
        COLOR_BARS = 1,     ///< Eight vertical SMPTE-style bars
        GRADIENT = 2        ///< Red along x, green along y, blue moves per frame
    };

    /**
     * @brief Constructor
     *
     * @param name Device name
     * @param width Source width [px]
     * @param height Source height [px]
     * @param warmup_frames Grabs that return a degenerate 16x16 frame
     * @throws std::invalid_argument on non-positive dimensions
     */
    SyntheticCamera(const std::string& name, int width, int height, int warmup_frames = 0);

    const std::string& name() const override { return name_; }
    bool start(int requested_width, int requested_height, int requested_fps) override;
    void stop() override;
    bool is_playing() const override { return playing_; }
    bool grab(RawColorFrame& frame) override;

    void set_pattern(Pattern pattern) { pattern_ = pattern; }
    void set_solid_color(uint8_t r, uint8_t g, uint8_t b);

    int frames_grabbed() const { return frames_grabbed_; }

private:
    void render(int width, int height);

    std::string name_;
    int width_;
    int height_;
    int warmup_frames_;

    Pattern pattern_;
    uint8_t solid_[3];

    bool playing_;
    int frames_grabbed_;
    std::vector<uint8_t> pixels_;   ///< RGB, reused per grab
};

} // namespace sensemu

#endif // SENSEMU_VALIDATION_SYNTHETIC_CAMERA_HPP

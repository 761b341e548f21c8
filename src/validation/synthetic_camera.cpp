/**
 * @file synthetic_camera.cpp
 * @brief Implementation of the synthetic frame source
 */

#include "synthetic_camera.hpp"
#include "camera/pixel_codec.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

namespace sensemu {

namespace {
// White, yellow, cyan, green, magenta, red, blue, black
const uint8_t BAR_COLORS[8][3] = {
    {255, 255, 255}, {255, 255, 0}, {0, 255, 255}, {0, 255, 0},
    {255, 0, 255},   {255, 0, 0},   {0, 0, 255},   {0, 0, 0}
};
}  // namespace

SyntheticCamera::SyntheticCamera(const std::string& name, int width, int height,
                                 int warmup_frames)
    : name_(name),
      width_(width),
      height_(height),
      warmup_frames_(warmup_frames),
      pattern_(Pattern::COLOR_BARS),
      solid_{0, 0, 0},
      playing_(false),
      frames_grabbed_(0) {

    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Synthetic camera resolution must be positive");
    }
}

bool SyntheticCamera::start(int requested_width, int requested_height, int requested_fps) {
    // Like a webcam, the device keeps its native resolution
    LOG_INFO("SyntheticCamera '%s': requested %dx%d @ %d fps, delivering %dx%d",
             name_.c_str(), requested_width, requested_height, requested_fps,
             width_, height_);
    playing_ = true;
    frames_grabbed_ = 0;
    return true;
}

void SyntheticCamera::stop() {
    playing_ = false;
}

void SyntheticCamera::set_solid_color(uint8_t r, uint8_t g, uint8_t b) {
    solid_[0] = r;
    solid_[1] = g;
    solid_[2] = b;
    pattern_ = Pattern::SOLID;
}

bool SyntheticCamera::grab(RawColorFrame& frame) {
    if (!playing_) {
        return false;
    }

    const bool warming_up = frames_grabbed_ < warmup_frames_;
    const int w = warming_up ? MIN_SOURCE_DIMENSION : width_;
    const int h = warming_up ? MIN_SOURCE_DIMENSION : height_;

    render(w, h);
    frames_grabbed_++;

    frame = RawColorFrame(pixels_.data(), w, h, 3);
    return true;
}

void SyntheticCamera::render(int width, int height) {
    const size_t bytes = static_cast<size_t>(width) * static_cast<size_t>(height) * 3;
    if (pixels_.size() != bytes) {
        pixels_.resize(bytes);
    }

    size_t k = 0;
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++, k += 3) {
            switch (pattern_) {
                case Pattern::SOLID:
                    pixels_[k] = solid_[0];
                    pixels_[k + 1] = solid_[1];
                    pixels_[k + 2] = solid_[2];
                    break;
                case Pattern::COLOR_BARS: {
                    const uint8_t* c = BAR_COLORS[x * 8 / width];
                    pixels_[k] = c[0];
                    pixels_[k + 1] = c[1];
                    pixels_[k + 2] = c[2];
                    break;
                }
                case Pattern::GRADIENT:
                    pixels_[k] = static_cast<uint8_t>(x * 255 / (width - 1 > 0 ? width - 1 : 1));
                    pixels_[k + 1] = static_cast<uint8_t>(y * 255 / (height - 1 > 0 ? height - 1 : 1));
                    pixels_[k + 2] = static_cast<uint8_t>((frames_grabbed_ * 4) & 0xFF);
                    break;
            }
        }
    }
}

} // namespace sensemu

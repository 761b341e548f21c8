/**
 * @file pixel_codec.cpp
 * @brief Implementation of the RGB565 frame resampler
 */

#include "pixel_codec.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

namespace sensemu {

bool convert_wire_to_display(const std::vector<uint8_t>& wire,
                             std::vector<uint8_t>& display) {
    if (display.size() != wire.size() || (wire.size() & 1) != 0) {
        return false;
    }

    const size_t n = wire.size();
    for (size_t i = 0; i < n; i += 2) {
        display[i] = wire[i + 1];   // low
        display[i + 1] = wire[i];   // high
    }
    return true;
}

PixelCodec::PixelCodec(int target_width, int target_height)
    : target_width_(0),
      target_height_(0),
      has_frame_(false),
      display_stale_(true),
      invariant_violations_(0) {

    if (!set_target_size(target_width, target_height)) {
        throw std::invalid_argument("Target resolution must be positive");
    }
}

bool PixelCodec::set_target_size(int target_width, int target_height) {
    if (target_width <= 0 || target_height <= 0) {
        return false;
    }

    if (target_width == target_width_ && target_height == target_height_) {
        return true;
    }

    target_width_ = target_width;
    target_height_ = target_height;

    const size_t bytes = static_cast<size_t>(target_width_) *
                         static_cast<size_t>(target_height_) * 2;
    wire_.assign(bytes, 0);
    display_.assign(bytes, 0);

    has_frame_ = false;
    display_stale_ = true;
    return true;
}

const std::vector<uint8_t>* PixelCodec::produce_wire_frame(const RawColorFrame& source) {
    if (source.pixels == nullptr ||
        source.width <= MIN_SOURCE_DIMENSION ||
        source.height <= MIN_SOURCE_DIMENSION) {
        // Warm-up: device not yet delivering full frames
        return nullptr;
    }

    if (source.bytes_per_pixel != 3 && source.bytes_per_pixel != 4) {
        invariant_violations_++;
        LOG_ERROR("Unsupported source pixel size: %d bytes", source.bytes_per_pixel);
        return nullptr;
    }

    encode_nearest(source);

    has_frame_ = true;
    display_stale_ = true;
    return &wire_;
}

const std::vector<uint8_t>* PixelCodec::produce_display_frame(const RawColorFrame& source) {
    if (produce_wire_frame(source) == nullptr) {
        return nullptr;
    }
    return display_frame();
}

const std::vector<uint8_t>* PixelCodec::display_frame() {
    if (!has_frame_) {
        return nullptr;
    }

    if (display_stale_) {
        if (!convert_wire_to_display(wire_, display_)) {
            invariant_violations_++;
            LOG_ERROR("Display buffer size %zu does not match wire size %zu",
                      display_.size(), wire_.size());
            return nullptr;
        }
        display_stale_ = false;
    }
    return &display_;
}

void PixelCodec::encode_nearest(const RawColorFrame& source) {
    const int sw = source.width;
    const int sh = source.height;
    const int dw = target_width_;
    const int dh = target_height_;
    const int bpp = source.bytes_per_pixel;

    // Identity size falls out of the same mapping: x * sw / dw == x
    size_t j = 0;
    for (int y = 0; y < dh; y++) {
        const int sy = static_cast<int>(static_cast<int64_t>(y) * sh / dh);
        const uint8_t* row = source.pixels +
                             static_cast<size_t>(sy) * static_cast<size_t>(sw) * bpp;

        for (int x = 0; x < dw; x++) {
            const int sx = static_cast<int>(static_cast<int64_t>(x) * sw / dw);
            const uint8_t* px = row + static_cast<size_t>(sx) * bpp;

            const uint16_t v = pack_rgb565(px[0], px[1], px[2]);
            wire_[j] = static_cast<uint8_t>(v >> 8);        // high byte first
            wire_[j + 1] = static_cast<uint8_t>(v & 0xFF);  // low byte
            j += 2;
        }
    }
}

} // namespace sensemu

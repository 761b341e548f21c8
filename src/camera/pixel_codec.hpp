/**
 * @file pixel_codec.hpp
 * @brief Frame resampler and RGB565 pixel codec of the emulated camera
 *
 * Purpose: Convert a caller-owned color image of any resolution into the
 * camera's raw framebuffer dump: fixed target resolution, RGB565, high byte
 * first per pixel. A separate little-endian copy is kept for local display.
 *
 * The two byte orders live in two distinct owned buffers with one explicit
 * conversion step between them (wire -> display). The wire buffer is never
 * byte-swapped in place.
 *
 * References:
 * - OV2640 datasheet, RGB565 output format
 *
 * Sample Input:
 *   - 640x480 RGB frame, solid (255, 0, 0); target 320x240
 *
 * Expected Output:
 *   - wire frame: 153600 bytes, every pixel 0xF8 0x00
 *   - display frame: 153600 bytes, every pixel 0x00 0xF8
 */

#ifndef SENSEMU_CAMERA_PIXEL_CODEC_HPP
#define SENSEMU_CAMERA_PIXEL_CODEC_HPP

#include "core/sensor_types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sensemu {

// Sources must exceed this size in both dimensions to be considered live
constexpr int MIN_SOURCE_DIMENSION = 16;

/**
 * @brief Pack an 8-bit RGB triple into RGB565 by truncation
 */
inline uint16_t pack_rgb565(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<uint16_t>(((r >> 3) << 11) | ((g >> 2) << 5) | (b >> 3));
}

/**
 * @brief Read one pixel from a big-endian (wire) RGB565 buffer
 */
inline uint16_t read_rgb565_be(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

/**
 * @brief Read one pixel from a little-endian (display) RGB565 buffer
 */
inline uint16_t read_rgb565_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

/**
 * @brief Convert a wire (big-endian) buffer into a display (little-endian) buffer
 *
 * @param wire Source bytes, even length
 * @param display Destination, must already have wire.size() bytes
 * @return false if the sizes differ or are odd (display left untouched)
 */
bool convert_wire_to_display(const std::vector<uint8_t>& wire,
                             std::vector<uint8_t>& display);

/**
 * @brief Resampling RGB565 encoder with reusable output buffers
 *
 * Not thread-safe: one caller per instance.
 */
class PixelCodec {
public:
    /**
     * @brief Constructor
     * @param target_width Output width [px], > 0
     * @param target_height Output height [px], > 0
     * @throws std::invalid_argument on non-positive dimensions
     */
    PixelCodec(int target_width, int target_height);

    /**
     * @brief Resample and encode one source frame into the wire buffer
     *
     * Nearest-neighbour: destination (x, y) reads source
     * (x * sw / dw, y * sh / dh) with integer division.
     *
     * @return Wire buffer (target_width * target_height * 2 bytes), or nullptr
     *         when the source is not ready (no pixels, <= 16 px in a dimension,
     *         unsupported pixel size)
     */
    const std::vector<uint8_t>* produce_wire_frame(const RawColorFrame& source);

    /**
     * @brief Encode a source frame and return its display copy
     *
     * @return Display buffer, or nullptr when the source is not ready
     */
    const std::vector<uint8_t>* produce_display_frame(const RawColorFrame& source);

    /**
     * @brief Display copy of the most recent wire frame
     *
     * Converts lazily: the swap runs only when the wire frame changed since
     * the last call.
     *
     * @return Display buffer, or nullptr if no wire frame exists yet
     */
    const std::vector<uint8_t>* display_frame();

    /**
     * @brief Most recent wire frame, or nullptr if none was produced
     */
    const std::vector<uint8_t>* wire_frame() const {
        return has_frame_ ? &wire_ : nullptr;
    }

    /**
     * @brief Change the output resolution (reallocates both buffers)
     * @return false on non-positive dimensions (size unchanged)
     */
    bool set_target_size(int target_width, int target_height);

    int target_width() const { return target_width_; }
    int target_height() const { return target_height_; }
    size_t frame_bytes() const { return wire_.size(); }
    bool has_frame() const { return has_frame_; }

    // Count of rejected sources that violated the frame contract
    uint32_t invariant_violations() const { return invariant_violations_; }

private:
    void encode_nearest(const RawColorFrame& source);

    int target_width_;
    int target_height_;

    std::vector<uint8_t> wire_;     ///< RGB565, MSB first
    std::vector<uint8_t> display_;  ///< RGB565, LSB first

    bool has_frame_;
    bool display_stale_;
    uint32_t invariant_violations_;
};

} // namespace sensemu

#endif // SENSEMU_CAMERA_PIXEL_CODEC_HPP

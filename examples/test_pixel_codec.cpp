// Pixel Codec Unit Tests
//
// Purpose: Validate RGB565 wire encoding and nearest-neighbour resampling
// Tests:
//   1. Solid red 640x480 -> 320x240 wire/display byte order
//   2. Warm-up source sizes (<= 16 px) are rejected
//   3. Nearest-neighbour index mapping on a downscale
//   4. RGBA sources and unsupported pixel sizes
//   5. Wire/display conversion is an exact byte swap
//   6. Encoding is deterministic and reuses buffers
//   7. Camera emulator frame-rate decoupling and warm-up
//   8. Display-order frames from the codec and the emulator
//   9. Device that refuses to start

#include "camera/camera_emulator.hpp"
#include "camera/pixel_codec.hpp"
#include "validation/synthetic_camera.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace sensemu;

namespace {

std::vector<uint8_t> make_solid(int w, int h, int bpp, uint8_t r, uint8_t g, uint8_t b) {
    std::vector<uint8_t> px(static_cast<size_t>(w) * h * bpp, 255);
    for (size_t i = 0; i < px.size(); i += bpp) {
        px[i] = r;
        px[i + 1] = g;
        px[i + 2] = b;
    }
    return px;
}

// Device that is registered but never starts
class BusyCamera : public FrameSource {
public:
    explicit BusyCamera(const std::string& name) : name_(name), start_calls_(0) {}

    const std::string& name() const override { return name_; }
    bool start(int, int, int) override { start_calls_++; return false; }
    void stop() override {}
    bool is_playing() const override { return false; }
    bool grab(RawColorFrame&) override { return false; }

    int start_calls() const { return start_calls_; }

private:
    std::string name_;
    int start_calls_;
};

bool report(int n, bool passed) {
    if (passed) {
        std::cout << "✓ Test " << n << ": PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test " << n << ": FAILED" << std::endl;
    }
    return passed;
}

}  // namespace

// Test 1: Solid red frame, byte order of both buffers
bool test_solid_red() {
    std::cout << "\n=== Test 1: Solid Red 640x480 -> 320x240 ===" << std::endl;

    PixelCodec codec(320, 240);
    std::vector<uint8_t> px = make_solid(640, 480, 3, 255, 0, 0);
    RawColorFrame src(px.data(), 640, 480, 3);

    const std::vector<uint8_t>* wire = codec.produce_wire_frame(src);
    if (wire == nullptr) {
        std::cerr << "Wire frame missing" << std::endl;
        return report(1, false);
    }

    bool passed = wire->size() == 153600;
    for (size_t i = 0; passed && i < wire->size(); i += 2) {
        passed = (*wire)[i] == 0xF8 && (*wire)[i + 1] == 0x00;
    }
    std::cout << "Wire size: " << wire->size() << " bytes" << std::endl;

    const std::vector<uint8_t>* display = codec.display_frame();
    passed = passed && display != nullptr && display->size() == 153600;
    for (size_t i = 0; passed && i < display->size(); i += 2) {
        passed = (*display)[i] == 0x00 && (*display)[i + 1] == 0xF8;
    }

    // Display conversion must not touch the wire buffer
    passed = passed && (*wire)[0] == 0xF8 && (*wire)[1] == 0x00;

    return report(1, passed);
}

// Test 2: Sources at or below the minimum dimension
bool test_warmup_sizes() {
    std::cout << "\n=== Test 2: Warm-up Source Sizes ===" << std::endl;

    PixelCodec codec(32, 24);
    std::vector<uint8_t> px16 = make_solid(16, 16, 3, 10, 20, 30);
    std::vector<uint8_t> px17 = make_solid(17, 17, 3, 10, 20, 30);
    std::vector<uint8_t> tall = make_solid(16, 100, 3, 10, 20, 30);

    bool rejected_16 = codec.produce_wire_frame(RawColorFrame(px16.data(), 16, 16, 3)) == nullptr;
    bool rejected_tall = codec.produce_wire_frame(RawColorFrame(tall.data(), 16, 100, 3)) == nullptr;
    bool rejected_null = codec.produce_wire_frame(RawColorFrame(nullptr, 640, 480, 3)) == nullptr;
    bool no_display = codec.display_frame() == nullptr && !codec.has_frame();
    bool accepted_17 = codec.produce_wire_frame(RawColorFrame(px17.data(), 17, 17, 3)) != nullptr;

    std::cout << "16x16 rejected: " << rejected_16 << ", 16x100 rejected: " << rejected_tall
              << ", 17x17 accepted: " << accepted_17 << std::endl;

    return report(2, rejected_16 && rejected_tall && rejected_null && no_display &&
                     accepted_17 && codec.invariant_violations() == 0);
}

// Test 3: Nearest-neighbour mapping, ⌊x·sw/dw⌋ and ⌊y·sh/dh⌋
bool test_nearest_mapping() {
    std::cout << "\n=== Test 3: Nearest-Neighbour Mapping ===" << std::endl;

    const int sw = 40;
    const int sh = 30;
    std::vector<uint8_t> px(static_cast<size_t>(sw) * sh * 3);
    for (int y = 0; y < sh; y++) {
        for (int x = 0; x < sw; x++) {
            uint8_t* p = &px[(static_cast<size_t>(y) * sw + x) * 3];
            p[0] = static_cast<uint8_t>(x * 6);
            p[1] = static_cast<uint8_t>(y * 8);
            p[2] = 0;
        }
    }

    const int dw = 12;
    const int dh = 7;
    PixelCodec codec(dw, dh);
    const std::vector<uint8_t>* wire = codec.produce_wire_frame(RawColorFrame(px.data(), sw, sh, 3));
    if (wire == nullptr) {
        return report(3, false);
    }

    bool passed = true;
    for (int y = 0; y < dh && passed; y++) {
        for (int x = 0; x < dw && passed; x++) {
            const int sx = x * sw / dw;
            const int sy = y * sh / dh;
            const uint8_t* p = &px[(static_cast<size_t>(sy) * sw + sx) * 3];
            const uint16_t expected = pack_rgb565(p[0], p[1], p[2]);
            const uint16_t got = read_rgb565_be(&(*wire)[(static_cast<size_t>(y) * dw + x) * 2]);
            if (got != expected) {
                std::cerr << "Mismatch at (" << x << ", " << y << ")" << std::endl;
                passed = false;
            }
        }
    }

    return report(3, passed);
}

// Test 4: RGBA input is accepted, other pixel sizes are violations
bool test_pixel_sizes() {
    std::cout << "\n=== Test 4: RGBA and Unsupported Pixel Sizes ===" << std::endl;

    PixelCodec codec(20, 20);
    std::vector<uint8_t> rgba = make_solid(20, 20, 4, 0, 255, 0);
    const std::vector<uint8_t>* wire = codec.produce_wire_frame(RawColorFrame(rgba.data(), 20, 20, 4));
    bool rgba_ok = wire != nullptr && read_rgb565_be(wire->data()) == 0x07E0;

    std::vector<uint8_t> gray(20 * 20 * 2, 128);
    bool gray_rejected = codec.produce_wire_frame(RawColorFrame(gray.data(), 20, 20, 2)) == nullptr;

    std::cout << "RGBA green: 0x" << std::hex << (wire ? read_rgb565_be(wire->data()) : 0)
              << std::dec << ", violations: " << codec.invariant_violations() << std::endl;

    return report(4, rgba_ok && gray_rejected && codec.invariant_violations() == 1);
}

// Test 5: Display bytes are the wire bytes swapped pairwise
bool test_byte_swap() {
    std::cout << "\n=== Test 5: Wire/Display Conversion ===" << std::endl;

    std::vector<uint8_t> wire = {0x12, 0x34, 0xAB, 0xCD};
    std::vector<uint8_t> display(4, 0);
    bool ok = convert_wire_to_display(wire, display);
    bool values = ok && read_rgb565_be(&wire[0]) == read_rgb565_le(&display[0]) &&
                  read_rgb565_be(&wire[2]) == read_rgb565_le(&display[2]) &&
                  display[0] == 0x34 && display[3] == 0xAB;

    std::vector<uint8_t> short_display(2, 0);
    std::vector<uint8_t> odd(3, 0);
    std::vector<uint8_t> odd_display(3, 0);
    bool mismatch_rejected = !convert_wire_to_display(wire, short_display);
    bool odd_rejected = !convert_wire_to_display(odd, odd_display);

    return report(5, values && mismatch_rejected && odd_rejected);
}

// Test 6: Same input -> same bytes, buffers reused across frames
bool test_determinism() {
    std::cout << "\n=== Test 6: Determinism and Buffer Reuse ===" << std::endl;

    SyntheticCamera camera("bars", 64, 48);
    camera.set_pattern(SyntheticCamera::Pattern::COLOR_BARS);
    camera.start(64, 48, 30);

    PixelCodec codec(32, 24);
    RawColorFrame frame;
    camera.grab(frame);
    const std::vector<uint8_t>* first = codec.produce_wire_frame(frame);
    std::vector<uint8_t> copy = first ? *first : std::vector<uint8_t>();
    const uint8_t* storage = first ? first->data() : nullptr;

    camera.grab(frame);
    const std::vector<uint8_t>* second = codec.produce_wire_frame(frame);

    bool passed = first != nullptr && second == first && second->data() == storage &&
                  *second == copy;

    // Resizing is the only reallocation point
    passed = passed && codec.set_target_size(16, 12) && codec.frame_bytes() == 16 * 12 * 2 &&
             !codec.has_frame() && !codec.set_target_size(0, 12);

    return report(6, passed);
}

// Test 7: Camera emulator serves cached frames between fps ticks
bool test_camera_emulator() {
    std::cout << "\n=== Test 7: Camera Emulator Frame Rate ===" << std::endl;

    CameraConfig config;
    config.target_width = 32;
    config.target_height = 24;
    config.target_fps = 10;

    auto device = std::make_shared<SyntheticCamera>("cam0", 64, 48, 2);
    std::vector<std::shared_ptr<FrameSource>> devices = {device};

    CameraEmulator camera(config);
    if (!camera.start(devices)) {
        return report(7, false);
    }

    // Two warm-up frames at 16x16 -> not ready, one grab per 0.1 s
    bool passed = camera.poll_wire_frame(0.0) == nullptr;
    passed = passed && camera.poll_wire_frame(0.05) == nullptr;
    passed = passed && camera.poll_wire_frame(0.1) == nullptr;
    passed = passed && camera.poll_wire_frame(0.2) != nullptr;
    passed = passed && camera.poll_wire_frame(0.25) != nullptr;   // cached
    passed = passed && camera.is_ready();

    const CameraStats& stats = camera.stats();
    std::cout << "Grabs: " << device->frames_grabbed()
              << ", encoded: " << stats.frames_encoded
              << ", cached: " << stats.cached_polls
              << ", not ready: " << stats.not_ready_polls << std::endl;

    passed = passed && device->frames_grabbed() == 3 && stats.frames_encoded == 1 &&
             stats.cached_polls == 1;

    // No registered device disables the camera only
    CameraEmulator missing(config);
    bool no_device = !missing.start({}) && missing.last_fault() == SensorFault::NO_DEVICE &&
                     missing.poll_wire_frame(0.0) == nullptr;

    CameraConfig named = config;
    named.device_name = "rear";
    CameraEmulator wrong(named);
    bool not_found = !wrong.start(devices) &&
                     wrong.last_fault() == SensorFault::DEVICE_NOT_FOUND;

    return report(7, passed && no_device && not_found);
}

// Test 8: Display frames are the byte-swapped wire frames
bool test_display_frames() {
    std::cout << "\n=== Test 8: Display Frames ===" << std::endl;

    SyntheticCamera source("bars", 64, 48);
    source.set_pattern(SyntheticCamera::Pattern::COLOR_BARS);
    source.start(64, 48, 30);

    RawColorFrame frame;
    bool grabbed = source.grab(frame) && frame.size_bytes() == 64u * 48u * 3u;

    PixelCodec codec(32, 24);
    const std::vector<uint8_t>* display = codec.produce_display_frame(frame);
    const std::vector<uint8_t>* wire = codec.wire_frame();

    bool codec_ok = display != nullptr && wire != nullptr &&
                    display->size() == 32u * 24u * 2u && display->size() == wire->size();
    for (size_t i = 0; codec_ok && i < wire->size(); i += 2) {
        codec_ok = (*display)[i] == (*wire)[i + 1] && (*display)[i + 1] == (*wire)[i];
    }

    std::vector<uint8_t> warm = make_solid(16, 16, 3, 1, 2, 3);
    PixelCodec fresh(32, 24);
    bool not_ready = fresh.produce_display_frame(RawColorFrame(warm.data(), 16, 16, 3)) == nullptr;

    CameraConfig config;
    config.target_width = 32;
    config.target_height = 24;
    config.target_fps = 10;
    auto device = std::make_shared<SyntheticCamera>("cam0", 64, 48);
    device->set_pattern(SyntheticCamera::Pattern::COLOR_BARS);

    CameraEmulator camera(config);
    bool emulator_ok = camera.start({device});
    const std::vector<uint8_t>* polled = emulator_ok ? camera.poll_display_frame(0.0) : nullptr;
    const std::vector<uint8_t>* wire_polled = camera.poll_wire_frame(0.05);
    emulator_ok = emulator_ok && polled != nullptr && wire_polled != nullptr &&
                  polled->size() == wire_polled->size() &&
                  (*polled)[0] == (*wire_polled)[1] && (*polled)[1] == (*wire_polled)[0] &&
                  camera.stats().frames_encoded == 1 && camera.stats().cached_polls == 1;

    CameraEmulator idle(config);
    bool disabled = idle.poll_display_frame(0.0) == nullptr;

    std::cout << "Source bytes: " << frame.size_bytes()
              << ", display bytes: " << (display ? display->size() : 0) << std::endl;

    return report(8, grabbed && codec_ok && not_ready && emulator_ok && disabled);
}

// Test 9: Named device found but its start request fails
bool test_start_failure() {
    std::cout << "\n=== Test 9: Device Start Failure ===" << std::endl;

    CameraConfig config;
    config.target_width = 32;
    config.target_height = 24;
    auto busy = std::make_shared<BusyCamera>("busy");

    CameraEmulator camera(config);
    bool passed = !camera.start({busy}) && busy->start_calls() == 1 &&
                  camera.last_fault() == SensorFault::DEVICE_START_FAILED &&
                  !camera.is_enabled() && camera.poll_wire_frame(0.0) == nullptr &&
                  std::string(sensor_fault_name(camera.last_fault())) == "device start failed";

    return report(9, passed);
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Pixel Codec Unit Tests" << std::endl;
    std::cout << "Testing: RGB565 Camera Wire Format" << std::endl;
    std::cout << "========================================" << std::endl;

    bool all_passed = true;

    all_passed &= test_solid_red();
    all_passed &= test_warmup_sizes();
    all_passed &= test_nearest_mapping();
    all_passed &= test_pixel_sizes();
    all_passed &= test_byte_swap();
    all_passed &= test_determinism();
    all_passed &= test_camera_emulator();
    all_passed &= test_display_frames();
    all_passed &= test_start_failure();

    std::cout << "\n========================================" << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL PIXEL CODEC TESTS PASSED" << std::endl;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}

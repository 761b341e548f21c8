// Audio Digitizer Unit Tests
//
// Purpose: Validate ring-buffer windowing, downmix and PCM16 packing
// Tests:
//   1. Window across the ring seam keeps chronological order
//   2. PCM16 little-endian packing of full-scale and silence
//   3. Stereo downmix averages channels
//   4. Not-ready states (no advance, stopped, cursor out of range)
//   5. Oversized request clamps to capacity
//   6. Device selection faults
//   7. RMS / dB of a synthetic tone
//   8. Device that refuses to start
//   9. Level helpers on packed frames

#include "audio/audio_digitizer.hpp"
#include "validation/synthetic_microphone.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace sensemu;

namespace {

// Ring with a caller-controlled cursor and contents
class ScriptedRing : public CaptureRingBuffer {
public:
    ScriptedRing(const std::string& name, int channels, size_t capacity, int sample_rate)
        : name_(name), channels_(channels), capacity_(capacity), sample_rate_(sample_rate),
          recording_(false), refuse_start_(false), cursor_(0),
          data_(capacity * static_cast<size_t>(channels), 0.0f) {}

    const std::string& name() const override { return name_; }
    bool start(int, int) override {
        recording_ = !refuse_start_;
        return recording_;
    }
    void stop() override { recording_ = false; }
    bool is_recording() const override { return recording_; }
    int channels() const override { return channels_; }
    int sample_rate() const override { return sample_rate_; }
    size_t capacity() const override { return capacity_; }
    int64_t write_position() const override { return cursor_; }

    bool read(size_t start, size_t frames, float* interleaved) const override {
        if (start + frames > capacity_) {
            return false;
        }
        const size_t ch = static_cast<size_t>(channels_);
        for (size_t i = 0; i < frames * ch; i++) {
            interleaved[i] = data_[start * ch + i];
        }
        return true;
    }

    void set_cursor(int64_t cursor) { cursor_ = cursor; }
    void set_refuse_start(bool refuse) { refuse_start_ = refuse; }
    void fill(float value) { data_.assign(data_.size(), value); }
    std::vector<float>& data() { return data_; }

private:
    std::string name_;
    int channels_;
    size_t capacity_;
    int sample_rate_;
    bool recording_;
    bool refuse_start_;
    int64_t cursor_;
    std::vector<float> data_;
};

MicrophoneConfig small_ring_config() {
    MicrophoneConfig config;
    config.sample_rate = 1000;
    config.frame_ms = 20;
    config.buffer_seconds = 1;
    return config;
}

bool report(int n, bool passed) {
    if (passed) {
        std::cout << "✓ Test " << n << ": PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test " << n << ": FAILED" << std::endl;
    }
    return passed;
}

}  // namespace

// Test 1: Cursor 5, capacity 100, N = 20 -> indices 85..99 then 0..4
bool test_seam_window() {
    std::cout << "\n=== Test 1: Window Across Ring Seam ===" << std::endl;

    auto ring = std::make_shared<ScriptedRing>("ring", 1, 100, 1000);
    for (size_t i = 0; i < 100; i++) {
        ring->data()[i] = static_cast<float>(i) / 100.0f;
    }

    AudioDigitizer mic(small_ring_config());
    if (!mic.start({ring})) {
        return report(1, false);
    }
    ring->set_cursor(5);

    const std::vector<uint8_t>* frame = mic.extract_frame();
    if (frame == nullptr) {
        std::cerr << "No frame extracted" << std::endl;
        return report(1, false);
    }

    const std::vector<float>& window = mic.working_samples();
    bool passed = frame->size() == 40 && window.size() == 20;
    for (size_t k = 0; passed && k < 20; k++) {
        const size_t expected_index = (85 + k) % 100;
        passed = std::fabs(window[k] - static_cast<float>(expected_index) / 100.0f) < 1e-6f;
        if (passed) {
            const int16_t pcm = decode_pcm16_le(frame->data() + 2 * k);
            passed = pcm == quantize_pcm16(static_cast<float>(expected_index) / 100.0f);
        }
    }

    std::cout << "First sample index: " << std::lround(window[0] * 100.0f)
              << ", last: " << std::lround(window[19] * 100.0f)
              << ", wrapped frames: " << mic.stats().wrapped_frames << std::endl;

    return report(1, passed && mic.stats().wrapped_frames == 1);
}

// Test 2: -1.0 -> 0x01 0x80, 0.0 -> 0x00 0x00, clamping beyond full scale
bool test_pcm_packing() {
    std::cout << "\n=== Test 2: PCM16 Little-Endian Packing ===" << std::endl;

    auto ring = std::make_shared<ScriptedRing>("ring", 1, 100, 1000);
    ring->fill(-1.0f);

    AudioDigitizer mic(small_ring_config());
    mic.start({ring});
    ring->set_cursor(40);

    const std::vector<uint8_t>* frame = mic.extract_frame();
    bool full_scale = frame != nullptr && frame->size() == 40;
    for (size_t i = 0; full_scale && i < frame->size(); i += 2) {
        full_scale = (*frame)[i] == 0x01 && (*frame)[i + 1] == 0x80;
    }

    ring->fill(0.0f);
    frame = mic.extract_frame();
    bool silence = frame != nullptr;
    for (size_t i = 0; silence && i < frame->size(); i++) {
        silence = (*frame)[i] == 0x00;
    }

    bool clamped = quantize_pcm16(1.5f) == 32767 && quantize_pcm16(-3.0f) == -32767 &&
                   quantize_pcm16(0.5f) == 16384;

    int16_t samples[2] = {-32767, 258};
    uint8_t packed[4] = {0, 0, 0, 0};
    pack_pcm16_le(samples, 2, packed);
    bool order = packed[0] == 0x01 && packed[1] == 0x80 && packed[2] == 0x02 && packed[3] == 0x01;

    return report(2, full_scale && silence && clamped && order);
}

// Test 3: Mean of channels per frame
bool test_stereo_downmix() {
    std::cout << "\n=== Test 3: Stereo Downmix ===" << std::endl;

    auto ring = std::make_shared<ScriptedRing>("stereo", 2, 100, 1000);
    std::vector<float>& data = ring->data();
    for (size_t i = 0; i < 100; i++) {
        data[2 * i] = 0.5f;       // left
        data[2 * i + 1] = 0.25f;  // right
    }
    data[2 * 49] = 1.0f;
    data[2 * 49 + 1] = -1.0f;

    AudioDigitizer mic(small_ring_config());
    mic.start({ring});
    ring->set_cursor(50);

    const std::vector<uint8_t>* frame = mic.extract_frame();
    if (frame == nullptr || frame->size() != 40) {
        return report(3, false);
    }

    const int16_t mixed = decode_pcm16_le(frame->data());
    const int16_t cancelled = decode_pcm16_le(frame->data() + 38);
    std::cout << "Mixed: " << mixed << ", cancelled: " << cancelled << std::endl;

    bool passed = mixed == quantize_pcm16(0.375f) && cancelled == 0 &&
                  mic.working_samples().size() == 40;

    return report(3, passed);
}

// Test 4: Conditions that must yield no frame
bool test_not_ready() {
    std::cout << "\n=== Test 4: Not-Ready States ===" << std::endl;

    auto ring = std::make_shared<ScriptedRing>("ring", 1, 100, 1000);
    AudioDigitizer mic(small_ring_config());

    bool before_start = mic.extract_frame() == nullptr;

    mic.start({ring});
    bool before_advance = mic.extract_frame() == nullptr;

    ring->set_cursor(101);
    bool out_of_range = mic.extract_frame() == nullptr;

    ring->set_cursor(-1);
    bool negative = mic.extract_frame() == nullptr;

    // Cursor equal to capacity is position 0
    ring->set_cursor(100);
    bool at_capacity = mic.extract_frame() != nullptr;

    ring->stop();
    bool stopped = mic.extract_frame() == nullptr;

    std::cout << "Not-ready polls: " << mic.stats().not_ready_polls << std::endl;

    return report(4, before_start && before_advance && out_of_range && negative &&
                     at_capacity && stopped && mic.stats().not_ready_polls == 5);
}

// Test 5: Window longer than the ring is clamped and counted
bool test_capacity_clamp() {
    std::cout << "\n=== Test 5: Capacity Clamp ===" << std::endl;

    auto ring = std::make_shared<ScriptedRing>("ring", 1, 100, 1000);
    AudioDigitizer mic(small_ring_config());
    mic.start({ring});
    ring->set_cursor(5);

    const std::vector<uint8_t>* frame = mic.extract_frame(200);
    bool passed = frame != nullptr && frame->size() == 200 && mic.stats().clamp_events == 1;

    // Default duration again after the clamp
    frame = mic.extract_frame();
    passed = passed && frame != nullptr && frame->size() == 40;

    return report(5, passed);
}

// Test 6: Empty registry and unknown device name
bool test_device_faults() {
    std::cout << "\n=== Test 6: Device Selection Faults ===" << std::endl;

    AudioDigitizer none(small_ring_config());
    bool no_device = !none.start({}) && none.last_fault() == SensorFault::NO_DEVICE &&
                     !none.is_enabled() && none.extract_frame() == nullptr;

    MicrophoneConfig named = small_ring_config();
    named.device_name = "usb";
    auto ring = std::make_shared<ScriptedRing>("builtin", 1, 100, 1000);
    auto usb = std::make_shared<ScriptedRing>("usb", 1, 100, 1000);

    AudioDigitizer wrong(named);
    bool not_found = !wrong.start({ring}) &&
                     wrong.last_fault() == SensorFault::DEVICE_NOT_FOUND;

    AudioDigitizer right(named);
    bool found = right.start({ring, usb}) && usb->is_recording() && !ring->is_recording();

    return report(6, no_device && not_found && found);
}

// Test 7: 1 kHz tone at amplitude 0.5 -> RMS ≈ 0.354, ≈ -9.0 dB
bool test_tone_level() {
    std::cout << "\n=== Test 7: Tone RMS and dB ===" << std::endl;

    auto device = std::make_shared<SyntheticMicrophone>("tone", 1, 1000.0, 0.5);
    AudioDigitizer mic;
    if (!mic.start({device})) {
        return report(7, false);
    }

    device->advance(0.1);
    const float level = mic.rms();
    const float db = mic.level_db();
    const float expected = 0.5f / std::sqrt(2.0f);

    std::cout << "RMS: " << level << " (expected " << expected << "), dB: " << db << std::endl;

    bool passed = std::fabs(level - expected) < 0.01f && std::fabs(db + 9.03f) < 0.3f;

    device->set_tone(1000.0, 0.0);
    device->advance(0.1);
    passed = passed && mic.level_db() == -80.0f;

    return report(7, passed);
}

// Test 8: Named device exists but rejects the format
bool test_start_failure() {
    std::cout << "\n=== Test 8: Device Start Failure ===" << std::endl;

    auto ring = std::make_shared<ScriptedRing>("busy", 1, 100, 1000);
    ring->set_refuse_start(true);
    ring->set_cursor(50);

    AudioDigitizer mic(small_ring_config());
    bool passed = !mic.start({ring}) &&
                  mic.last_fault() == SensorFault::DEVICE_START_FAILED &&
                  !mic.is_enabled() && !ring->is_recording() &&
                  mic.extract_frame() == nullptr &&
                  std::string(sensor_fault_name(mic.last_fault())) == "device start failed";

    return report(8, passed);
}

// Test 9: RMS of packed bytes and dB conversion
bool test_level_helpers() {
    std::cout << "\n=== Test 9: Level Helpers ===" << std::endl;

    // 0x4000 = 16384 -> 0.5, 0xC000 = -16384 -> -0.5
    std::vector<uint8_t> half = {0x00, 0x40, 0x00, 0xC0, 0x00, 0x40, 0x00, 0xC0};
    std::vector<uint8_t> silent(8, 0);

    const float rms = pcm16_rms(half);
    std::cout << "RMS: " << rms << ", dB: " << rms_to_db(rms) << std::endl;

    bool passed = std::fabs(rms - 0.5f) < 1e-6f &&
                  std::fabs(rms_to_db(rms) + 6.0206f) < 1e-3f &&
                  std::fabs(rms_to_db(1.0f)) < 1e-6f &&
                  pcm16_rms(std::vector<uint8_t>()) == 0.0f &&
                  pcm16_rms(silent) == 0.0f &&
                  rms_to_db(0.0f) == -80.0f &&
                  rms_to_db(-1.0f) == -80.0f;

    return report(9, passed);
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Audio Digitizer Unit Tests" << std::endl;
    std::cout << "Testing: Ring Buffer to PCM16 Frames" << std::endl;
    std::cout << "========================================" << std::endl;

    bool all_passed = true;

    all_passed &= test_seam_window();
    all_passed &= test_pcm_packing();
    all_passed &= test_stereo_downmix();
    all_passed &= test_not_ready();
    all_passed &= test_capacity_clamp();
    all_passed &= test_device_faults();
    all_passed &= test_tone_level();
    all_passed &= test_start_failure();
    all_passed &= test_level_helpers();

    std::cout << "\n========================================" << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL AUDIO DIGITIZER TESTS PASSED" << std::endl;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}

#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <chrono>

// One fixed-duration block of mono PCM. Every frame in a running engine has
// exactly FrameFormat::samples samples.
struct AudioFrame {
    std::vector<float> samples;   // [-1, 1]
    uint64_t sequence = 0;
    std::chrono::steady_clock::time_point timestamp{};
};

struct FrameFormat {
    size_t samples    = 1920;   // 80 ms at 24 kHz
    int    sampleRate = 24000;

    std::chrono::microseconds period() const {
        if (sampleRate <= 0) return std::chrono::microseconds(0);
        return std::chrono::microseconds(
            static_cast<long long>(samples) * 1000000LL / sampleRate);
    }
};

inline AudioFrame makeSilence(const FrameFormat& fmt, uint64_t sequence) {
    AudioFrame frame;
    frame.samples.assign(fmt.samples, 0.0f);
    frame.sequence  = sequence;
    frame.timestamp = std::chrono::steady_clock::now();
    return frame;
}

// Pad with zeros or truncate so the frame matches the configured length.
inline void conformFrame(AudioFrame& frame, const FrameFormat& fmt) {
    if (frame.samples.size() != fmt.samples) {
        frame.samples.resize(fmt.samples, 0.0f);
    }
}

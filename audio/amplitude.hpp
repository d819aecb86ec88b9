#pragma once
#include <atomic>
#include <vector>

// ------------------------------------------------------------
// AmplitudeCell
// Latest output level in [0,1]. The audio loop is the only writer;
// the animator and broadcaster read it whenever they like.
// ------------------------------------------------------------
class AmplitudeCell {
public:
    void store(float value);        // clamps to [0,1]
    float load() const;

private:
    std::atomic<float> value_{0.0f};
};

namespace Amplitude {
    // Root-mean-square of the block (0 for empty input).
    float rms(const std::vector<float>& samples);

    // rms * gain, clamped to [0,1]. NaN/inf inputs map to 0 or 1.
    float level(const std::vector<float>& samples, float gain = 1.0f);

    float clamp01(float value);
}

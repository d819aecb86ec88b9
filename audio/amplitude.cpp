#include "audio/amplitude.hpp"

#include <cmath>

void AmplitudeCell::store(float value) {
    value_.store(Amplitude::clamp01(value), std::memory_order_release);
}

float AmplitudeCell::load() const {
    return value_.load(std::memory_order_acquire);
}

namespace Amplitude {

float clamp01(float value) {
    if (std::isnan(value)) return 0.0f;
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

float rms(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;

    double energy = 0.0;
    for (float s : samples) energy += static_cast<double>(s) * s;
    energy /= samples.size();

    return static_cast<float>(std::sqrt(energy));
}

float level(const std::vector<float>& samples, float gain) {
    return clamp01(rms(samples) * gain);
}

} // namespace Amplitude

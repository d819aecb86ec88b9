#include "wake/wake_gate.hpp"
#include "logger.hpp"

#include <algorithm>

namespace Wake {

bool WakeWordGate::accept(const AudioFrame& frame, float level) {
    bool awake = detect(frame, level) || triggered_.load();

    // Only log transitions, never every frame
    if (awake != lastAwake_) {
        lastAwake_ = awake;
        LOG_TRACE("Wake", name() + (awake ? ": now awake" : ": now asleep"));
    }
    return awake;
}

void WakeWordGate::reset() {
    triggered_.store(false);
    onReset();
}

ThresholdDetector::ThresholdDetector(float threshold, int triggerFrames, int releaseFrames)
    : threshold_(threshold),
      triggerFrames_(std::max(1, triggerFrames)),
      releaseFrames_(std::max(1, releaseFrames)) {}

void ThresholdDetector::onReset() {
    loud_ = 0;
    quiet_ = 0;
    awake_ = false;
}

bool ThresholdDetector::detect(const AudioFrame&, float level) {
    if (level >= threshold_) {
        ++loud_;
        quiet_ = 0;
        if (loud_ >= triggerFrames_) awake_ = true;
    } else {
        loud_ = 0;
        if (awake_ && ++quiet_ >= releaseFrames_) {
            awake_ = false;
            quiet_ = 0;
        }
    }
    return awake_;
}

std::unique_ptr<WakeWordGate> makeGate(const std::string& mode, float threshold,
                                       int triggerFrames, int releaseFrames) {
    if (mode == "always_on") return std::make_unique<AlwaysOn>();
    if (mode == "threshold") return std::make_unique<ThresholdDetector>(threshold, triggerFrames, releaseFrames);
    return nullptr;
}

} // namespace Wake

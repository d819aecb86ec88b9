#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "audio/audio_frame.hpp"

namespace Wake {

// ------------------------------------------------------------
// WakeWordGate
// Decides per captured frame whether the engine is awake. Called from the
// audio loop only, except trigger() which any thread may call (host hotkey
// or command).
// ------------------------------------------------------------
class WakeWordGate {
public:
    virtual ~WakeWordGate() = default;

    virtual std::string name() const = 0;

    // level is the frame's amplitude in [0,1]
    bool accept(const AudioFrame& frame, float level);

    // Called when a turn is over.
    void reset();

    // Hold the gate open until the next reset().
    void trigger() { triggered_.store(true); }

protected:
    virtual bool detect(const AudioFrame& frame, float level) = 0;
    virtual void onReset() {}

private:
    std::atomic<bool> triggered_{false};
    bool lastAwake_ = false;
};

class AlwaysOn : public WakeWordGate {
public:
    std::string name() const override { return "always_on"; }

protected:
    bool detect(const AudioFrame&, float) override { return true; }
};

// Awake after triggerFrames loud frames in a row; asleep again after
// releaseFrames quiet frames in a row.
class ThresholdDetector : public WakeWordGate {
public:
    ThresholdDetector(float threshold, int triggerFrames, int releaseFrames);

    std::string name() const override { return "threshold"; }

protected:
    bool detect(const AudioFrame& frame, float level) override;
    void onReset() override;

private:
    float threshold_;
    int triggerFrames_;
    int releaseFrames_;
    int loud_ = 0;
    int quiet_ = 0;
    bool awake_ = false;
};

// "always_on" or "threshold"; nullptr for anything else.
std::unique_ptr<WakeWordGate> makeGate(const std::string& mode, float threshold,
                                       int triggerFrames, int releaseFrames);

} // namespace Wake

#include "audio/synthetic_device.hpp"
#include "logger.hpp"

#include <cmath>
#include <thread>
#include <algorithm>

static constexpr double kTwoPi = 6.283185307179586;

static void waitForSlot(std::chrono::steady_clock::time_point& deadline,
                        std::chrono::microseconds period) {
    auto now = std::chrono::steady_clock::now();
    if (deadline.time_since_epoch().count() == 0 || deadline + period < now) {
        deadline = now;
    }
    std::this_thread::sleep_until(deadline);
    deadline += period;
}

// ============================================================
// SyntheticSource
// ============================================================
SyntheticSource::SyntheticSource(const FrameFormat& fmt, int retryLimit, bool paced)
    : AudioFrameSource(fmt, retryLimit), paced_(paced) {}

void SyntheticSource::setSilence() {
    std::lock_guard<std::mutex> lock(mtx_);
    mode_ = Mode::Silence;
}

void SyntheticSource::setTone(float frequencyHz, float amplitude) {
    std::lock_guard<std::mutex> lock(mtx_);
    mode_ = Mode::Tone;
    frequency_ = frequencyHz;
    toneAmplitude_ = amplitude;
    phase_ = 0.0;
}

void SyntheticSource::setScript(const std::vector<float>& samples, bool loop) {
    std::lock_guard<std::mutex> lock(mtx_);
    mode_ = Mode::Script;
    script_ = samples;
    scriptPos_ = 0;
    scriptLoop_ = loop;
}

bool SyntheticSource::open(EngineError* err) {
    if (failOpen_) {
        EngineError e = ErrorManager::report(ErrorKind::Device, "ERR_DEVICE_UNAVAILABLE",
                                             "synthetic source configured to fail");
        if (err) *err = e;
        return false;
    }
    open_ = true;
    deadline_ = {};
    LOG_DEBUG("Audio", std::string("Synthetic source open (") + (paced_ ? "paced" : "unpaced") + ")");
    return true;
}

void SyntheticSource::close() {
    open_ = false;
}

bool SyntheticSource::readDevice(std::vector<float>& out, std::string& err) {
    if (failReads_.load() > 0) {
        failReads_.fetch_sub(1);
        err = "injected read fault";
        return false;
    }

    if (paced_) waitForSlot(deadline_, fmt_.period());

    out.assign(fmt_.samples, 0.0f);

    std::lock_guard<std::mutex> lock(mtx_);
    switch (mode_) {
        case Mode::Silence:
            break;

        case Mode::Tone: {
            const double step = kTwoPi * frequency_ / fmt_.sampleRate;
            for (auto& s : out) {
                s = toneAmplitude_ * static_cast<float>(std::sin(phase_));
                phase_ += step;
            }
            phase_ = std::fmod(phase_, kTwoPi);
            break;
        }

        case Mode::Script:
            for (auto& s : out) {
                if (scriptPos_ >= script_.size()) {
                    if (!scriptLoop_ || script_.empty()) break;
                    scriptPos_ = 0;
                }
                s = script_[scriptPos_++];
            }
            break;
    }
    return true;
}

// ============================================================
// NullSink
// ============================================================
NullSink::NullSink(const FrameFormat& fmt, int retryLimit, bool paced)
    : AudioFrameSink(fmt, retryLimit), paced_(paced) {}

bool NullSink::open(EngineError*) {
    open_ = true;
    deadline_ = {};
    return true;
}

void NullSink::close() {
    open_ = false;
}

float NullSink::peakAbs() const {
    return peak_.load();
}

bool NullSink::writeDevice(const std::vector<float>& samples, std::string& err) {
    if (failWrites_.load() > 0) {
        failWrites_.fetch_sub(1);
        err = "injected write fault";
        return false;
    }

    if (paced_) waitForSlot(deadline_, fmt_.period());

    float peak = peak_.load();
    for (float s : samples) peak = std::max(peak, std::fabs(s));
    peak_.store(peak);

    writes_.fetch_add(1);
    return true;
}

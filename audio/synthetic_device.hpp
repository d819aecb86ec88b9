#pragma once
#include <atomic>
#include <mutex>
#include <vector>
#include "audio/audio_device.hpp"

// ------------------------------------------------------------
// SyntheticSource
// Device-free source for tests and the headless host. Paced mode sleeps
// on the frame grid like a real device; unpaced mode returns at once.
// ------------------------------------------------------------
class SyntheticSource : public AudioFrameSource {
public:
    enum class Mode { Silence, Tone, Script };

    SyntheticSource(const FrameFormat& fmt, int retryLimit, bool paced);

    void setSilence();
    void setTone(float frequencyHz, float amplitude);

    // Play samples once (or repeatedly when loop is set), then silence.
    void setScript(const std::vector<float>& samples, bool loop = false);

    // The next n device reads fail. A large n exhausts the retry budget.
    void failNextReads(int n) { failReads_.store(n); }
    void failOpen(bool fail) { failOpen_ = fail; }

    bool open(EngineError* err) override;
    void close() override;
    std::string name() const override { return "Synthetic input"; }

    bool isOpen() const { return open_.load(); }

protected:
    bool readDevice(std::vector<float>& out, std::string& err) override;

private:
    bool paced_;
    std::chrono::steady_clock::time_point deadline_{};

    std::mutex mtx_;            // guards the generator settings below
    Mode mode_ = Mode::Silence;
    float frequency_ = 440.0f;
    float toneAmplitude_ = 0.5f;
    double phase_ = 0.0;
    std::vector<float> script_;
    size_t scriptPos_ = 0;
    bool scriptLoop_ = false;

    std::atomic<int> failReads_{0};
    std::atomic<bool> open_{false};
    bool failOpen_ = false;
};

// ------------------------------------------------------------
// NullSink
// Discards audio. Keeps the last played frame for inspection.
// ------------------------------------------------------------
class NullSink : public AudioFrameSink {
public:
    NullSink(const FrameFormat& fmt, int retryLimit, bool paced);

    void failNextWrites(int n) { failWrites_.store(n); }

    bool open(EngineError* err) override;
    void close() override;
    std::string name() const override { return "Null output"; }

    bool isOpen() const { return open_.load(); }
    uint64_t writes() const { return writes_.load(); }
    float peakAbs() const;

protected:
    bool writeDevice(const std::vector<float>& samples, std::string& err) override;

private:
    bool paced_;
    std::chrono::steady_clock::time_point deadline_{};
    std::atomic<int> failWrites_{0};
    std::atomic<bool> open_{false};
    std::atomic<uint64_t> writes_{0};
    std::atomic<float> peak_{0.0f};
};

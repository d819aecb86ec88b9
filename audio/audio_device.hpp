#pragma once
#include <atomic>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include "audio/audio_frame.hpp"
#include "error_manager.hpp"

// ============================================================
// AudioFrameSource
// capture() hands out exactly one frame per call and blocks for at most
// one frame period. Device failures are retried retryLimit times; after
// that the source degrades to a paced silence generator for good.
// ============================================================
class AudioFrameSource {
public:
    AudioFrameSource(const FrameFormat& fmt, int retryLimit);
    virtual ~AudioFrameSource() = default;

    AudioFrameSource(const AudioFrameSource&) = delete;
    AudioFrameSource& operator=(const AudioFrameSource&) = delete;

    virtual bool open(EngineError* err) = 0;
    virtual void close() = 0;
    virtual std::string name() const = 0;

    AudioFrame capture();

    void setErrorSink(ErrorSink* sink) { errorSink_ = sink; }
    bool degraded() const { return degraded_.load(); }
    uint64_t framesCaptured() const { return sequence_; }
    const FrameFormat& format() const { return fmt_; }

protected:
    // Fill out with fmt_.samples samples. Return false (and set err) on failure.
    virtual bool readDevice(std::vector<float>& out, std::string& err) = 0;

    FrameFormat fmt_;

private:
    void paceSilence();

    int retryLimit_;
    std::atomic<bool> degraded_{false};
    uint64_t sequence_ = 0;
    ErrorSink* errorSink_ = nullptr;
    std::chrono::steady_clock::time_point nextDeadline_{};
};

// ============================================================
// AudioFrameSink
// play() accepts exactly one frame per period. Callers that have nothing
// ready call playSilence() so the device never underruns.
// ============================================================
class AudioFrameSink {
public:
    AudioFrameSink(const FrameFormat& fmt, int retryLimit);
    virtual ~AudioFrameSink() = default;

    AudioFrameSink(const AudioFrameSink&) = delete;
    AudioFrameSink& operator=(const AudioFrameSink&) = delete;

    virtual bool open(EngineError* err) = 0;
    virtual void close() = 0;
    virtual std::string name() const = 0;

    void play(const AudioFrame& frame);
    void playSilence();

    void setErrorSink(ErrorSink* sink) { errorSink_ = sink; }
    bool degraded() const { return degraded_.load(); }
    uint64_t framesPlayed() const { return played_; }
    uint64_t silenceFrames() const { return silence_; }
    const FrameFormat& format() const { return fmt_; }

protected:
    virtual bool writeDevice(const std::vector<float>& samples, std::string& err) = 0;

    FrameFormat fmt_;

private:
    void paceSilence();

    int retryLimit_;
    std::atomic<bool> degraded_{false};
    uint64_t played_ = 0;
    uint64_t silence_ = 0;
    ErrorSink* errorSink_ = nullptr;
    std::vector<float> silenceBuffer_;
    std::chrono::steady_clock::time_point nextDeadline_{};
};

// ============================================================
// PortAudio devices (blocking read/write streams, mono float32)
// deviceIndex < 0 selects the host default device.
// ============================================================
typedef void PaStream;

class PortAudioSource : public AudioFrameSource {
public:
    PortAudioSource(const FrameFormat& fmt, int retryLimit, int deviceIndex = -1);
    ~PortAudioSource() override;

    bool open(EngineError* err) override;
    void close() override;
    std::string name() const override { return "PortAudio input"; }

protected:
    bool readDevice(std::vector<float>& out, std::string& err) override;

private:
    int deviceIndex_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
};

class PortAudioSink : public AudioFrameSink {
public:
    PortAudioSink(const FrameFormat& fmt, int retryLimit, int deviceIndex = -1);
    ~PortAudioSink() override;

    bool open(EngineError* err) override;
    void close() override;
    std::string name() const override { return "PortAudio output"; }

protected:
    bool writeDevice(const std::vector<float>& samples, std::string& err) override;

private:
    int deviceIndex_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
};

namespace Audio {
    struct DeviceInfo {
        int index = -1;
        std::string name;
        std::string hostApi;
        int maxInputChannels = 0;
        int maxOutputChannels = 0;
        double defaultSampleRate = 0.0;
        bool isDefaultInput = false;
        bool isDefaultOutput = false;
    };

    // Enumerate PortAudio devices. Empty on PortAudio init failure.
    std::vector<DeviceInfo> listDevices();
    void logDevices();
}

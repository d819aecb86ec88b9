#pragma once
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include "audio/audio_frame.hpp"
#include "codec/codec.hpp"
#include "error_manager.hpp"

// ------------------------------------------------------------
// CodecAdapter
// Owns the codec backend and the pending input frames of the audio loop.
//
// Each submitted frame earns one frame period of time budget; every
// encode/decode spends the measured wall time. While the budget is
// negative the loop skips coding and plays silence, and pending input is
// capped at maxPending with the oldest frame dropped first. A fast codec
// therefore sees exactly one frame in, one frame out.
// ------------------------------------------------------------
class CodecAdapter {
public:
    struct Stats {
        uint64_t encoded = 0;
        uint64_t decoded = 0;
        uint64_t dropped = 0;
        uint64_t failures = 0;
        double   avgMicros = 0.0;    // moving average of per-frame coding time
    };

    CodecAdapter(std::unique_ptr<Codec> codec, const FrameFormat& fmt, size_t maxPending);

    void setErrorSink(ErrorSink* sink) { errorSink_ = sink; }

    // Queue a captured frame. Returns false when an older frame was dropped.
    bool submit(AudioFrame frame);

    // Oldest pending frame, if the time budget allows coding this period.
    std::optional<AudioFrame> takeReady();

    // Failures return empty tokens / a silent frame and record a CodecError.
    Tokens encode(const AudioFrame& frame);
    AudioFrame decode(const Tokens& tokens, uint64_t sequence);

    // Charge time spent outside the codec (model step) to the same budget.
    void charge(std::chrono::microseconds elapsed);

    bool overloaded() const;
    size_t pending() const { return pending_.size(); }
    const Stats& stats() const { return stats_; }
    const FrameFormat& format() const { return fmt_; }
    void reset();

private:
    void account(std::chrono::microseconds elapsed);

    std::unique_ptr<Codec> codec_;
    FrameFormat fmt_;
    size_t maxPending_;
    ErrorSink* errorSink_ = nullptr;

    std::deque<AudioFrame> pending_;
    std::chrono::microseconds budget_{0};
    std::chrono::microseconds spentThisFrame_{0};
    bool avgPrimed_ = false;
    Stats stats_;
};

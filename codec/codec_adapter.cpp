#include "codec/codec_adapter.hpp"
#include "logger.hpp"

#include <algorithm>

using Clock = std::chrono::steady_clock;
using std::chrono::microseconds;
using std::chrono::duration_cast;

CodecAdapter::CodecAdapter(std::unique_ptr<Codec> codec, const FrameFormat& fmt, size_t maxPending)
    : codec_(std::move(codec)), fmt_(fmt), maxPending_(std::max<size_t>(1, maxPending)) {}

bool CodecAdapter::submit(AudioFrame frame) {
    const microseconds period = fmt_.period();
    budget_ = std::min(budget_ + period, period);

    conformFrame(frame, fmt_);
    pending_.push_back(std::move(frame));

    if (pending_.size() > maxPending_) {
        uint64_t seq = pending_.front().sequence;
        pending_.pop_front();
        ++stats_.dropped;
        LOG_TRACE("Codec", "Dropped pending frame #" + std::to_string(seq) +
                  " (avg " + std::to_string(static_cast<long long>(stats_.avgMicros)) + " us)");
        return false;
    }
    return true;
}

std::optional<AudioFrame> CodecAdapter::takeReady() {
    if (pending_.empty() || budget_.count() <= 0) return std::nullopt;

    AudioFrame frame = std::move(pending_.front());
    pending_.pop_front();
    return frame;
}

Tokens CodecAdapter::encode(const AudioFrame& frame) {
    // Moving average over the whole previous frame (encode, model, decode)
    if (spentThisFrame_.count() > 0) {
        double us = static_cast<double>(spentThisFrame_.count());
        stats_.avgMicros = avgPrimed_ ? stats_.avgMicros * 0.9 + us * 0.1 : us;
        avgPrimed_ = true;
    }
    spentThisFrame_ = microseconds(0);

    auto t0 = Clock::now();

    Tokens tokens;
    std::string err;
    bool ok = false;
    try {
        ok = codec_ && codec_->encode(frame.samples, tokens, err);
        if (!codec_) err = "no codec backend";
    } catch (const std::exception& e) {
        err = e.what();
        ok = false;
    }

    account(duration_cast<microseconds>(Clock::now() - t0));

    if (!ok) {
        ++stats_.failures;
        ErrorManager::reportTo(errorSink_, ErrorKind::Codec, "ERR_CODEC_FRAME",
                               "encode #" + std::to_string(frame.sequence) + ": " + err);
        return {};
    }

    ++stats_.encoded;
    return tokens;
}

AudioFrame CodecAdapter::decode(const Tokens& tokens, uint64_t sequence) {
    auto t0 = Clock::now();

    AudioFrame frame;
    frame.sequence = sequence;

    std::string err;
    bool ok = false;
    try {
        ok = codec_ && codec_->decode(tokens, frame.samples, err);
        if (!codec_) err = "no codec backend";
    } catch (const std::exception& e) {
        err = e.what();
        ok = false;
    }

    account(duration_cast<microseconds>(Clock::now() - t0));

    if (!ok) {
        ++stats_.failures;
        ErrorManager::reportTo(errorSink_, ErrorKind::Codec, "ERR_CODEC_FRAME",
                               "decode #" + std::to_string(sequence) + ": " + err);
        frame.samples.assign(fmt_.samples, 0.0f);
    } else {
        ++stats_.decoded;
        conformFrame(frame, fmt_);
    }

    frame.timestamp = Clock::now();
    return frame;
}

void CodecAdapter::charge(microseconds elapsed) {
    account(elapsed);
}

void CodecAdapter::account(microseconds elapsed) {
    spentThisFrame_ += elapsed;

    // Floor keeps recovery after a single long stall bounded.
    const microseconds floor = -fmt_.period() * static_cast<long long>(maxPending_ + 1);
    budget_ = std::max(budget_ - elapsed, floor);
}

bool CodecAdapter::overloaded() const {
    return stats_.avgMicros > static_cast<double>(fmt_.period().count());
}

void CodecAdapter::reset() {
    pending_.clear();
    budget_ = microseconds(0);
    spentThisFrame_ = microseconds(0);
}

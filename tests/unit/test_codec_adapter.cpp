#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include "codec/codec_adapter.hpp"
#include "codec/mulaw_codec.hpp"
#include "logger.hpp"

static AudioFrame sineFrame(const FrameFormat& fmt, uint64_t seq, float amp = 0.5f) {
    AudioFrame f;
    f.sequence = seq;
    f.samples.resize(fmt.samples);
    for (size_t i = 0; i < fmt.samples; ++i) {
        f.samples[i] = amp * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * i / fmt.sampleRate));
    }
    return f;
}

class ThrowingCodec : public Codec {
public:
    std::string name() const override { return "throwing"; }
    bool encode(const std::vector<float>&, Tokens&, std::string&) override {
        throw std::runtime_error("backend exploded");
    }
    bool decode(const Tokens&, std::vector<float>&, std::string&) override {
        throw std::runtime_error("backend exploded");
    }
};

static void mulawSamples() {
    assert(MuLawCodec::decodeSample(MuLawCodec::encodeSample(0)) == 0);
    for (int v : {-32768, -20000, -1000, -1, 1, 100, 5000, 32767}) {
        int16_t back = MuLawCodec::decodeSample(MuLawCodec::encodeSample(static_cast<int16_t>(v)));
        // μ-law keeps the sign and stays within one quantization step
        assert((back >= 0) == (v >= 0) || std::abs(v) < 8);
        assert(std::abs(back - v) <= std::max(8, std::abs(v) / 16));
    }
}

static void roundTripThroughAdapter() {
    FrameFormat fmt;
    CodecAdapter codec(makeCodec("mulaw"), fmt, 2);
    AudioFrame in = sineFrame(fmt, 7);

    Tokens tokens = codec.encode(in);
    assert(tokens.size() == fmt.samples);

    AudioFrame out = codec.decode(tokens, 7);
    assert(out.sequence == 7);
    assert(out.samples.size() == fmt.samples);
    for (size_t i = 0; i < fmt.samples; ++i) {
        assert(std::fabs(out.samples[i] - in.samples[i]) < 0.04f);
    }
    assert(codec.stats().encoded == 1 && codec.stats().decoded == 1);
    assert(codec.stats().failures == 0);
}

static void failuresBecomeSilence() {
    FrameFormat fmt;
    LastErrorCell errors;
    CodecAdapter codec(makeCodec("mulaw"), fmt, 2);
    codec.setErrorSink(&errors);

    AudioFrame bad = sineFrame(fmt, 1);
    bad.samples[10] = std::numeric_limits<float>::quiet_NaN();
    assert(codec.encode(bad).empty());
    assert(codec.stats().failures == 1);
    assert(errors.get()->code == "ERR_CODEC_FRAME");
    assert(errors.get()->kind == ErrorKind::Codec);

    Tokens garbage(fmt.samples, 300);
    AudioFrame silent = codec.decode(garbage, 2);
    assert(silent.samples.size() == fmt.samples);
    for (float s : silent.samples) assert(s == 0.0f);
    assert(codec.stats().failures == 2);
    assert(errors.count() == 2);

    // Exceptions from the backend are contained too
    CodecAdapter throwing(std::make_unique<ThrowingCodec>(), fmt, 2);
    throwing.setErrorSink(&errors);
    assert(throwing.encode(sineFrame(fmt, 3)).empty());
    AudioFrame s2 = throwing.decode(Tokens(10, 1), 3);
    assert(s2.samples.size() == fmt.samples);
    assert(throwing.stats().failures == 2);

    // A short decode result is padded to a full frame
    AudioFrame shortFrame = codec.decode(Tokens(100, 0xFF), 4);
    assert(shortFrame.samples.size() == fmt.samples);
}

static void fastCodecNeverDrops() {
    FrameFormat fmt;
    CodecAdapter codec(makeCodec("mulaw"), fmt, 2);
    for (uint64_t i = 0; i < 50; ++i) {
        assert(codec.submit(sineFrame(fmt, i)));
        auto ready = codec.takeReady();
        assert(ready.has_value());
        assert(ready->sequence == i);
        codec.decode(codec.encode(*ready), i);
    }
    assert(codec.stats().dropped == 0);
    assert(codec.pending() == 0);
    assert(!codec.overloaded());
}

static void slowCodecDropsOldest() {
    FrameFormat fmt;
    const auto period = fmt.period();
    CodecAdapter codec(makeCodec("mulaw"), fmt, 2);

    assert(codec.submit(sineFrame(fmt, 1)));
    auto first = codec.takeReady();
    assert(first && first->sequence == 1);

    // Model + codec took three frame periods
    codec.charge(period * 3);

    assert(codec.submit(sineFrame(fmt, 2)));
    assert(!codec.takeReady());
    assert(codec.submit(sineFrame(fmt, 3)));
    assert(!codec.takeReady());
    assert(codec.pending() == 2);

    // Third pending frame pushes out the oldest (#2)
    assert(!codec.submit(sineFrame(fmt, 4)));
    assert(codec.stats().dropped == 1);
    auto ready = codec.takeReady();
    assert(ready && ready->sequence == 3);
    assert(codec.pending() == 1);

    // Next encode folds the stall into the moving average
    codec.encode(*ready);
    assert(codec.overloaded());

    // A huge stall is floored: recovery within a bounded number of frames
    codec.charge(std::chrono::seconds(30));
    bool recovered = false;
    for (uint64_t i = 10; i < 16 && !recovered; ++i) {
        codec.submit(sineFrame(fmt, i));
        assert(codec.pending() <= 2);
        recovered = codec.takeReady().has_value();
    }
    assert(recovered);

    codec.reset();
    assert(codec.pending() == 0);
}

int main() {
    setLogLevel(LogLevel::Off);

    mulawSamples();
    roundTripThroughAdapter();
    failuresBecomeSilence();
    fastCodecNeverDrops();
    slowCodecDropsOldest();
    return 0;
}

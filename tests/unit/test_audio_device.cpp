#include <cassert>
#include <cmath>
#include "audio/synthetic_device.hpp"
#include "audio/amplitude.hpp"
#include "logger.hpp"

using namespace std::chrono;

// Returns a short block every time.
class ShortSource : public AudioFrameSource {
public:
    explicit ShortSource(const FrameFormat& fmt) : AudioFrameSource(fmt, 0) {}
    bool open(EngineError*) override { return true; }
    void close() override {}
    std::string name() const override { return "short"; }

protected:
    bool readDevice(std::vector<float>& out, std::string&) override {
        out.assign(fmt_.samples / 2, 0.25f);
        return true;
    }
};

static FrameFormat smallFormat() {
    FrameFormat fmt;
    fmt.samples = 240;          // 10 ms at 24 kHz
    fmt.sampleRate = 24000;
    return fmt;
}

static void retriesRecover() {
    FrameFormat fmt = smallFormat();
    LastErrorCell errors;
    SyntheticSource src(fmt, 3, false);
    src.setErrorSink(&errors);
    assert(src.open(nullptr));
    src.setTone(440.0f, 0.5f);

    src.failNextReads(3);
    AudioFrame f = src.capture();
    assert(!src.degraded());
    assert(f.samples.size() == fmt.samples);
    assert(Amplitude::level(f.samples) > 0.1f);
    assert(errors.count() == 0);
}

static void exhaustedRetriesDegrade() {
    FrameFormat fmt = smallFormat();
    LastErrorCell errors;
    SyntheticSource src(fmt, 2, false);
    src.setErrorSink(&errors);
    assert(src.open(nullptr));
    src.setTone(440.0f, 0.5f);

    src.failNextReads(100);
    AudioFrame f0 = src.capture();
    assert(src.degraded());
    assert(f0.samples.size() == fmt.samples);
    for (float s : f0.samples) assert(s == 0.0f);
    assert(errors.count() == 2);
    assert(errors.get()->code == "ERR_DEVICE_DEGRADED");

    // Degraded for good, still one frame per period
    src.failNextReads(0);
    auto t0 = steady_clock::now();
    for (uint64_t i = 1; i <= 5; ++i) {
        AudioFrame f = src.capture();
        assert(f.sequence == i);
        assert(f.samples.size() == fmt.samples);
        assert(Amplitude::level(f.samples) == 0.0f);
    }
    assert(steady_clock::now() - t0 >= fmt.period() * 4);
    assert(errors.count() == 2);
}

static void openFailureIsReported() {
    SyntheticSource src(smallFormat(), 3, false);
    src.failOpen(true);
    EngineError err;
    assert(!src.open(&err));
    assert(err.code == "ERR_DEVICE_UNAVAILABLE");
    assert(err.kind == ErrorKind::Device);
    assert(!src.isOpen());
}

static void shortReadsAreConformed() {
    FrameFormat fmt = smallFormat();
    ShortSource src(fmt);
    AudioFrame f = src.capture();
    assert(f.samples.size() == fmt.samples);
    assert(f.samples.front() == 0.25f);
    assert(f.samples.back() == 0.0f);
}

static void scriptPlaysOnceThenSilence() {
    FrameFormat fmt = smallFormat();
    SyntheticSource src(fmt, 0, false);
    assert(src.open(nullptr));
    src.setScript(std::vector<float>(fmt.samples + 10, 0.5f));

    AudioFrame a = src.capture();
    AudioFrame b = src.capture();
    AudioFrame c = src.capture();
    assert(a.samples.back() == 0.5f);
    assert(b.samples[9] == 0.5f && b.samples[10] == 0.0f);
    assert(Amplitude::level(c.samples) == 0.0f);
}

static void sinkDegradesAfterRetries() {
    FrameFormat fmt = smallFormat();
    LastErrorCell errors;
    NullSink sink(fmt, 1, false);
    sink.setErrorSink(&errors);
    assert(sink.open(nullptr));

    AudioFrame loud;
    loud.samples.assign(fmt.samples, 0.75f);

    sink.failNextWrites(1);
    sink.play(loud);
    assert(!sink.degraded());
    assert(sink.writes() == 1);
    assert(sink.peakAbs() == 0.75f);

    sink.failNextWrites(2);
    sink.play(loud);
    assert(sink.degraded());
    assert(errors.count() == 2);

    // Short frames are padded; degraded sink still counts frames
    AudioFrame shortFrame;
    shortFrame.samples.assign(10, 0.1f);
    sink.play(shortFrame);
    sink.playSilence();
    assert(sink.framesPlayed() == 4);
    assert(sink.silenceFrames() == 1);
    assert(sink.writes() == 1);
}

static void amplitudeCellClamps() {
    AmplitudeCell cell;
    cell.store(3.0f);
    assert(cell.load() == 1.0f);
    cell.store(-1.0f);
    assert(cell.load() == 0.0f);
    cell.store(std::nanf(""));
    assert(cell.load() == 0.0f);
}

int main() {
    setLogLevel(LogLevel::Off);

    retriesRecover();
    exhaustedRetriesDegrade();
    openFailureIsReported();
    shortReadsAreConformed();
    scriptPlaysOnceThenSilence();
    sinkDegradesAfterRetries();
    amplitudeCellClamps();
    return 0;
}

#include <cassert>
#include <cmath>
#include <thread>
#include "visualizer/visualizer_animator.hpp"
#include "logger.hpp"

using namespace std::chrono;

// Counts calls; reports "closed" after closeAfter draws.
class CountingRenderer : public VisualizerRenderer {
public:
    CountingRenderer(std::atomic<int>& draws, std::atomic<int>& closes, int closeAfter)
        : draws_(draws), closes_(closes), closeAfter_(closeAfter) {}

    std::string name() const override { return "counting"; }
    bool open() override { return true; }
    bool draw(const AnimationFrame&) override { return ++draws_ < closeAfter_; }
    void close() override { ++closes_; }

private:
    std::atomic<int>& draws_;
    std::atomic<int>& closes_;
    int closeAfter_;
};

static void classification() {
    assert(classifyAmplitude(0.0f) == AmplitudeLevel::Silent);
    assert(classifyAmplitude(0.009f) == AmplitudeLevel::Silent);
    assert(classifyAmplitude(0.01f) == AmplitudeLevel::Quiet);
    assert(classifyAmplitude(0.099f) == AmplitudeLevel::Quiet);
    assert(classifyAmplitude(0.1f) == AmplitudeLevel::Normal);
    assert(classifyAmplitude(0.5f) == AmplitudeLevel::Loud);
    assert(classifyAmplitude(1.0f) == AmplitudeLevel::Loud);
    assert(std::string(amplitudeLevelName(AmplitudeLevel::Normal)) == "Normal");
}

static void orbConverges() {
    OrbAnimState s;
    advanceOrb(s, 1.0f, true);
    assert(s.level > 0.0f && s.level < 1.0f);
    assert(s.scale > 0.9f && s.scale < 1.3f);

    for (int i = 0; i < 100; ++i) advanceOrb(s, 1.0f, true);
    assert(s.level == 1.0f);
    assert(std::fabs(s.scale - 1.3f) < 1e-6f);
    assert(s.glow == 1.0f);

    // Back to rest; out-of-range targets are clamped
    for (int i = 0; i < 100; ++i) advanceOrb(s, -5.0f, false);
    assert(s.level == 0.0f);
    assert(std::fabs(s.scale - 0.9f) < 1e-6f);
    assert(s.glow == 0.0f);
}

static void animatorTicksOnItsOwn() {
    AmplitudeCell amp;
    EngineStateCell state{EngineState::Speaking};
    amp.store(0.8f);

    VisualizerAnimator anim(amp, state, milliseconds(10));
    anim.start();
    assert(anim.running());
    std::this_thread::sleep_for(milliseconds(300));
    anim.stop();
    assert(!anim.running());

    uint64_t ticks = anim.ticks();
    assert(ticks >= 10 && ticks <= 40);

    AnimationFrame f = anim.snapshot();
    assert(f.tick == ticks);
    assert(f.sample == 0.8f);
    assert(f.state == EngineState::Speaking);
    assert(f.orb.level > 0.5f);
    assert(f.level == AmplitudeLevel::Loud);
    assert(f.orb.glow > 0.9f);

    // Stopped: no further ticks
    std::this_thread::sleep_for(milliseconds(50));
    assert(anim.ticks() == ticks);
}

static void rendererClosedByUser() {
    AmplitudeCell amp;
    EngineStateCell state{EngineState::Idle};
    std::atomic<int> draws{0};
    std::atomic<int> closes{0};

    VisualizerAnimator anim(amp, state, milliseconds(5),
                            std::make_unique<CountingRenderer>(draws, closes, 3));
    anim.start();
    std::this_thread::sleep_for(milliseconds(150));
    anim.stop();

    // Closed after the third draw, closed once, animation kept going
    assert(draws == 3);
    assert(closes == 1);
    assert(anim.ticks() > 3);
}

int main() {
    setLogLevel(LogLevel::Off);

    classification();
    orbConverges();
    animatorTicksOnItsOwn();
    rendererClosedByUser();
    return 0;
}

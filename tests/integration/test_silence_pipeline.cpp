#include <cassert>
#include "engine_fixture.hpp"
#include "logger.hpp"

using namespace std::chrono;

// Pure silence in, silence out: the sink gets exactly one frame per
// captured frame and never starves.
static void alwaysOnSilence() {
    EngineConfig cfg = fixture::smallConfig();
    auto rig = fixture::makeRig(cfg);
    rig.source->setSilence();
    SyntheticSource* source = rig.source;
    NullSink* sink = rig.sink;

    EngineError err;
    auto engine = ConversationEngine::create(cfg, std::move(rig.parts), &err);
    assert(engine);
    assert(engine->start(&err));

    auto t0 = steady_clock::now();
    assert(fixture::waitUntil([&] { return engine->stats().framesProcessed >= 100; }, seconds(5)));
    auto elapsed = steady_clock::now() - t0;
    engine->stop();

    auto s = engine->stats();
    assert(!engine->running());
    assert(!source->isOpen());
    assert(!sink->isOpen());

    // One play per frame, every play reached the device
    assert(sink->framesPlayed() == s.framesProcessed);
    assert(sink->writes() == s.framesProcessed);
    assert(s.silentFrames == s.framesProcessed);
    assert(sink->peakAbs() == 0.0f);
    assert(s.framesDropped == 0);
    assert(s.turns == 0);
    assert(!s.sourceDegraded && !s.sinkDegraded);

    // Paced by the source: ~100 frames of 10 ms
    assert(elapsed >= milliseconds(800));

    assert(engine->state() == EngineState::Idle);
    assert(engine->amplitude() == 0.0f);
    assert(engine->memory().messageCount() == 0);
    assert(!engine->lastError().has_value());
}

// With a threshold gate silence never wakes the engine; frames still flow.
static void gatedSilence() {
    EngineConfig cfg = fixture::smallConfig();
    auto rig = fixture::makeRig(cfg);
    rig.source->setSilence();
    rig.parts.gate = std::make_unique<Wake::ThresholdDetector>(0.05f, 3, 10);
    NullSink* sink = rig.sink;
    ScriptedModel* model = rig.model;

    EngineError err;
    auto engine = ConversationEngine::create(cfg, std::move(rig.parts), &err);
    assert(engine);
    assert(engine->start(&err));

    bool everAwake = false;
    fixture::waitUntil([&] {
        if (engine->state() != EngineState::Idle) everAwake = true;
        return engine->stats().framesProcessed >= 50;
    }, seconds(5));
    engine->stop();

    assert(!everAwake);
    auto s = engine->stats();
    assert(s.framesProcessed >= 50);
    assert(sink->framesPlayed() == s.framesProcessed);
    // Nothing reached the model, so no advisory text was consumed
    assert(model->advisorySeen().empty());
    assert(s.advisoryForwarded == 0);
}

// 200 full-size (80 ms) frames, run as fast as the host allows.
static void twoHundredFullFrames() {
    EngineConfig cfg;                       // 1920 samples @ 24 kHz
    auto rig = fixture::makeRig(cfg, false, false);
    rig.source->setSilence();
    NullSink* sink = rig.sink;

    EngineError err;
    auto engine = ConversationEngine::create(cfg, std::move(rig.parts), &err);
    assert(engine);
    assert(engine->start(&err));
    assert(fixture::waitUntil([&] { return engine->stats().framesProcessed >= 200; }, seconds(20)));
    engine->stop();

    auto s = engine->stats();
    assert(s.framesProcessed >= 200);
    assert(sink->framesPlayed() == s.framesProcessed);
    assert(sink->writes() == s.framesProcessed);
    assert(!s.sinkDegraded);
    assert(!engine->lastError().has_value());
}

static void startFailsCleanly() {
    EngineConfig cfg = fixture::smallConfig();
    auto rig = fixture::makeRig(cfg);
    rig.source->failOpen(true);
    NullSink* sink = rig.sink;

    EngineError err;
    auto engine = ConversationEngine::create(cfg, std::move(rig.parts), &err);
    assert(engine);
    assert(!engine->start(&err));
    assert(err.code == "ERR_DEVICE_UNAVAILABLE");
    assert(err.kind == ErrorKind::Device);
    assert(!engine->running());
    assert(!sink->isOpen());
    assert(engine->lastError()->code == "ERR_DEVICE_UNAVAILABLE");
}

static void createRejectsBadInput() {
    EngineConfig cfg = fixture::smallConfig();

    {
        auto rig = fixture::makeRig(cfg);
        rig.parts.model.reset();
        EngineError err;
        assert(!ConversationEngine::create(cfg, std::move(rig.parts), &err));
        assert(err.code == "ERR_CONFIG_INVALID");
    }
    {
        // Devices built for a different frame size
        auto rig = fixture::makeRig(cfg);
        EngineConfig other = cfg;
        other.frame.samples = 480;
        EngineError err;
        assert(!ConversationEngine::create(other, std::move(rig.parts), &err));
        assert(err.code == "ERR_CONFIG_INVALID");
    }
    {
        auto rig = fixture::makeRig(cfg);
        EngineConfig bad = cfg;
        bad.contextQueueCapacity = 0;
        EngineError err;
        assert(!ConversationEngine::create(bad, std::move(rig.parts), &err));
        assert(err.kind == ErrorKind::Config);
    }
}

int main() {
    setLogLevel(LogLevel::Warn);

    alwaysOnSilence();
    gatedSilence();
    twoHundredFullFrames();
    startFailsCleanly();
    createRejectsBadInput();
    return 0;
}

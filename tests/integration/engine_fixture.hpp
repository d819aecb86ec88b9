#pragma once
// Shared setup for the engine integration tests: 10 ms frames, synthetic
// devices, mu-law codec, scripted model.
#include <chrono>
#include <cmath>
#include <thread>
#include "engine/conversation_engine.hpp"
#include "audio/synthetic_device.hpp"
#include "model/scripted_model.hpp"

namespace fixture {

inline EngineConfig smallConfig() {
    EngineConfig cfg;
    cfg.frame.samples = 240;
    cfg.frame.sampleRate = 24000;
    cfg.memoryFile.clear();
    return cfg;
}

// Tone for `speechFrames` frames, then silence.
inline std::vector<float> utterance(const FrameFormat& fmt, int speechFrames, float amp = 0.5f) {
    std::vector<float> pcm(fmt.samples * speechFrames);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = amp * static_cast<float>(std::sin(6.283185307179586 * 300.0 * i / fmt.sampleRate));
    }
    return pcm;
}

struct Rig {
    EngineParts parts;
    SyntheticSource* source = nullptr;
    NullSink* sink = nullptr;
    ScriptedModel* model = nullptr;
};

inline Rig makeRig(const EngineConfig& cfg, bool pacedSink = true, bool pacedSource = true) {
    Rig rig;
    auto source = std::make_unique<SyntheticSource>(cfg.frame, cfg.deviceRetryLimit, pacedSource);
    auto sink = std::make_unique<NullSink>(cfg.frame, cfg.deviceRetryLimit, pacedSink);

    ScriptedModel::Options opts;
    opts.silenceFrames = 10;
    opts.thinkFrames = 2;
    auto model = std::make_unique<ScriptedModel>(makeCodec("mulaw"), cfg.frame,
                                                 ScriptedModel::defaultTurns(), opts);

    rig.source = source.get();
    rig.sink = sink.get();
    rig.model = model.get();

    rig.parts.source = std::move(source);
    rig.parts.sink = std::move(sink);
    rig.parts.codec = makeCodec("mulaw");
    rig.parts.model = std::move(model);
    return rig;
}

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace fixture

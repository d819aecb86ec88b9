#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "audio/amplitude.hpp"
#include "engine/engine_state.hpp"

// ===========================================================
// Amplitude classification
// ===========================================================
enum class AmplitudeLevel {
    Silent,   // < 0.01
    Quiet,    // < 0.1
    Normal,   // < 0.5
    Loud
};

AmplitudeLevel classifyAmplitude(float value);
const char* amplitudeLevelName(AmplitudeLevel level);

// ===========================================================
// Animation state + snapshot
// ===========================================================
struct OrbAnimState {
    float level = 0.f;   // displayed level, chases the amplitude sample
    float scale = 0.9f;  // orb radius factor, 0.9 at rest
    float glow  = 0.f;   // 0..1, follows the engine state
};

// Time-based exponential approach toward the targets for this tick.
// dtSeconds: time since the previous tick. timeConstant: smaller = faster.
void advanceOrb(OrbAnimState& state, float targetLevel, bool active,
                float dtSeconds = 0.033f, float timeConstant = 0.08f);

// Immutable copy of one tick, safe to hand to any thread.
struct AnimationFrame {
    uint64_t       tick      = 0;
    float          sample    = 0.f;   // amplitude read this tick
    OrbAnimState   orb;
    AmplitudeLevel level     = AmplitudeLevel::Silent;
    EngineState    state     = EngineState::Idle;
};

// ===========================================================
// Renderer interface (called on the animator thread only)
// ===========================================================
class VisualizerRenderer {
public:
    virtual ~VisualizerRenderer() = default;
    virtual std::string name() const = 0;
    virtual bool open() = 0;
    // false: the renderer is gone (window closed by the user)
    virtual bool draw(const AnimationFrame& frame) = 0;
    virtual void close() = 0;
};

// ===========================================================
// VisualizerAnimator
//
// Ticks on its own thread at a fixed interval. Reads the amplitude and
// state cells, never the audio loop itself, so a slow pipeline cannot
// change the tick rate.
// ===========================================================
class VisualizerAnimator {
public:
    VisualizerAnimator(const AmplitudeCell& amplitude,
                       const EngineStateCell& state,
                       std::chrono::milliseconds interval = std::chrono::milliseconds(33),
                       std::unique_ptr<VisualizerRenderer> renderer = nullptr);
    ~VisualizerAnimator();

    VisualizerAnimator(const VisualizerAnimator&) = delete;
    VisualizerAnimator& operator=(const VisualizerAnimator&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

    AnimationFrame snapshot() const;
    uint64_t ticks() const { return ticks_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void run();
    void tick(float dtSeconds);

    const AmplitudeCell& amplitude_;
    const EngineStateCell& state_;
    std::chrono::milliseconds interval_;
    std::unique_ptr<VisualizerRenderer> renderer_;
    bool rendererOpen_ = false;

    OrbAnimState orb_;                // animator thread only
    mutable std::mutex snapMtx_;
    AnimationFrame snapshot_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

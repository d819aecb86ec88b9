#include "visualizer/visualizer_animator.hpp"
#include "logger.hpp"

#include <cmath>

using Clock = std::chrono::steady_clock;

AmplitudeLevel classifyAmplitude(float value) {
    if (value < 0.01f) return AmplitudeLevel::Silent;
    if (value < 0.1f)  return AmplitudeLevel::Quiet;
    if (value < 0.5f)  return AmplitudeLevel::Normal;
    return AmplitudeLevel::Loud;
}

const char* amplitudeLevelName(AmplitudeLevel level) {
    switch (level) {
        case AmplitudeLevel::Silent: return "Silent";
        case AmplitudeLevel::Quiet:  return "Quiet";
        case AmplitudeLevel::Normal: return "Normal";
        case AmplitudeLevel::Loud:   return "Loud";
    }
    return "Unknown";
}

// ===========================================================
// Update orb state (level + scale + glow)
// ===========================================================
void advanceOrb(OrbAnimState& state, float targetLevel, bool active,
                float dtSeconds, float timeConstant) {
    targetLevel = Amplitude::clamp01(targetLevel);
    float targetScale = 0.9f + 0.4f * targetLevel;
    float targetGlow  = active ? 1.f : 0.f;

    if (dtSeconds <= 0.f) dtSeconds = 0.033f;
    if (timeConstant <= 0.f) timeConstant = 0.08f;

    // new = target + (current - target) * exp(-dt / tau)
    float k = std::exp(-dtSeconds / timeConstant);
    state.level = targetLevel + (state.level - targetLevel) * k;
    state.scale = targetScale + (state.scale - targetScale) * k;
    state.glow  = targetGlow  + (state.glow  - targetGlow)  * k;

    // Snap small deltas to target to avoid tiny residuals
    if (std::fabs(state.level - targetLevel) < 0.001f) state.level = targetLevel;
    if (std::fabs(state.scale - targetScale) < 0.001f) state.scale = targetScale;
    if (std::fabs(state.glow  - targetGlow)  < 0.001f) state.glow  = targetGlow;
}

// ===========================================================
// VisualizerAnimator
// ===========================================================
VisualizerAnimator::VisualizerAnimator(const AmplitudeCell& amplitude,
                                       const EngineStateCell& state,
                                       std::chrono::milliseconds interval,
                                       std::unique_ptr<VisualizerRenderer> renderer)
    : amplitude_(amplitude),
      state_(state),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(33)),
      renderer_(std::move(renderer)) {}

VisualizerAnimator::~VisualizerAnimator() {
    stop();
}

void VisualizerAnimator::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&VisualizerAnimator::run, this);
    LOG_PHASE("Visualizer launched (" + std::to_string(interval_.count()) + " ms)", true);
}

void VisualizerAnimator::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        LOG_DEBUG("Visualizer", "Stopped after " + std::to_string(ticks_.load()) + " ticks");
    }
}

AnimationFrame VisualizerAnimator::snapshot() const {
    std::lock_guard<std::mutex> lock(snapMtx_);
    return snapshot_;
}

void VisualizerAnimator::run() {
    // The window lives and dies on this thread
    if (renderer_) {
        rendererOpen_ = renderer_->open();
        if (!rendererOpen_) {
            LOG_WARN("Visualizer", renderer_->name() + " failed to open, animating headless");
        }
    }

    auto last = Clock::now();
    auto next = last + interval_;

    while (running_) {
        auto now = Clock::now();
        float dt = std::chrono::duration<float>(now - last).count();
        last = now;

        tick(dt);

        std::this_thread::sleep_until(next);
        next += interval_;
        // Fell behind (suspended, debugger): restart the grid instead of bursting
        if (Clock::now() > next) next = Clock::now() + interval_;
    }

    if (rendererOpen_) {
        renderer_->close();
        rendererOpen_ = false;
    }
}

void VisualizerAnimator::tick(float dtSeconds) {
    float sample = amplitude_.load();
    EngineState st = state_.load();
    bool active = st == EngineState::Listening || st == EngineState::Speaking;

    advanceOrb(orb_, sample, active, dtSeconds);

    AnimationFrame frame;
    frame.tick   = ticks_.fetch_add(1) + 1;
    frame.sample = sample;
    frame.orb    = orb_;
    frame.level  = classifyAmplitude(orb_.level);
    frame.state  = st;

    {
        std::lock_guard<std::mutex> lock(snapMtx_);
        snapshot_ = frame;
    }

    if (rendererOpen_ && !renderer_->draw(frame)) {
        LOG_DEBUG("Visualizer", renderer_->name() + " closed by user");
        renderer_->close();
        rendererOpen_ = false;
    }
}

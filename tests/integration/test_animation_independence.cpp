#include <cassert>
#include "engine_fixture.hpp"
#include "visualizer/visualizer_animator.hpp"
#include "logger.hpp"

using namespace std::chrono;

// A model that takes five frame periods per step.
class SlowModel : public LanguageModel {
public:
    explicit SlowModel(milliseconds delay) : delay_(delay) {}
    std::string name() const override { return "slow"; }
    ModelStep step(const Tokens&, const std::vector<std::string>&) override {
        std::this_thread::sleep_for(delay_);
        steps_.fetch_add(1);
        return {};
    }
    void reset() override {}
    uint64_t steps() const { return steps_.load(); }

private:
    milliseconds delay_;
    std::atomic<uint64_t> steps_{0};
};

int main() {
    setLogLevel(LogLevel::Warn);

    EngineConfig cfg = fixture::smallConfig();
    auto rig = fixture::makeRig(cfg, false);
    auto slow = std::make_unique<SlowModel>(milliseconds(50));
    SlowModel* model = slow.get();
    rig.parts.model = std::move(slow);
    rig.source->setTone(300.0f, 0.3f);

    EngineError err;
    auto engine = ConversationEngine::create(cfg, std::move(rig.parts), &err);
    assert(engine);

    VisualizerAnimator animator(engine->amplitudeCell(), engine->stateCell(), milliseconds(10));

    assert(engine->start(&err));
    animator.start();

    const auto window = milliseconds(1000);
    std::this_thread::sleep_for(window);

    uint64_t ticks = animator.ticks();
    auto s = engine->stats();
    animator.stop();
    engine->stop();

    // ~100 ticks expected at 10 ms regardless of the stalled pipeline
    assert(ticks >= 70);
    assert(ticks <= 130);

    // The model could not keep up: frames were shed, not queued
    assert(model->steps() < s.framesProcessed);
    assert(s.framesDropped > 0);
    assert(s.codecAvgMicros > 0.0);

    // The loop kept going and the animator saw live values
    assert(s.framesProcessed >= 20);
    AnimationFrame f = animator.snapshot();
    assert(f.tick == animator.ticks());
    assert(f.state == EngineState::Idle || f.state == EngineState::Listening);
    return 0;
}

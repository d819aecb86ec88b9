#include <cassert>
#include <memory>
#include "engine_fixture.hpp"
#include "logger.hpp"

using namespace std::chrono;

// Connects, then every send hangs for a while and reports the link gone.
// Reconnects are refused after the first drop.
struct FlakyState {
    std::atomic<int> connects{0};
    std::atomic<int> sends{0};
};

class FlakyLink : public SupervisorLink {
public:
    FlakyLink(std::shared_ptr<FlakyState> s, milliseconds hang) : s_(std::move(s)), hang_(hang) {}
    std::string describe() const override { return "flaky"; }

    bool connect(milliseconds, std::string& err) override {
        if (s_->connects.fetch_add(1) > 0) {
            err = "connection refused";
            return false;
        }
        return true;
    }

    bool exchange(const nlohmann::json&, nlohmann::json& reply, milliseconds, std::string&) override {
        reply = {{"type", "auth_result"}, {"success", true}};
        return true;
    }

    SendResult send(const nlohmann::json&, milliseconds, std::string& err) override {
        s_->sends.fetch_add(1);
        std::this_thread::sleep_for(hang_);
        err = "peer went away";
        return SendResult::Disconnected;
    }

    void close() override {}

private:
    std::shared_ptr<FlakyState> s_;
    milliseconds hang_;
};

int main() {
    setLogLevel(LogLevel::Warn);

    EngineConfig cfg = fixture::smallConfig();
    auto rig = fixture::makeRig(cfg);
    auto state = std::make_shared<FlakyState>();

    BroadcasterConfig bc;
    bc.initialBackoff = milliseconds(20);
    bc.maxBackoff = milliseconds(100);
    bc.amplitudeInterval = milliseconds(10);
    rig.parts.broadcaster = std::make_unique<SupervisorEventBroadcaster>(
        std::make_unique<FlakyLink>(state, milliseconds(100)), bc);
    rig.source->setScript(fixture::utterance(cfg.frame, 30));

    NullSink* sink = rig.sink;

    EngineError err;
    auto engine = ConversationEngine::create(cfg, std::move(rig.parts), &err);
    assert(engine);

    auto t0 = steady_clock::now();
    assert(engine->start(&err));

    // The first amplitude send hangs for 100 ms, then the link is gone for good
    assert(fixture::waitUntil([&] { return state->sends.load() >= 1; }, seconds(2)));
    assert(fixture::waitUntil([&] { return state->connects.load() >= 3; }, seconds(3)));
    assert(!engine->broadcaster()->connected());

    // Let the conversation run on with nobody listening
    bool turned = fixture::waitUntil([&] { return engine->stats().turns >= 1; }, seconds(20));
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - t0);
    auto s = engine->stats();
    engine->stop();

    assert(turned);
    assert(engine->memory().messageCount() == 2);

    // Audio kept pace with the clock the whole time: roughly one frame per 10 ms
    auto expected = static_cast<uint64_t>(elapsed.count() / 10);
    assert(s.framesProcessed + 15 >= expected * 8 / 10);
    assert(sink->framesPlayed() >= s.framesProcessed);

    // Transcriptions after the drop were discarded, not queued
    auto bs = engine->broadcaster()->stats();
    assert(bs.dropped >= 2);
    assert(bs.connects == 1);
    assert(state->sends.load() == 1);

    // The link failure is visible to the host
    assert(engine->errorCount() >= 1);
    bool sawConnect = false;
    if (auto e = engine->lastError()) sawConnect = e->code == "ERR_SUPERVISOR_CONNECT";
    assert(sawConnect);
    return 0;
}

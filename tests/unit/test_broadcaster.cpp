#include <cassert>
#include <memory>
#include <thread>
#include "supervisor/supervisor_broadcaster.hpp"
#include "logger.hpp"

using namespace std::chrono;

// Scriptable in-memory link. State is shared so the test can flip it while
// the broadcaster owns the link.
struct FakeLinkState {
    std::mutex mtx;
    bool connectOk = true;
    bool authOk = true;
    SupervisorLink::SendResult result = SupervisorLink::SendResult::Ok;
    std::vector<nlohmann::json> sent;
    std::string lastToken;
    int connects = 0;
};

class FakeLink : public SupervisorLink {
public:
    explicit FakeLink(std::shared_ptr<FakeLinkState> s) : s_(std::move(s)) {}

    std::string describe() const override { return "fake"; }

    bool connect(milliseconds, std::string& err) override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        ++s_->connects;
        if (!s_->connectOk) err = "refused";
        return s_->connectOk;
    }

    bool exchange(const nlohmann::json& request, nlohmann::json& reply,
                  milliseconds, std::string&) override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        s_->lastToken = request.value("token", "");
        reply = {{"type", "auth_result"}, {"success", s_->authOk}};
        return true;
    }

    SendResult send(const nlohmann::json& event, milliseconds, std::string& err) override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        if (s_->result == SendResult::Ok) s_->sent.push_back(event);
        else err = "fake failure";
        return s_->result;
    }

    void close() override {}

private:
    std::shared_ptr<FakeLinkState> s_;
};

template <typename Pred>
static bool waitUntil(Pred pred, milliseconds timeout = milliseconds(2000)) {
    auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(2));
    }
    return pred();
}

static BroadcasterConfig fastConfig() {
    BroadcasterConfig cfg;
    cfg.authToken = "tok";
    cfg.sendTimeout = milliseconds(50);
    cfg.initialBackoff = milliseconds(10);
    cfg.maxBackoff = milliseconds(40);
    cfg.amplitudeInterval = milliseconds(20);
    return cfg;
}

static void backoffSequence() {
    auto d = [](int attempt) {
        return SupervisorEventBroadcaster::backoffDelay(attempt, milliseconds(1000), milliseconds(30000)).count();
    };
    assert(d(0) == 1000);
    assert(d(1) == 1000);
    assert(d(2) == 2000);
    assert(d(3) == 4000);
    assert(d(5) == 16000);
    assert(d(6) == 30000);
    assert(d(50) == 30000);
}

static void deliversEventsAfterAuth() {
    auto state = std::make_shared<FakeLinkState>();
    SupervisorEventBroadcaster b(std::make_unique<FakeLink>(state), fastConfig());
    b.start();
    assert(waitUntil([&] { return b.connected(); }));
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        assert(state->lastToken == "tok");
    }

    TranscriptionEvent ev;
    ev.speaker = Speaker::User;
    ev.text = "hello";
    ev.sessionId = "s1";
    b.publishTranscription(ev);

    // Many amplitude values collapse into few sends
    for (int i = 0; i < 100; ++i) b.publishAmplitude(i / 100.0f);

    assert(waitUntil([&] {
        std::lock_guard<std::mutex> lock(state->mtx);
        bool haveText = false, haveAmp = false;
        for (auto& m : state->sent) {
            if (m["type"] == "transcription" && m["text"] == "hello") haveText = true;
            if (m["type"] == "amplitude") haveAmp = true;
        }
        return haveText && haveAmp;
    }));

    {
        std::lock_guard<std::mutex> lock(state->mtx);
        size_t amps = 0;
        for (auto& m : state->sent) if (m["type"] == "amplitude") ++amps;
        assert(amps < 10);
    }

    b.stop();
    assert(!b.running());
    auto s = b.stats();
    assert(s.connects == 1);
    assert(s.sent >= 2);
}

static void dropsWhileDisconnectedAndBacksOff() {
    auto state = std::make_shared<FakeLinkState>();
    state->connectOk = false;

    LastErrorCell errors;
    SupervisorEventBroadcaster b(std::make_unique<FakeLink>(state), fastConfig());
    b.setErrorSink(&errors);
    b.start();

    assert(waitUntil([&] { return b.stats().connectAttempts >= 3; }));
    assert(!b.connected());

    TranscriptionEvent ev;
    ev.text = "lost";
    b.publishTranscription(ev);
    assert(b.stats().dropped >= 1);

    // Reported once, not per attempt
    assert(errors.get()->code == "ERR_SUPERVISOR_CONNECT");
    size_t reported = errors.count();
    assert(waitUntil([&] { return b.stats().connectAttempts >= 5; }));
    assert(errors.count() == reported);

    // Link comes back: backoff resets, events flow
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->connectOk = true;
    }
    assert(waitUntil([&] { return b.connected(); }));
    ev.text = "back";
    b.publishTranscription(ev);
    assert(waitUntil([&] { return b.stats().sent >= 1; }));

    // Link drops mid-stream
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->result = SupervisorLink::SendResult::Disconnected;
        state->connectOk = false;
    }
    b.publishTranscription(ev);
    assert(waitUntil([&] { return !b.connected(); }));

    b.stop();
}

static void rejectedAuthAndFailedSends() {
    auto state = std::make_shared<FakeLinkState>();
    state->authOk = false;

    LastErrorCell errors;
    SupervisorEventBroadcaster b(std::make_unique<FakeLink>(state), fastConfig());
    b.setErrorSink(&errors);
    b.start();
    assert(waitUntil([&] { return b.stats().authFailures >= 1; }));
    assert(!b.connected());
    b.stop();

    // Failed sends drop the event but keep the link
    auto state2 = std::make_shared<FakeLinkState>();
    state2->result = SupervisorLink::SendResult::Failed;
    SupervisorEventBroadcaster b2(std::make_unique<FakeLink>(state2), fastConfig());
    b2.setErrorSink(&errors);
    b2.start();
    assert(waitUntil([&] { return b2.connected(); }));
    TranscriptionEvent ev;
    ev.text = "x";
    b2.publishTranscription(ev);
    b2.publishTranscription(ev);
    assert(waitUntil([&] { return b2.stats().sendFailures >= 2; }));
    assert(b2.connected());
    assert(errors.get()->code == "ERR_SUPERVISOR_SEND");
    b2.stop();
}

static void publishBeforeStartDrops() {
    // Never started: everything is dropped, publish returns at once
    auto state = std::make_shared<FakeLinkState>();
    SupervisorEventBroadcaster b(std::make_unique<FakeLink>(state), fastConfig());
    TranscriptionEvent ev;
    auto t0 = steady_clock::now();
    for (int i = 0; i < 1000; ++i) b.publishTranscription(ev);
    assert(steady_clock::now() - t0 < milliseconds(500));
    assert(b.stats().dropped == 1000);
}

int main() {
    setLogLevel(LogLevel::Off);

    backoffSequence();
    deliversEventsAfterAuth();
    dropsWhileDisconnectedAndBacksOff();
    rejectedAuthAndFailedSends();
    publishBeforeStartDrops();
    return 0;
}

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "supervisor/supervisor_event.hpp"
#include "supervisor/supervisor_link.hpp"
#include "error_manager.hpp"

struct BroadcasterConfig {
    std::string authToken;
    std::chrono::milliseconds sendTimeout{250};
    std::chrono::milliseconds initialBackoff{1000};
    std::chrono::milliseconds maxBackoff{30000};
    std::chrono::milliseconds amplitudeInterval{100};
    size_t outboxCapacity = 64;
};

// ------------------------------------------------------------
// SupervisorEventBroadcaster
// publish*() only touch the outbox and return; the sender thread owns the
// link. While disconnected every event is dropped and the thread retries
// with exponential backoff; a successful connect + auth resets it.
// ------------------------------------------------------------
class SupervisorEventBroadcaster {
public:
    struct Stats {
        uint64_t sent = 0;
        uint64_t dropped = 0;          // outbox overflow, disconnected, send failures
        uint64_t sendFailures = 0;
        uint64_t connects = 0;
        uint64_t connectAttempts = 0;
        uint64_t authFailures = 0;
        bool connected = false;
    };

    SupervisorEventBroadcaster(std::unique_ptr<SupervisorLink> link, BroadcasterConfig cfg);
    ~SupervisorEventBroadcaster();

    SupervisorEventBroadcaster(const SupervisorEventBroadcaster&) = delete;
    SupervisorEventBroadcaster& operator=(const SupervisorEventBroadcaster&) = delete;

    void setErrorSink(ErrorSink* sink) { errorSink_ = sink; }

    void start();
    void stop();
    bool running() const { return running_.load(); }

    void publishTranscription(const TranscriptionEvent& ev);
    void publishAmplitude(float value);    // latest value wins

    bool connected() const { return connected_.load(); }
    Stats stats() const;

    // initial * 2^(attempt-1), capped. attempt starts at 1.
    static std::chrono::milliseconds backoffDelay(int attempt,
                                                  std::chrono::milliseconds initial,
                                                  std::chrono::milliseconds max);

private:
    void run();
    bool tryConnect();
    void dropOutbox();
    void sendOne(const nlohmann::json& msg);
    bool waitFor(std::chrono::milliseconds d);   // false when stopping

    std::unique_ptr<SupervisorLink> link_;
    BroadcasterConfig cfg_;
    ErrorSink* errorSink_ = nullptr;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> outbox_;
    std::optional<float> pendingAmplitude_;
    Stats stats_;
};

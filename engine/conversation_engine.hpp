#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "audio/amplitude.hpp"
#include "audio/audio_device.hpp"
#include "codec/codec_adapter.hpp"
#include "engine/context_queue.hpp"
#include "engine/engine_config.hpp"
#include "engine/engine_state.hpp"
#include "error_manager.hpp"
#include "memory/conversation_memory.hpp"
#include "model/language_model.hpp"
#include "persona/personality_context.hpp"
#include "supervisor/supervisor_broadcaster.hpp"
#include "wake/wake_gate.hpp"

// Everything the engine takes ownership of at construction.
struct EngineParts {
    std::unique_ptr<AudioFrameSource> source;
    std::unique_ptr<AudioFrameSink> sink;
    std::unique_ptr<Codec> codec;
    std::unique_ptr<LanguageModel> model;
    std::unique_ptr<Wake::WakeWordGate> gate;                   // null: AlwaysOn
    std::unique_ptr<SupervisorEventBroadcaster> broadcaster;    // optional
    PersonaProfile persona = PersonaProfile::jarvis();
};

// ============================================================
// ConversationEngine
//
// Owns one audio thread that, per captured frame, runs
//   gate -> encode -> model step -> decode -> play
// and drives Idle -> Listening -> Processing -> Speaking -> Idle.
//
// The audio thread is the only writer of the amplitude cell and the state
// cell. Every other public call is safe from any thread and never waits on
// the audio loop.
// ============================================================
class ConversationEngine {
public:
    struct Stats {
        uint64_t framesProcessed = 0;
        uint64_t framesDropped   = 0;   // codec overload drops
        uint64_t silentFrames    = 0;   // periods filled with silence
        uint64_t codecFailures   = 0;
        uint64_t modelFailures   = 0;
        uint64_t turns           = 0;   // completed assistant replies
        uint64_t contextEvicted  = 0;
        uint64_t advisoryForwarded = 0;
        double   codecAvgMicros  = 0.0;
        bool     sourceDegraded  = false;
        bool     sinkDegraded    = false;
    };

    // Validates cfg and takes ownership of parts. nullptr with a ConfigError
    // in err when anything required is missing or invalid.
    static std::unique_ptr<ConversationEngine> create(const EngineConfig& cfg,
                                                      EngineParts parts,
                                                      EngineError* err);
    ~ConversationEngine();

    ConversationEngine(const ConversationEngine&) = delete;
    ConversationEngine& operator=(const ConversationEngine&) = delete;

    // Opens the devices and starts the audio thread. Device failures come
    // back as DeviceError (ERR_DEVICE_UNAVAILABLE).
    bool start(EngineError* err);

    // Joins the audio thread, then releases the devices.
    void stop();
    bool running() const { return running_.load(); }

    void swapPersona(PersonaProfile profile);

    // Archives the current session; returns the new session id.
    std::string resetSession();

    void injectContext(std::string text);
    void triggerWake();

    std::optional<EngineError> lastError() const { return lastError_.get(); }
    size_t errorCount() const { return lastError_.count(); }

    EngineState state() const { return state_.load(); }
    float amplitude() const { return amplitude_.load(); }
    Stats stats() const;

    const ConversationMemory& memory() const { return memory_; }
    PersonaProfile persona() const { return persona_.profile(); }
    const EngineConfig& config() const { return cfg_; }

    // For the visualizer. Valid for the lifetime of the engine.
    const AmplitudeCell& amplitudeCell() const { return amplitude_; }
    const EngineStateCell& stateCell() const { return state_; }

    SupervisorEventBroadcaster* broadcaster() { return broadcaster_.get(); }
    const SupervisorEventBroadcaster* broadcaster() const { return broadcaster_.get(); }

private:
    class DeviceSession;

    ConversationEngine(const EngineConfig& cfg, EngineParts parts);

    void run();
    void processFrame(AudioFrame in);
    void handleStep(const ModelStep& step, std::optional<AudioFrame>& out, uint64_t sequence);
    void applyReset();
    void setState(EngineState s);
    void publishTurn(Speaker speaker, const std::string& text);
    void saveMemory();

    EngineConfig cfg_;

    // Shared with other threads
    ConversationMemory memory_;
    PersonalityContext persona_;
    ContextInjectionQueue context_;
    AmplitudeCell amplitude_;
    EngineStateCell state_{EngineState::Idle};
    LastErrorCell lastError_;

    // Audio thread only
    std::unique_ptr<AudioFrameSource> source_;
    std::unique_ptr<AudioFrameSink> sink_;
    CodecAdapter codec_;
    std::unique_ptr<LanguageModel> model_;
    std::unique_ptr<Wake::WakeWordGate> gate_;

    std::unique_ptr<SupervisorEventBroadcaster> broadcaster_;
    std::unique_ptr<DeviceSession> devices_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> resetRequested_{false};

    std::atomic<uint64_t> framesProcessed_{0};
    std::atomic<uint64_t> silentFrames_{0};
    std::atomic<uint64_t> modelFailures_{0};
    std::atomic<uint64_t> turns_{0};
    std::atomic<uint64_t> advisoryForwarded_{0};
    std::atomic<uint64_t> framesDropped_{0};
    std::atomic<uint64_t> codecFailures_{0};
    std::atomic<double>   codecAvgMicros_{0.0};
};

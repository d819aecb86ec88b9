#include "engine/conversation_engine.hpp"
#include "logger.hpp"

using Clock = std::chrono::steady_clock;

// ------------------------------------------------------------
// DeviceSession: source and sink open together, close together.
// Destroying it (stop(), failed start, engine destructor) releases both.
// ------------------------------------------------------------
class ConversationEngine::DeviceSession {
public:
    DeviceSession(AudioFrameSource& source, AudioFrameSink& sink)
        : source_(source), sink_(sink) {}

    ~DeviceSession() {
        if (sinkOpen_) sink_.close();
        if (sourceOpen_) source_.close();
    }

    bool open(EngineError* err) {
        sourceOpen_ = source_.open(err);
        if (!sourceOpen_) return false;
        sinkOpen_ = sink_.open(err);
        return sinkOpen_;
    }

private:
    AudioFrameSource& source_;
    AudioFrameSink& sink_;
    bool sourceOpen_ = false;
    bool sinkOpen_ = false;
};

// ============================================================
// Construction
// ============================================================
std::unique_ptr<ConversationEngine> ConversationEngine::create(const EngineConfig& cfg,
                                                               EngineParts parts,
                                                               EngineError* err) {
    if (!validateEngineConfig(cfg, err)) return nullptr;

    auto missing = [&](const char* what) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_INVALID",
                                             std::string("engine needs a ") + what);
        if (err) *err = e;
        return nullptr;
    };
    if (!parts.source) return missing("frame source");
    if (!parts.sink)   return missing("frame sink");
    if (!parts.codec)  return missing("codec");
    if (!parts.model)  return missing("language model");

    if (parts.source->format().samples != cfg.frame.samples ||
        parts.sink->format().samples != cfg.frame.samples) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_INVALID",
                                             "device frame size differs from frame_samples");
        if (err) *err = e;
        return nullptr;
    }

    if (!parts.gate) parts.gate = std::make_unique<Wake::AlwaysOn>();

    std::unique_ptr<ConversationEngine> engine(new ConversationEngine(cfg, std::move(parts)));

    if (!cfg.memoryFile.empty()) {
        EngineError loadErr;
        if (!engine->memory_.load(cfg.memoryFile, &loadErr)) {
            // A corrupt memory file is not fatal; start with an empty session.
            engine->lastError_.record(loadErr);
        }
    }

    LOG_PHASE("Conversation engine constructed", true);
    return engine;
}

ConversationEngine::ConversationEngine(const EngineConfig& cfg, EngineParts parts)
    : cfg_(cfg),
      memory_(cfg.maxRecentMessages, cfg.maxArchivedSessions),
      persona_(std::move(parts.persona)),
      context_(cfg.contextQueueCapacity),
      source_(std::move(parts.source)),
      sink_(std::move(parts.sink)),
      codec_(std::move(parts.codec), cfg.frame, cfg.codecMaxPending),
      model_(std::move(parts.model)),
      gate_(std::move(parts.gate)),
      broadcaster_(std::move(parts.broadcaster)) {
    source_->setErrorSink(&lastError_);
    sink_->setErrorSink(&lastError_);
    codec_.setErrorSink(&lastError_);
    if (broadcaster_) broadcaster_->setErrorSink(&lastError_);
}

ConversationEngine::~ConversationEngine() {
    stop();
}

// ============================================================
// Lifecycle
// ============================================================
bool ConversationEngine::start(EngineError* err) {
    if (running_) return true;

    auto devices = std::make_unique<DeviceSession>(*source_, *sink_);
    EngineError openErr;
    if (!devices->open(&openErr)) {
        lastError_.record(openErr);
        if (err) *err = openErr;
        LOG_PHASE("Audio devices open", false);
        return false;
    }
    devices_ = std::move(devices);

    // Advisory context for the first turns
    context_.push(persona_.generateContextPrompt());
    std::string history = memory_.getContextForPrompt(cfg_.contextMessages);
    if (!history.empty()) context_.push(history);

    LOG_DEBUG("Engine", persona_.name() + ": \"" + persona_.generateGreeting() + "\"");
    LOG_DEBUG("Engine", memory_.summary());

    if (broadcaster_) broadcaster_->start();

    setState(EngineState::Idle);
    running_ = true;
    thread_ = std::thread(&ConversationEngine::run, this);

    LOG_PHASE("Audio loop started (" + source_->name() + " -> " + sink_->name() +
              ", model " + model_->name() + ", wake " + gate_->name() + ")", true);
    return true;
}

void ConversationEngine::stop() {
    bool wasRunning = running_.exchange(false);
    if (thread_.joinable()) thread_.join();

    // Devices are released only after the loop has been joined
    devices_.reset();

    if (!wasRunning) return;

    if (broadcaster_) broadcaster_->stop();
    setState(EngineState::Idle);
    amplitude_.store(0.0f);
    saveMemory();

    LOG_PHASE("Audio loop stopped after " + std::to_string(framesProcessed_.load()) + " frames", true);
}

void ConversationEngine::saveMemory() {
    if (cfg_.memoryFile.empty()) return;
    EngineError e;
    if (!memory_.save(cfg_.memoryFile, &e)) lastError_.record(e);
}

// ============================================================
// Host-facing controls
// ============================================================
void ConversationEngine::swapPersona(PersonaProfile profile) {
    persona_.swap(std::move(profile));
    context_.push(persona_.generateContextPrompt());
}

std::string ConversationEngine::resetSession() {
    std::string id = memory_.startNewSession();
    saveMemory();

    // Model, codec and gate belong to the audio thread; it resets them
    // before its next frame. Without a thread, do it here.
    if (running_) {
        resetRequested_ = true;
    } else {
        applyReset();
    }
    context_.clear();
    context_.push(persona_.generateContextPrompt());
    return id;
}

void ConversationEngine::injectContext(std::string text) {
    context_.push(std::move(text));
}

void ConversationEngine::triggerWake() {
    gate_->trigger();
}

ConversationEngine::Stats ConversationEngine::stats() const {
    Stats s;
    s.framesProcessed   = framesProcessed_.load();
    s.framesDropped     = framesDropped_.load();
    s.silentFrames      = silentFrames_.load();
    s.codecFailures     = codecFailures_.load();
    s.modelFailures     = modelFailures_.load();
    s.turns             = turns_.load();
    s.contextEvicted    = context_.evicted();
    s.advisoryForwarded = advisoryForwarded_.load();
    s.codecAvgMicros    = codecAvgMicros_.load();
    s.sourceDegraded    = source_->degraded();
    s.sinkDegraded      = sink_->degraded();
    return s;
}

// ============================================================
// Audio thread
// ============================================================
void ConversationEngine::setState(EngineState s) {
    EngineState prev = state_.exchange(s);
    if (prev != s) {
        LOG_TRACE("Engine", std::string(engineStateName(prev)) + " -> " + engineStateName(s));
    }
}

void ConversationEngine::applyReset() {
    model_->reset();
    codec_.reset();
    gate_->reset();
    setState(EngineState::Idle);
}

void ConversationEngine::publishTurn(Speaker speaker, const std::string& text) {
    if (!broadcaster_) return;

    TranscriptionEvent ev;
    ev.speaker   = speaker;
    ev.text      = text;
    ev.sessionId = memory_.currentSessionId();
    ev.timestamp = std::chrono::system_clock::now();
    broadcaster_->publishTranscription(ev);
}

void ConversationEngine::run() {
    LOG_DEBUG("Engine", "Audio thread running (frame " +
              std::to_string(cfg_.frame.period().count() / 1000) + " ms)");

    while (running_) {
        if (resetRequested_.exchange(false)) applyReset();

        AudioFrame in = source_->capture();
        try {
            processFrame(std::move(in));
        } catch (const std::exception& e) {
            // Keep the device fed even if something in the pipeline threw
            ErrorManager::reportTo(&lastError_, ErrorKind::Codec, "ERR_CODEC_FRAME",
                                   std::string("pipeline: ") + e.what());
            sink_->playSilence();
            silentFrames_.fetch_add(1);
        }
    }

    LOG_DEBUG("Engine", "Audio thread exiting");
}

void ConversationEngine::processFrame(AudioFrame in) {
    const float inLevel = Amplitude::level(in.samples, cfg_.amplitudeGain);
    const uint64_t sequence = in.sequence;

    // The wake gate only opens a turn. Once Listening, frames keep reaching
    // the model until it has nothing of the user's turn left in hand.
    bool awake = gate_->accept(in, inLevel);
    bool forward = true;
    EngineState st = state_.load();
    if (st == EngineState::Idle) {
        if (awake) setState(EngineState::Listening);
        else forward = false;
    } else if (st == EngineState::Listening && !awake && !model_->userTurnPending()) {
        setState(EngineState::Idle);
        forward = false;
    }

    std::optional<AudioFrame> out;
    if (forward) {
        if (!codec_.submit(std::move(in))) framesDropped_.fetch_add(1);

        if (auto ready = codec_.takeReady()) {
            Tokens tokens = codec_.encode(*ready);

            // Advisory text stays in the bounded queue until a step takes it,
            // and only if nobody is pushing right now
            std::vector<std::string> advisory;
            for (auto& msg : context_.tryDrain(cfg_.advisoryPerFrame)) {
                advisory.push_back(std::move(msg.text));
            }

            ModelStep step;
            auto t0 = Clock::now();
            try {
                step = model_->step(tokens, advisory);
                advisoryForwarded_.fetch_add(advisory.size());
            } catch (const std::exception& e) {
                modelFailures_.fetch_add(1);
                ErrorManager::reportTo(&lastError_, ErrorKind::Codec, "ERR_MODEL_STEP", e.what());
                step = ModelStep{};
            }
            codec_.charge(std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - t0));

            handleStep(step, out, ready->sequence);
        }
    }

    // Exactly one frame per period goes to the sink
    float level = inLevel;
    if (out) {
        if (state_.load() == EngineState::Speaking) {
            level = Amplitude::level(out->samples, cfg_.amplitudeGain);
        }
        sink_->play(*out);
    } else {
        sink_->playSilence();
        silentFrames_.fetch_add(1);
    }

    amplitude_.store(level);
    if (broadcaster_) broadcaster_->publishAmplitude(amplitude_.load());

    const auto& cs = codec_.stats();
    codecFailures_.store(cs.failures);
    codecAvgMicros_.store(cs.avgMicros);
    framesProcessed_.fetch_add(1);

    LOG_TRACE("Engine", "frame #" + std::to_string(sequence) + " " +
              engineStateName(state_.load()) + " amp=" + std::to_string(level));
}

void ConversationEngine::handleStep(const ModelStep& step, std::optional<AudioFrame>& out,
                                    uint64_t sequence) {
    EngineState st = state_.load();

    // User finished speaking
    if (step.endOfTurn && !step.userText.empty() &&
        (st == EngineState::Listening || st == EngineState::Idle)) {
        memory_.addUserMessage(step.userText);
        publishTurn(Speaker::User, step.userText);

        if (auto prefix = persona_.generateResponsePrefix(step.userText)) {
            context_.push("Response style: begin with \"" + *prefix + "\"");
        }
        setState(EngineState::Processing);
        st = EngineState::Processing;
        LOG_DEBUG("Engine", "User: " + step.userText);
    }

    // Reply decided
    if (step.endOfTurn && !step.assistantText.empty()) {
        memory_.addAssistantResponse(step.assistantText);
        publishTurn(Speaker::Assistant, step.assistantText);
        setState(EngineState::Speaking);
        st = EngineState::Speaking;
        LOG_DEBUG("Engine", "Assistant: " + step.assistantText);
    }

    if (!step.audio.empty()) {
        out = codec_.decode(step.audio, sequence);
        return;
    }

    // Speaking with nothing left to play: the reply is over
    if (st == EngineState::Speaking && step.assistantText.empty()) {
        setState(EngineState::Idle);
        gate_->reset();
        turns_.fetch_add(1);
    }
}

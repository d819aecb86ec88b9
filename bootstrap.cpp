#include "bootstrap.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include "audio/audio_device.hpp"
#include "audio/synthetic_device.hpp"
#include "codec/codec.hpp"
#include "model/scripted_model.hpp"
#include "model/tone_voice.hpp"
#include "model/whisper_ollama_model.hpp"
#include "supervisor/http_supervisor_link.hpp"
#include "visualizer/visualizer_window.hpp"

#include <chrono>

using bootstrap_config::AppSettings;

bool runBootstrapChecks(const std::filesystem::path& configPath,
                        AppSettings& out,
                        EngineError* err) {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Centralized config + error catalog
    // ============================================================
    bool ok = bootstrap_config::initAll(configPath, out, err);
    LOG_PHASE("Configs initialized", ok);

    LogLevel level;
    if (parseLogLevel(out.logging.level, level)) {
        setLogLevel(level);
    } else {
        LOG_WARN("Config", "Unknown logging.level '" + out.logging.level + "', keeping debug");
    }

    // ============================================================
    // Audio devices (listing only; streams open at engine start)
    // ============================================================
    if (ok && out.audio.backend == "portaudio") {
        beginPhaseGroup();
        Audio::logDevices();
        endPhaseGroup();
    }

    LOG_PHASE("Bootstrap complete", ok);
    return ok;
}

bool resolvePersona(const std::string& nameOrFile, PersonaProfile& out, EngineError* err) {
    if (auto p = PersonaProfile::preset(nameOrFile)) {
        out = *p;
        return true;
    }
    return PersonaProfile::loadFile(resolveResource(nameOrFile), out, err);
}

// ------------------------------------------------------------
// Engine parts
// ------------------------------------------------------------
static bool configError(const std::string& detail, EngineError* err) {
    EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_INVALID", detail);
    if (err) *err = e;
    return false;
}

static bool buildDevices(const AppSettings& s, EngineParts& parts, EngineError* err) {
    const FrameFormat& fmt = s.engine.frame;
    const int retries = s.engine.deviceRetryLimit;

    if (s.audio.backend == "portaudio") {
        parts.source = std::make_unique<PortAudioSource>(fmt, retries, s.audio.inputDevice);
        parts.sink   = std::make_unique<PortAudioSink>(fmt, retries, s.audio.outputDevice);
        return true;
    }

    if (s.audio.backend == "synthetic") {
        // A spoken-sounding burst every few seconds so the model has turns to take
        auto source = std::make_unique<SyntheticSource>(fmt, retries, true);
        std::vector<float> script = ToneVoice::render("hello there how are you today", fmt, 0.3f);
        script.resize(script.size() + static_cast<size_t>(fmt.sampleRate) * 4, 0.0f);
        source->setScript(script, true);

        parts.source = std::move(source);
        parts.sink   = std::make_unique<NullSink>(fmt, retries, true);
        return true;
    }

    return configError("audio.backend must be portaudio or synthetic", err);
}

static bool buildModel(const AppSettings& s, EngineParts& parts, EngineError* err) {
    auto codec = makeCodec(s.model.codec);
    auto modelCodec = makeCodec(s.model.codec);
    if (!codec || !modelCodec) {
        return configError("model.codec '" + s.model.codec + "' is not available", err);
    }
    parts.codec = std::move(codec);

    if (s.model.backend == "scripted") {
        std::vector<ScriptedModel::Turn> turns;
        if (!s.model.scriptFile.empty()) {
            std::string text = loadTextResource(s.model.scriptFile);
            try {
                turns = ScriptedModel::turnsFromJson(nlohmann::json::parse(text));
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("Model", "Script " + s.model.scriptFile + " unreadable: " + e.what());
            }
        }
        if (turns.empty()) turns = ScriptedModel::defaultTurns();

        ScriptedModel::Options opts;
        opts.speechThreshold = s.model.silenceThreshold;
        opts.silenceFrames   = s.model.silenceFrames;
        parts.model = std::make_unique<ScriptedModel>(std::move(modelCodec), s.engine.frame,
                                                      std::move(turns), opts);
        return true;
    }

    if (s.model.backend == "whisper") {
        WhisperOllamaModel::Options opts;
        opts.whisperModelPath = resolveResource(s.model.whisperModel);
        opts.language         = s.model.whisperLanguage;
        opts.ollamaUrl        = s.model.ollamaUrl;
        opts.modelName        = s.model.defaultModel;
        opts.timeoutMs        = s.model.timeoutMs;
        opts.speechThreshold  = s.model.silenceThreshold;
        opts.silenceFrames    = s.model.silenceFrames;
        auto model = WhisperOllamaModel::create(opts, std::move(modelCodec), s.engine.frame, err);
        if (!model) return false;
        parts.model = std::move(model);
        return true;
    }

    return configError("model.backend must be scripted or whisper", err);
}

std::unique_ptr<ConversationEngine> buildEngine(const AppSettings& s, EngineError* err) {
    EngineParts parts;

    if (!buildDevices(s, parts, err)) return nullptr;
    if (!buildModel(s, parts, err)) return nullptr;

    parts.gate = Wake::makeGate(s.wake.mode, s.wake.threshold,
                                s.wake.triggerFrames, s.wake.releaseFrames);
    if (!parts.gate) {
        configError("wake.mode '" + s.wake.mode + "' is unknown", err);
        return nullptr;
    }

    // Persona: file wins over preset; a bad file keeps the preset
    if (auto p = PersonaProfile::preset(s.persona.preset)) {
        parts.persona = *p;
    } else {
        LOG_WARN("Persona", "Unknown preset '" + s.persona.preset + "', using Jarvis");
    }
    if (!s.persona.file.empty()) {
        PersonaProfile fromFile;
        EngineError personaErr;
        if (PersonaProfile::loadFile(resolveResource(s.persona.file), fromFile, &personaErr)) {
            parts.persona = fromFile;
        }
    }

    if (s.supervisor.enabled) {
        BroadcasterConfig bc;
        bc.authToken         = s.supervisor.authToken;
        bc.sendTimeout       = std::chrono::milliseconds(s.supervisor.sendTimeoutMs);
        bc.initialBackoff    = std::chrono::milliseconds(s.supervisor.initialBackoffMs);
        bc.maxBackoff        = std::chrono::milliseconds(s.supervisor.maxBackoffMs);
        bc.amplitudeInterval = std::chrono::milliseconds(s.supervisor.amplitudeIntervalMs);
        auto link = std::make_unique<HttpSupervisorLink>(s.supervisor.url, s.supervisor.authToken);
        parts.broadcaster = std::make_unique<SupervisorEventBroadcaster>(std::move(link), bc);
    }

    auto engine = ConversationEngine::create(s.engine, std::move(parts), err);
    LOG_PHASE("Engine wiring", engine != nullptr);
    return engine;
}

std::unique_ptr<VisualizerAnimator> buildVisualizer(const AppSettings& s,
                                                    const ConversationEngine& engine) {
    if (!s.visualizer.enabled) return nullptr;

    std::unique_ptr<VisualizerRenderer> renderer;
    if (s.visualizer.window) renderer = std::make_unique<SfmlVisualizerWindow>();

    return std::make_unique<VisualizerAnimator>(engine.amplitudeCell(), engine.stateCell(),
                                                std::chrono::milliseconds(s.visualizer.intervalMs),
                                                std::move(renderer));
}

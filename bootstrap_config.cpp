#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultConfig() {
    return {
        {"engine", {
            {"max_recent_messages", 50},
            {"max_archived_sessions", 10},
            {"frame_samples", 1920},
            {"sample_rate", 24000},
            {"context_queue_capacity", 5},
            {"device_retry_limit", 3},
            {"codec_max_pending", 2},
            {"amplitude_gain", 1.0},
            {"context_messages", 10},
            {"advisory_per_frame", 4}
        }},

        {"audio", {
            {"backend", "portaudio"},
            {"input_device_index", -1},
            {"output_device_index", -1}
        }},

        {"wake", {
            {"mode", "always_on"},
            {"threshold", 0.02},
            {"trigger_frames", 3},
            {"release_frames", 25}
        }},

        {"persona", {
            {"preset", "jarvis"},
            {"file", ""}
        }},

        {"model", {
            {"backend", "scripted"},
            {"codec", "mulaw"},
            {"script_file", ""},
            {"whisper_model", "ggml-base.en.bin"},
            {"whisper_language", "en"},
            {"ollama_url", "http://127.0.0.1:11434"},
            {"default_model", "mistral"},
            {"timeout_ms", 60000},
            {"silence_threshold", 0.02},
            {"silence_frames", 10}
        }},

        {"visualizer", {
            {"enabled", true},
            {"interval_ms", 33},
            {"window", true}
        }},

        {"supervisor", {
            {"enabled", false},
            {"url", "http://127.0.0.1:9999"},
            {"auth_token", ""},
            {"send_timeout_ms", 250},
            {"initial_backoff_ms", 1000},
            {"max_backoff_ms", 30000},
            {"amplitude_interval_ms", 100}
        }},

        {"memory", {
            {"file", "memory.json"}
        }},

        {"logging", {
            {"level", "debug"}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_DEVICE_UNAVAILABLE", {
            {"user", "[Audio] Audio device could not be opened."},
            {"debug", "PortAudio stream open failed at engine start."}
        }},
        {"ERR_DEVICE_CAPTURE", {
            {"user", "[Audio] Microphone read failed."},
            {"debug", "Capture retries exhausted for one frame."}
        }},
        {"ERR_DEVICE_PLAYBACK", {
            {"user", "[Audio] Speaker write failed."},
            {"debug", "Playback retries exhausted for one frame."}
        }},
        {"ERR_DEVICE_DEGRADED", {
            {"user", "[Audio] Device lost, continuing with silence."},
            {"debug", "Device switched to paced silent mode after retry limit."}
        }},
        {"ERR_CODEC_FRAME", {
            {"user", "[Codec] Frame could not be processed, substituted with silence."},
            {"debug", "Codec encode/decode failed for a single frame."}
        }},
        {"ERR_MODEL_STEP", {
            {"user", "[Model] Sorry, I could not come up with a reply."},
            {"debug", "Language model step failed or returned nothing."}
        }},
        {"ERR_MODEL_LOAD", {
            {"user", "[Model] Speech model could not be loaded."},
            {"debug", "whisper_init_from_file_with_params returned null."}
        }},
        {"ERR_SUPERVISOR_CONNECT", {
            {"user", "[Supervisor] Supervisor unreachable, retrying."},
            {"debug", "Supervisor link connect failed; backing off."}
        }},
        {"ERR_SUPERVISOR_AUTH", {
            {"user", "[Supervisor] Supervisor rejected the auth token."},
            {"debug", "auth_result success=false or malformed reply."}
        }},
        {"ERR_SUPERVISOR_SEND", {
            {"user", "[Supervisor] Event could not be delivered."},
            {"debug", "Send failed or timed out; event dropped."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Configuration value out of range."},
            {"debug", "Engine configuration failed validation."}
        }},
        {"ERR_CONFIG_PARSE", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "cadence_config.json failed parsing."}
        }},
        {"ERR_PERSONA_LOAD", {
            {"user", "[Persona] Persona file could not be loaded."},
            {"debug", "Persona JSON missing or malformed; preset kept."}
        }},
        {"ERR_MEMORY_SAVE", {
            {"user", "[Memory] Conversation memory could not be saved."},
            {"debug", "memory.json write failed."}
        }},
        {"ERR_MEMORY_LOAD", {
            {"user", "[Memory] Conversation memory unreadable, starting fresh."},
            {"debug", "memory.json failed parsing."}
        }}
    };
}

// ----------------- helpers -----------------
static bool mergeInto(nlohmann::json& cfg,
                      const nlohmann::json& defs,
                      const std::string& prefix,
                      int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        std::string path = prefix.empty() ? key : prefix + "." + key;
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
            LOG_TRACE("Config", "added " + path);
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeInto(cfg[key], defVal, path, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // 1 and 1.0 are both fine for a numeric key
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
            LOG_TRACE("Config", "reset " + path + " (wrong type)");
        }
    }
    return patched;
}

bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount) {
    if (!cfg.is_object()) {
        cfg = defs;
        if (patchedCount) (*patchedCount)++;
        return true;
    }
    return mergeInto(cfg, defs, "", patchedCount);
}

static void saveJson(const fs::path& path, const nlohmann::json& j, const std::string& name) {
    std::ofstream out(path);
    if (!out) {
        LOG_WARN("Config", "Could not write " + name + " to " + path.string());
        return;
    }
    out << j.dump(2);
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveJson(path, outConfig, name);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            saveJson(path, outConfig, name);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(ErrorKind::Config, errorCode, e.what());

        outConfig = defaults;
        saveJson(path, outConfig, name);
        return false;
    }
}

// ----------------- typed settings -----------------
bool settingsFromJson(const nlohmann::json& cfg, AppSettings& out, EngineError* err) {
    // Start from a fully populated copy so a hand-built cfg works too
    nlohmann::json c = cfg;
    mergeDefaults(c, defaultConfig());

    try {
        const auto& e = c["engine"];
        EngineConfig& ec = out.engine;

        auto nonNegative = [&](const char* key) -> long long {
            long long v = e[key].get<long long>();
            if (v < 0) {
                throw std::invalid_argument(std::string(key) + " must not be negative");
            }
            return v;
        };

        ec.maxRecentMessages    = static_cast<size_t>(nonNegative("max_recent_messages"));
        ec.maxArchivedSessions  = static_cast<size_t>(nonNegative("max_archived_sessions"));
        ec.frame.samples        = static_cast<size_t>(nonNegative("frame_samples"));
        ec.frame.sampleRate     = e["sample_rate"].get<int>();
        ec.contextQueueCapacity = static_cast<size_t>(nonNegative("context_queue_capacity"));
        ec.deviceRetryLimit     = e["device_retry_limit"].get<int>();
        ec.codecMaxPending      = static_cast<size_t>(nonNegative("codec_max_pending"));
        ec.amplitudeGain        = e["amplitude_gain"].get<float>();
        ec.contextMessages      = static_cast<size_t>(nonNegative("context_messages"));
        ec.advisoryPerFrame     = static_cast<size_t>(nonNegative("advisory_per_frame"));
        ec.memoryFile           = c["memory"]["file"].get<std::string>();

        const auto& a = c["audio"];
        out.audio.backend      = a["backend"].get<std::string>();
        out.audio.inputDevice  = a["input_device_index"].get<int>();
        out.audio.outputDevice = a["output_device_index"].get<int>();

        const auto& w = c["wake"];
        out.wake.mode          = w["mode"].get<std::string>();
        out.wake.threshold     = w["threshold"].get<float>();
        out.wake.triggerFrames = w["trigger_frames"].get<int>();
        out.wake.releaseFrames = w["release_frames"].get<int>();

        out.persona.preset = c["persona"]["preset"].get<std::string>();
        out.persona.file   = c["persona"]["file"].get<std::string>();

        const auto& m = c["model"];
        out.model.backend          = m["backend"].get<std::string>();
        out.model.codec            = m["codec"].get<std::string>();
        out.model.scriptFile       = m["script_file"].get<std::string>();
        out.model.whisperModel     = m["whisper_model"].get<std::string>();
        out.model.whisperLanguage  = m["whisper_language"].get<std::string>();
        out.model.ollamaUrl        = m["ollama_url"].get<std::string>();
        out.model.defaultModel     = m["default_model"].get<std::string>();
        out.model.timeoutMs        = m["timeout_ms"].get<int>();
        out.model.silenceThreshold = m["silence_threshold"].get<float>();
        out.model.silenceFrames    = m["silence_frames"].get<int>();

        const auto& v = c["visualizer"];
        out.visualizer.enabled    = v["enabled"].get<bool>();
        out.visualizer.intervalMs = v["interval_ms"].get<int>();
        out.visualizer.window     = v["window"].get<bool>();

        const auto& s = c["supervisor"];
        out.supervisor.enabled             = s["enabled"].get<bool>();
        out.supervisor.url                 = s["url"].get<std::string>();
        out.supervisor.authToken           = s["auth_token"].get<std::string>();
        out.supervisor.sendTimeoutMs       = s["send_timeout_ms"].get<int>();
        out.supervisor.initialBackoffMs    = s["initial_backoff_ms"].get<int>();
        out.supervisor.maxBackoffMs        = s["max_backoff_ms"].get<int>();
        out.supervisor.amplitudeIntervalMs = s["amplitude_interval_ms"].get<int>();

        out.logging.level = c["logging"]["level"].get<std::string>();
    } catch (const std::exception& ex) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_INVALID", ex.what());
        if (err) *err = e;
        return false;
    }

    if (out.wake.mode != "always_on" && out.wake.mode != "threshold") {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_INVALID",
                                             "wake.mode must be always_on or threshold");
        if (err) *err = e;
        return false;
    }

    return validateEngineConfig(out.engine, err);
}

// ----------------- entry -----------------
bool initAll(const fs::path& configPath, AppSettings& out, EngineError* err) {
    beginPhaseGroup();

    // errors.json first so later failures have their messages
    fs::path errPath = fs::path(getResourcePath()) / ERRORS_FILE;
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    if (!ErrorManager::load(errPath.string())) {
        // Read-only resources folder: use what was merged in memory
        ErrorManager::loadFromJson(errorsCfg);
    }

    // cadence_config.json (a parse failure resets it, startup continues)
    nlohmann::json cfg;
    loadConfig(configPath, defaultConfig(), cfg, "Cadence config", "ERR_CONFIG_PARSE");

    bool ok = settingsFromJson(cfg, out, err);
    LOG_PHASE("Settings validated", ok);

    endPhaseGroup();
    return ok;
}

} // namespace bootstrap_config

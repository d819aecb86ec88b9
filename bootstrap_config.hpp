#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "engine/engine_config.hpp"
#include "error_manager.hpp"

// Centralized config + error catalog bootstrap for Cadence
namespace bootstrap_config {

    // ------------------------------------------------------------
    // Typed view of cadence_config.json (everything outside "engine"
    // is for the host that wires the engine together)
    // ------------------------------------------------------------
    struct AudioSettings {
        std::string backend = "portaudio";     // "portaudio" | "synthetic"
        int inputDevice  = -1;                 // -1: system default
        int outputDevice = -1;
    };

    struct WakeSettings {
        std::string mode = "always_on";        // "always_on" | "threshold"
        float threshold  = 0.02f;
        int triggerFrames = 3;
        int releaseFrames = 25;
    };

    struct PersonaSettings {
        std::string preset = "jarvis";
        std::string file;                      // overrides preset when set
    };

    struct ModelSettings {
        std::string backend = "scripted";      // "scripted" | "whisper"
        std::string codec   = "mulaw";
        std::string scriptFile;                // scripted turns, empty: built-in
        std::string whisperModel = "ggml-base.en.bin";
        std::string whisperLanguage = "en";
        std::string ollamaUrl = "http://127.0.0.1:11434";
        std::string defaultModel = "mistral";
        int timeoutMs = 60000;
        float silenceThreshold = 0.02f;
        int silenceFrames = 10;
    };

    struct VisualizerSettings {
        bool enabled = true;
        int intervalMs = 33;
        bool window = true;
    };

    struct SupervisorSettings {
        bool enabled = false;
        std::string url = "http://127.0.0.1:9999";
        std::string authToken;
        int sendTimeoutMs = 250;
        int initialBackoffMs = 1000;
        int maxBackoffMs = 30000;
        int amplitudeIntervalMs = 100;
    };

    struct LoggingSettings {
        std::string level = "debug";           // trace | debug | warn | error | off
    };

    struct AppSettings {
        EngineConfig engine;
        AudioSettings audio;
        WakeSettings wake;
        PersonaSettings persona;
        ModelSettings model;
        VisualizerSettings visualizer;
        SupervisorSettings supervisor;
        LoggingSettings logging;
    };

    // Canonical defaults
    nlohmann::json defaultConfig();
    nlohmann::json defaultErrors();

    // Fill keys missing from cfg (or of the wrong type) from defs.
    // Returns true when anything was patched.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Generic loader → ensures defaults, patches missing keys, saves back.
    // A file that does not parse is reset to defaults and false is returned.
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Typed settings from a merged config. ConfigError when the engine
    // section does not validate.
    bool settingsFromJson(const nlohmann::json& cfg, AppSettings& out, EngineError* err);

    // errors.json into ErrorManager, then cadence_config.json into out.
    bool initAll(const std::filesystem::path& configPath, AppSettings& out, EngineError* err);
}

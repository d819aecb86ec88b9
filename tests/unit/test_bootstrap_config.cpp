#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include "bootstrap_config.hpp"
#include "logger.hpp"

using namespace bootstrap_config;

static nlohmann::json readJson(const std::string& path) {
    std::ifstream f(path);
    nlohmann::json j;
    f >> j;
    return j;
}

static void defaultsValidate() {
    AppSettings s;
    EngineError err;
    assert(settingsFromJson(defaultConfig(), s, &err));

    assert(s.engine.frame.samples == 1920);
    assert(s.engine.frame.sampleRate == 24000);
    assert(s.engine.frame.period() == std::chrono::microseconds(80000));
    assert(s.engine.maxRecentMessages == 50);
    assert(s.engine.maxArchivedSessions == 10);
    assert(s.engine.contextQueueCapacity == 5);
    assert(s.engine.deviceRetryLimit == 3);
    assert(s.engine.codecMaxPending == 2);
    assert(s.engine.advisoryPerFrame == 4);
    assert(s.engine.memoryFile == "memory.json");

    assert(s.wake.mode == "always_on");
    assert(s.persona.preset == "jarvis");
    assert(s.model.backend == "scripted");
    assert(s.visualizer.intervalMs == 33);
    assert(!s.supervisor.enabled);
    assert(s.supervisor.sendTimeoutMs == 250);
    assert(s.supervisor.maxBackoffMs == 30000);
}

static void invalidValuesFail() {
    auto bad = [](const char* section, const char* key, nlohmann::json value) {
        nlohmann::json cfg = defaultConfig();
        cfg[section][key] = value;
        AppSettings s;
        EngineError err;
        bool ok = settingsFromJson(cfg, s, &err);
        assert(!ok);
        assert(err.code == "ERR_CONFIG_INVALID");
        assert(err.kind == ErrorKind::Config);
    };
    bad("engine", "frame_samples", 0);
    bad("engine", "frame_samples", -1920);
    bad("engine", "sample_rate", 0);
    bad("engine", "context_queue_capacity", 0);
    bad("engine", "max_recent_messages", 0);
    bad("engine", "codec_max_pending", 0);
    bad("engine", "amplitude_gain", -1.0);
    bad("wake", "mode", "clap");
}

static void mergePatchesMissingAndWrongTypes() {
    nlohmann::json cfg = {
        {"engine", {{"frame_samples", 960}}},
        {"wake", "not an object"}
    };
    int patched = 0;
    assert(mergeDefaults(cfg, defaultConfig(), &patched));
    assert(patched > 0);
    assert(cfg["engine"]["frame_samples"] == 960);        // user value kept
    assert(cfg["engine"]["sample_rate"] == 24000);        // filled in
    assert(cfg["wake"]["mode"] == "always_on");           // wrong type replaced
    assert(cfg.contains("supervisor"));

    // Already complete: nothing to do; an int where a float is expected is fine
    nlohmann::json full = defaultConfig();
    full["engine"]["amplitude_gain"] = 2;
    int again = 0;
    assert(!mergeDefaults(full, defaultConfig(), &again));
    assert(again == 0);
}

static void loaderCreatesPatchesAndResets() {
    const std::string path = "test_cadence_config.json";
    std::remove(path.c_str());

    nlohmann::json cfg;
    assert(loadConfig(path, defaultConfig(), cfg, "Test config", "ERR_CONFIG_PARSE"));
    assert(cfg == defaultConfig());
    assert(readJson(path) == defaultConfig());

    // Remove a key on disk: it is patched back and saved
    nlohmann::json partial = defaultConfig();
    partial["engine"].erase("device_retry_limit");
    partial["engine"]["frame_samples"] = 480;
    std::ofstream(path) << partial.dump();
    assert(loadConfig(path, defaultConfig(), cfg, "Test config", "ERR_CONFIG_PARSE"));
    assert(cfg["engine"]["device_retry_limit"] == 3);
    assert(cfg["engine"]["frame_samples"] == 480);
    assert(readJson(path)["engine"]["device_retry_limit"] == 3);

    // Unparseable file: reset to defaults, reported as failure
    std::ofstream(path) << "{ \"engine\": ";
    assert(!loadConfig(path, defaultConfig(), cfg, "Test config", "ERR_CONFIG_PARSE"));
    assert(cfg == defaultConfig());
    assert(readJson(path) == defaultConfig());

    std::remove(path.c_str());
}

static void errorCatalogCoversEveryCode() {
    ErrorManager::loadFromJson(defaultErrors());
    const char* codes[] = {
        "ERR_DEVICE_UNAVAILABLE", "ERR_DEVICE_CAPTURE", "ERR_DEVICE_PLAYBACK",
        "ERR_DEVICE_DEGRADED", "ERR_CODEC_FRAME", "ERR_MODEL_STEP", "ERR_MODEL_LOAD",
        "ERR_SUPERVISOR_CONNECT", "ERR_SUPERVISOR_AUTH", "ERR_SUPERVISOR_SEND",
        "ERR_CONFIG_INVALID", "ERR_CONFIG_PARSE", "ERR_PERSONA_LOAD",
        "ERR_MEMORY_SAVE", "ERR_MEMORY_LOAD"
    };
    for (const char* code : codes) {
        assert(ErrorManager::getUserMessage(code).find("Unknown error code") == std::string::npos);
        assert(ErrorManager::getDebugMessage(code).find("No debug message") == std::string::npos);
    }

    EngineError e = ErrorManager::report(ErrorKind::Device, "ERR_DEVICE_CAPTURE", "mic 2");
    assert(e.message == ErrorManager::getUserMessage("ERR_DEVICE_CAPTURE") + ": mic 2");
    assert(e.kind == ErrorKind::Device);

    LastErrorCell cell;
    ErrorManager::reportTo(&cell, ErrorKind::Codec, "ERR_CODEC_FRAME");
    assert(cell.count() == 1);
    assert(cell.get()->code == "ERR_CODEC_FRAME");
    cell.clear();
    assert(!cell.get().has_value());
}

int main() {
    setLogLevel(LogLevel::Off);

    defaultsValidate();
    invalidValuesFail();
    mergePatchesMissingAndWrongTypes();
    loaderCreatesPatchesAndResets();
    errorCatalogCoversEveryCode();
    return 0;
}

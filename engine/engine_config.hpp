#pragma once
#include <cstddef>
#include <string>
#include "audio/audio_frame.hpp"
#include "error_manager.hpp"

// Engine-level settings (the "engine" section of cadence_config.json).
struct EngineConfig {
    size_t      maxRecentMessages    = 50;
    size_t      maxArchivedSessions  = 10;
    FrameFormat frame;                          // 1920 samples @ 24 kHz
    size_t      contextQueueCapacity = 5;
    int         deviceRetryLimit     = 3;
    size_t      codecMaxPending      = 2;
    float       amplitudeGain        = 1.0f;
    size_t      contextMessages      = 10;      // history lines injected at start
    size_t      advisoryPerFrame     = 4;       // queue entries drained per frame
    std::string memoryFile;                     // empty: no persistence
};

// ConfigError (ERR_CONFIG_INVALID) on the first offending field.
bool validateEngineConfig(const EngineConfig& cfg, EngineError* err);

#pragma once
#include <atomic>

enum class EngineState {
    Idle,
    Listening,
    Processing,
    Speaking
};

inline const char* engineStateName(EngineState s) {
    switch (s) {
        case EngineState::Idle:       return "Idle";
        case EngineState::Listening:  return "Listening";
        case EngineState::Processing: return "Processing";
        case EngineState::Speaking:   return "Speaking";
    }
    return "Unknown";
}

// Written by the audio loop only; anyone may read.
using EngineStateCell = std::atomic<EngineState>;

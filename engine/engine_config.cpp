#include "engine/engine_config.hpp"

#include <cmath>

static bool invalid(const std::string& detail, EngineError* err) {
    EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_INVALID", detail);
    if (err) *err = e;
    return false;
}

bool validateEngineConfig(const EngineConfig& cfg, EngineError* err) {
    if (cfg.frame.samples == 0)         return invalid("frame_samples must be > 0", err);
    if (cfg.frame.sampleRate <= 0)      return invalid("sample_rate must be > 0", err);
    if (cfg.maxRecentMessages == 0)     return invalid("max_recent_messages must be > 0", err);
    if (cfg.maxArchivedSessions == 0)   return invalid("max_archived_sessions must be > 0", err);
    if (cfg.contextQueueCapacity == 0)  return invalid("context_queue_capacity must be > 0", err);
    if (cfg.codecMaxPending == 0)       return invalid("codec_max_pending must be > 0", err);
    if (cfg.advisoryPerFrame == 0)      return invalid("advisory_per_frame must be > 0", err);
    if (cfg.deviceRetryLimit < 0)       return invalid("device_retry_limit must be >= 0", err);
    if (!std::isfinite(cfg.amplitudeGain) || cfg.amplitudeGain <= 0.0f)
        return invalid("amplitude_gain must be > 0", err);
    if (cfg.frame.period().count() <= 0)
        return invalid("frame_samples / sample_rate gives a zero frame period", err);
    return true;
}

#pragma once
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "model/language_model.hpp"
#include "model/voice_activity.hpp"
#include "audio/audio_frame.hpp"

// ------------------------------------------------------------
// ScriptedModel
// Deterministic conversation partner. Every user utterance (detected by
// energy) is answered with the next scripted turn, cycling through the
// script. Used by the headless host and the tests.
// ------------------------------------------------------------
class ScriptedModel : public LanguageModel {
public:
    struct Turn {
        std::string user;    // transcript reported for the user's utterance
        std::string reply;   // assistant reply text
    };

    struct Options {
        float speechThreshold = 0.02f;
        int   silenceFrames   = 10;   // quiet frames that end a user turn
        int   thinkFrames     = 2;    // frames between user end and reply
    };

    ScriptedModel(std::unique_ptr<Codec> codec, const FrameFormat& fmt,
                  std::vector<Turn> turns, const Options& opts);

    // [{ "user": "...", "reply": "..." }, ...]; bad entries are skipped.
    static std::vector<Turn> turnsFromJson(const nlohmann::json& j);
    static std::vector<Turn> defaultTurns();

    std::string name() const override { return "scripted"; }
    ModelStep step(const Tokens& input, const std::vector<std::string>& advisory) override;
    void reset() override;
    bool userTurnPending() const override;

    // Thread-safe views for tests and the status command
    std::vector<std::string> advisorySeen() const;
    size_t turnsCompleted() const;

private:
    enum class Phase { Listening, Thinking, Speaking };


    std::unique_ptr<Codec> codec_;
    FrameFormat fmt_;
    std::vector<Turn> turns_;
    Options opts_;
    VoiceActivity vad_;

    Phase phase_ = Phase::Listening;
    size_t nextTurn_ = 0;
    int thinkLeft_ = 0;
    std::deque<Tokens> replyFrames_;

    mutable std::mutex viewMtx_;
    std::vector<std::string> advisorySeen_;
    size_t turnsCompleted_ = 0;
};

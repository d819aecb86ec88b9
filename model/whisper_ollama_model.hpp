#pragma once
#include <deque>
#include <future>
#include <memory>
#include <string>
#include "model/language_model.hpp"
#include "model/voice_activity.hpp"
#include "audio/audio_frame.hpp"
#include "error_manager.hpp"

struct whisper_context;

// ------------------------------------------------------------
// WhisperOllamaModel
// User speech is transcribed with whisper.cpp, the reply text comes from
// an Ollama /api/generate call. Both run through std::async and are polled
// with a zero timeout from step(), so the audio loop never waits on them.
// ------------------------------------------------------------
class WhisperOllamaModel : public LanguageModel {
public:
    struct Options {
        std::string whisperModelPath;
        std::string language      = "en";
        int         maxTokens     = 32;
        std::string ollamaUrl     = "http://127.0.0.1:11434";
        std::string modelName     = "mistral";
        int         timeoutMs     = 60000;
        float       speechThreshold = 0.02f;
        int         silenceFrames = 10;
        size_t      advisoryKeep  = 8;     // advisory messages kept for the prompt
    };

    // Loads the whisper model. nullptr (with err filled) on failure.
    static std::unique_ptr<WhisperOllamaModel> create(const Options& opts,
                                                      std::unique_ptr<Codec> codec,
                                                      const FrameFormat& fmt,
                                                      EngineError* err);
    ~WhisperOllamaModel() override;

    std::string name() const override { return "whisper+ollama"; }
    ModelStep step(const Tokens& input, const std::vector<std::string>& advisory) override;
    void reset() override;
    bool userTurnPending() const override;

private:
    WhisperOllamaModel(const Options& opts, std::unique_ptr<Codec> codec,
                       const FrameFormat& fmt, whisper_context* ctx);

    enum class Phase { Listening, Transcribing, Generating, Speaking };

    std::string buildPrompt(const std::string& userText) const;

    Options opts_;
    std::unique_ptr<Codec> codec_;
    FrameFormat fmt_;
    whisper_context* ctx_ = nullptr;
    VoiceActivity vad_;

    Phase phase_ = Phase::Listening;
    std::vector<float> utterance16k_;
    std::deque<std::string> advisory_;
    std::deque<Tokens> replyFrames_;

    std::future<std::string> transcription_;
    std::future<std::string> reply_;
};

namespace Whisper {
    // Linear resample of a mono block (whisper wants 16 kHz).
    std::vector<float> resample(const std::vector<float>& in, int fromRate, int toRate);

    // Trim whitespace and drop whisper's non-speech markers ("[BLANK_AUDIO]").
    std::string cleanTranscript(const std::string& text);
}

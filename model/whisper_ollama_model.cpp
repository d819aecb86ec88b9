#include "model/whisper_ollama_model.hpp"
#include "model/tone_voice.hpp"
#include "audio/amplitude.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

// Shorter utterances are noise bursts, not speech (~300ms at 16kHz)
constexpr size_t MIN_UTTERANCE_SAMPLES = 4800;
constexpr int WHISPER_RATE = 16000;

static bool isReady(const std::future<std::string>& f) {
    return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// ============================================================
// Helpers
// ============================================================
namespace Whisper {

std::vector<float> resample(const std::vector<float>& in, int fromRate, int toRate) {
    if (in.empty() || fromRate <= 0 || toRate <= 0) return {};
    if (fromRate == toRate) return in;

    const double ratio = static_cast<double>(fromRate) / toRate;
    const size_t outLen = static_cast<size_t>(in.size() / ratio);

    std::vector<float> out(outLen);
    for (size_t i = 0; i < outLen; ++i) {
        double pos = i * ratio;
        size_t i0 = static_cast<size_t>(pos);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double frac = pos - i0;
        out[i] = static_cast<float>(in[i0] * (1.0 - frac) + in[i1] * frac);
    }
    return out;
}

std::string cleanTranscript(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    // Drop bracketed markers like [BLANK_AUDIO] or (music)
    int depth = 0;
    for (char c : text) {
        if (c == '[' || c == '(') { ++depth; continue; }
        if ((c == ']' || c == ')') && depth > 0) { --depth; continue; }
        if (depth == 0) out.push_back(c);
    }

    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.front()))) out.erase(out.begin());
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) out.pop_back();
    return out;
}

} // namespace Whisper

// ============================================================
// Construction
// ============================================================
std::unique_ptr<WhisperOllamaModel> WhisperOllamaModel::create(const Options& opts,
                                                               std::unique_ptr<Codec> codec,
                                                               const FrameFormat& fmt,
                                                               EngineError* err) {
    if (!codec) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_CONFIG_INVALID", "no codec for model");
        if (err) *err = e;
        return nullptr;
    }

    if (!fs::exists(opts.whisperModelPath)) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_MODEL_LOAD",
                                             "missing " + opts.whisperModelPath);
        if (err) *err = e;
        return nullptr;
    }

    whisper_context_params wparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(opts.whisperModelPath.c_str(), wparams);
    if (!ctx) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_MODEL_LOAD", opts.whisperModelPath);
        if (err) *err = e;
        return nullptr;
    }

    LOG_PHASE("Whisper model loaded", true);
    LOG_DEBUG("Model", "Whisper: " + fs::absolute(opts.whisperModelPath).string() +
              ", Ollama: " + opts.ollamaUrl + " (" + opts.modelName + ")");

    return std::unique_ptr<WhisperOllamaModel>(
        new WhisperOllamaModel(opts, std::move(codec), fmt, ctx));
}

WhisperOllamaModel::WhisperOllamaModel(const Options& opts, std::unique_ptr<Codec> codec,
                                       const FrameFormat& fmt, whisper_context* ctx)
    : opts_(opts),
      codec_(std::move(codec)),
      fmt_(fmt),
      ctx_(ctx),
      vad_(opts.speechThreshold, opts.silenceFrames) {}

WhisperOllamaModel::~WhisperOllamaModel() {
    // The transcription worker borrows ctx_
    if (transcription_.valid()) transcription_.wait();
    if (reply_.valid()) reply_.wait();

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

// ============================================================
// Prompt
// ============================================================
std::string WhisperOllamaModel::buildPrompt(const std::string& userText) const {
    std::string prompt;
    for (const auto& a : advisory_) {
        prompt += a;
        prompt += "\n\n";
    }
    prompt += "User: " + userText + "\nAssistant:";
    return prompt;
}


// ============================================================
// step()
// ============================================================
ModelStep WhisperOllamaModel::step(const Tokens& input, const std::vector<std::string>& advisory) {
    for (const auto& a : advisory) {
        advisory_.push_back(a);
        while (advisory_.size() > opts_.advisoryKeep) advisory_.pop_front();
    }

    ModelStep out;

    std::vector<float> pcm;
    std::string err;
    float level = 0.0f;
    if (!input.empty() && codec_->decode(input, pcm, err)) {
        level = Amplitude::rms(pcm);
    }

    switch (phase_) {
        case Phase::Listening: {
            // Results of a conversation that was reset are dropped here
            if (isReady(transcription_)) transcription_.get();
            if (isReady(reply_)) reply_.get();

            auto ev = vad_.feed(level);
            if (ev == VoiceActivity::Event::SpeechStart) utterance16k_.clear();

            if (vad_.inSpeech() || ev == VoiceActivity::Event::SpeechEnd) {
                auto chunk = Whisper::resample(pcm, fmt_.sampleRate, WHISPER_RATE);
                utterance16k_.insert(utterance16k_.end(), chunk.begin(), chunk.end());
            }

            if (ev != VoiceActivity::Event::SpeechEnd) break;

            if (utterance16k_.size() < MIN_UTTERANCE_SAMPLES) {
                LOG_TRACE("Model", "Utterance too short, ignored");
                utterance16k_.clear();
                break;
            }
            if (transcription_.valid() || reply_.valid()) {
                LOG_WARN("Model", "Previous request still running, utterance dropped");
                utterance16k_.clear();
                break;
            }

            whisper_context* ctx = ctx_;
            std::string language = opts_.language;
            int maxTokens = opts_.maxTokens;
            transcription_ = std::async(std::launch::async,
                [ctx, language, maxTokens, audio = std::move(utterance16k_)]() -> std::string {
                    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
                    params.no_timestamps = true;
                    params.print_progress = false;
                    params.print_realtime = false;
                    params.max_tokens = maxTokens;
                    params.language = language.c_str();

                    if (whisper_full(ctx, params, audio.data(), static_cast<int>(audio.size())) != 0) {
                        LOG_ERROR("Whisper", "whisper_full() failed");
                        return "";
                    }

                    std::string text;
                    int n = whisper_full_n_segments(ctx);
                    for (int i = 0; i < n; ++i) {
                        text += whisper_full_get_segment_text(ctx, i);
                    }
                    return text;
                });
            utterance16k_.clear();
            phase_ = Phase::Transcribing;
            break;
        }

        case Phase::Transcribing: {
            if (!isReady(transcription_)) break;

            std::string text = Whisper::cleanTranscript(transcription_.get());
            if (text.empty()) {
                LOG_TRACE("Model", "Empty transcript");
                phase_ = Phase::Listening;
                break;
            }

            out.userText = text;
            out.endOfTurn = true;

            std::string url = opts_.ollamaUrl + "/api/generate";
            std::string model = opts_.modelName;
            std::string prompt = buildPrompt(text);
            int timeoutMs = opts_.timeoutMs;
            reply_ = std::async(std::launch::async, [url, model, prompt, timeoutMs]() -> std::string {
                try {
                    auto resp = cpr::Post(
                        cpr::Url{url},
                        cpr::Header{{"Content-Type", "application/json"}},
                        cpr::Body{nlohmann::json{{"model", model}, {"prompt", prompt}, {"stream", false}}.dump()},
                        cpr::Timeout{timeoutMs});
                    if (resp.status_code == 200) {
                        auto j = nlohmann::json::parse(resp.text, nullptr, false);
                        if (!j.is_discarded()) return j.value("response", "");
                    }
                    LOG_ERROR("Ollama", "HTTP " + std::to_string(resp.status_code) + " " + resp.error.message);
                } catch (const std::exception& e) {
                    LOG_ERROR("Ollama", std::string("Exception: ") + e.what());
                }
                return "";
            });
            phase_ = Phase::Generating;
            break;
        }

        case Phase::Generating: {
            if (!isReady(reply_)) break;

            std::string text = reply_.get();
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.erase(text.begin());
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.pop_back();
            if (text.empty()) text = ErrorManager::getUserMessage("ERR_MODEL_STEP");

            out.assistantText = text;
            out.endOfTurn = true;
            replyFrames_ = ToneVoice::renderFrames(text, fmt_, *codec_);
            phase_ = Phase::Speaking;
        }
            [[fallthrough]];

        case Phase::Speaking:
            if (!replyFrames_.empty()) {
                out.audio = std::move(replyFrames_.front());
                replyFrames_.pop_front();
            } else {
                phase_ = Phase::Listening;
                vad_.reset();
            }
            break;
    }

    return out;
}

void WhisperOllamaModel::reset() {
    // In-flight futures are kept and drained in Listening; destroying one
    // here would block the audio loop until the request finished.
    phase_ = Phase::Listening;
    utterance16k_.clear();
    replyFrames_.clear();
    advisory_.clear();
    vad_.reset();
}

bool WhisperOllamaModel::userTurnPending() const {
    return phase_ == Phase::Transcribing ||
           (phase_ == Phase::Listening && vad_.inSpeech());
}

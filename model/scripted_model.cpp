#include "model/scripted_model.hpp"
#include "model/tone_voice.hpp"
#include "audio/amplitude.hpp"
#include "logger.hpp"


ScriptedModel::ScriptedModel(std::unique_ptr<Codec> codec, const FrameFormat& fmt,
                             std::vector<Turn> turns, const Options& opts)
    : codec_(std::move(codec)),
      fmt_(fmt),
      turns_(std::move(turns)),
      opts_(opts),
      vad_(opts.speechThreshold, opts.silenceFrames) {
    if (turns_.empty()) turns_ = defaultTurns();
}

std::vector<ScriptedModel::Turn> ScriptedModel::defaultTurns() {
    return {
        {"Hello there.", "Hello. I am listening."},
        {"What can you do?", "I can hold a conversation and remember what we talked about."},
        {"Thank you.", "You are welcome."}
    };
}

std::vector<ScriptedModel::Turn> ScriptedModel::turnsFromJson(const nlohmann::json& j) {
    std::vector<Turn> turns;
    if (!j.is_array()) return turns;

    for (const auto& entry : j) {
        if (!entry.is_object()) continue;
        Turn t;
        t.user  = entry.value("user", "");
        t.reply = entry.value("reply", "");
        if (t.reply.empty()) continue;
        turns.push_back(t);
    }
    return turns;
}


ModelStep ScriptedModel::step(const Tokens& input, const std::vector<std::string>& advisory) {
    if (!advisory.empty()) {
        std::lock_guard<std::mutex> lock(viewMtx_);
        advisorySeen_.insert(advisorySeen_.end(), advisory.begin(), advisory.end());
    }

    ModelStep out;

    switch (phase_) {
        case Phase::Listening: {
            std::vector<float> pcm;
            std::string err;
            float level = 0.0f;
            if (!input.empty() && codec_->decode(input, pcm, err)) {
                level = Amplitude::rms(pcm);
            }

            if (vad_.feed(level) == VoiceActivity::Event::SpeechEnd) {
                const Turn& turn = turns_[nextTurn_ % turns_.size()];
                out.userText  = turn.user.empty() ? "(inaudible)" : turn.user;
                out.endOfTurn = true;
                phase_ = Phase::Thinking;
                thinkLeft_ = opts_.thinkFrames;
                LOG_TRACE("ScriptedModel", "User turn ended: " + out.userText);
            }
            break;
        }

        case Phase::Thinking:
            if (--thinkLeft_ > 0) break;
            {
                const Turn& turn = turns_[nextTurn_ % turns_.size()];
                ++nextTurn_;
                replyFrames_ = ToneVoice::renderFrames(turn.reply, fmt_, *codec_);
                out.assistantText = turn.reply;
                out.endOfTurn = true;
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
                std::lock_guard<std::mutex> lock(viewMtx_);
                ++turnsCompleted_;
            }
            break;
    }

    return out;
}

void ScriptedModel::reset() {
    phase_ = Phase::Listening;
    thinkLeft_ = 0;
    replyFrames_.clear();
    vad_.reset();
}

bool ScriptedModel::userTurnPending() const {
    return phase_ == Phase::Listening && vad_.inSpeech();
}

std::vector<std::string> ScriptedModel::advisorySeen() const {
    std::lock_guard<std::mutex> lock(viewMtx_);
    return advisorySeen_;
}

size_t ScriptedModel::turnsCompleted() const {
    std::lock_guard<std::mutex> lock(viewMtx_);
    return turnsCompleted_;
}

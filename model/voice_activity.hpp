#pragma once

// Frame-level energy VAD. A turn starts on the first loud frame and ends
// after silenceFrames quiet frames in a row.
class VoiceActivity {
public:
    enum class Event { None, SpeechStart, SpeechEnd };

    VoiceActivity(float threshold, int silenceFrames)
        : threshold_(threshold), silenceFrames_(silenceFrames) {}

    Event feed(float level) {
        bool loud = level >= threshold_;

        if (!inSpeech_) {
            if (!loud) return Event::None;
            inSpeech_ = true;
            quiet_ = 0;
            return Event::SpeechStart;
        }

        if (loud) {
            quiet_ = 0;
            return Event::None;
        }

        if (++quiet_ >= silenceFrames_) {
            inSpeech_ = false;
            quiet_ = 0;
            return Event::SpeechEnd;
        }
        return Event::None;
    }

    bool inSpeech() const { return inSpeech_; }
    void reset() { inSpeech_ = false; quiet_ = 0; }

private:
    float threshold_;
    int silenceFrames_;
    bool inSpeech_ = false;
    int quiet_ = 0;
};

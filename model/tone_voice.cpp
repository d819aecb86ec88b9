#include "model/tone_voice.hpp"
#include "logger.hpp"

#include <cmath>
#include <sstream>
#include <functional>
#include <algorithm>

namespace ToneVoice {

static constexpr double kTwoPi = 6.283185307179586;

std::vector<float> render(const std::string& text, const FrameFormat& fmt,
                          float amplitude, double maxSeconds) {
    std::vector<float> out;
    if (fmt.sampleRate <= 0) return out;

    const size_t maxSamples = static_cast<size_t>(maxSeconds * fmt.sampleRate);
    const size_t gap = static_cast<size_t>(0.04 * fmt.sampleRate);

    std::istringstream words(text);
    std::string word;
    while (words >> word && out.size() < maxSamples) {
        // Longer words hold longer; pitch wanders with the word itself
        double seconds = 0.08 + 0.03 * std::min<size_t>(word.size(), 10);
        size_t n = static_cast<size_t>(seconds * fmt.sampleRate);
        double freq = 140.0 + static_cast<double>(std::hash<std::string>{}(word) % 120);

        for (size_t i = 0; i < n && out.size() < maxSamples; ++i) {
            double env = std::sin(kTwoPi * 0.5 * static_cast<double>(i) / n);
            double t = static_cast<double>(i) / fmt.sampleRate;
            out.push_back(static_cast<float>(amplitude * env * std::sin(kTwoPi * freq * t)));
        }
        for (size_t i = 0; i < gap && out.size() < maxSamples; ++i) out.push_back(0.0f);
    }

    return out;
}

std::deque<Tokens> renderFrames(const std::string& text, const FrameFormat& fmt, Codec& codec) {
    std::deque<Tokens> frames;
    if (fmt.samples == 0) return frames;

    std::vector<float> pcm = render(text, fmt);
    for (size_t pos = 0; pos < pcm.size(); pos += fmt.samples) {
        size_t end = std::min(pos + fmt.samples, pcm.size());
        std::vector<float> chunk(pcm.begin() + pos, pcm.begin() + end);
        chunk.resize(fmt.samples, 0.0f);

        Tokens tokens;
        std::string err;
        if (!codec.encode(chunk, tokens, err)) {
            LOG_WARN("ToneVoice", "Reply frame encode failed: " + err);
            continue;
        }
        frames.push_back(std::move(tokens));
    }
    return frames;
}

} // namespace ToneVoice

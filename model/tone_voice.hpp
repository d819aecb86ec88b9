#pragma once
#include <deque>
#include <string>
#include <vector>
#include "audio/audio_frame.hpp"
#include "codec/codec.hpp"

// Placeholder voice used when no speech synthesizer is wired in: every word
// becomes a short enveloped tone burst, so reply audio has the length and
// rhythm of the text and drives the visualizer like real speech would.
namespace ToneVoice {
    std::vector<float> render(const std::string& text, const FrameFormat& fmt,
                              float amplitude = 0.4f, double maxSeconds = 15.0);

    // render() cut into frame-sized blocks (last one zero padded) and
    // encoded with codec. Blocks that fail to encode are skipped.
    std::deque<Tokens> renderFrames(const std::string& text, const FrameFormat& fmt, Codec& codec);
}

#include "codec/mulaw_codec.hpp"

#include <cmath>
#include <algorithm>

static constexpr int kBias = 0x84;
static constexpr int kClip = 32635;

uint8_t MuLawCodec::encodeSample(int16_t sample) {
    int pcm = sample;
    int sign = (pcm >> 8) & 0x80;
    if (sign) pcm = -pcm;
    if (pcm > kClip) pcm = kClip;
    pcm += kBias;

    int exponent = 7;
    for (int mask = 0x4000; (pcm & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    int mantissa = (pcm >> (exponent + 3)) & 0x0F;

    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

int16_t MuLawCodec::decodeSample(uint8_t code) {
    int value = ~code & 0xFF;
    int sign = value & 0x80;
    int exponent = (value >> 4) & 0x07;
    int mantissa = value & 0x0F;

    int magnitude = ((mantissa << 3) + kBias) << exponent;
    magnitude -= kBias;

    return static_cast<int16_t>(sign ? -magnitude : magnitude);
}

bool MuLawCodec::encode(const std::vector<float>& pcm, Tokens& out, std::string& err) {
    out.clear();
    out.reserve(pcm.size());

    for (float s : pcm) {
        if (std::isnan(s)) {
            err = "NaN sample in frame";
            out.clear();
            return false;
        }
        float clamped = std::clamp(s, -1.0f, 1.0f);
        auto value = static_cast<int16_t>(std::lround(clamped * 32767.0f));
        out.push_back(encodeSample(value));
    }
    return true;
}

bool MuLawCodec::decode(const Tokens& tokens, std::vector<float>& out, std::string& err) {
    out.clear();
    out.reserve(tokens.size());

    for (int32_t t : tokens) {
        if (t < 0 || t > 0xFF) {
            err = "token out of range: " + std::to_string(t);
            out.clear();
            return false;
        }
        out.push_back(decodeSample(static_cast<uint8_t>(t)) / 32768.0f);
    }
    return true;
}

std::unique_ptr<Codec> makeCodec(const std::string& name) {
    if (name == "mulaw") return std::make_unique<MuLawCodec>();
    return nullptr;
}

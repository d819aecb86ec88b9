#pragma once
#include "codec/codec.hpp"

// G.711 μ-law companding, one 8-bit token per sample.
class MuLawCodec : public Codec {
public:
    std::string name() const override { return "mulaw"; }
    bool encode(const std::vector<float>& pcm, Tokens& out, std::string& err) override;
    bool decode(const Tokens& tokens, std::vector<float>& out, std::string& err) override;

    static uint8_t encodeSample(int16_t sample);
    static int16_t decodeSample(uint8_t code);
};

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Model-side representation of one frame of audio.
using Tokens = std::vector<int32_t>;

// ------------------------------------------------------------
// Codec backend
// Translates a PCM block to tokens and back. Backends may throw; the
// CodecAdapter turns both exceptions and false returns into CodecErrors.
// ------------------------------------------------------------
class Codec {
public:
    virtual ~Codec() = default;

    virtual std::string name() const = 0;
    virtual bool encode(const std::vector<float>& pcm, Tokens& out, std::string& err) = 0;
    virtual bool decode(const Tokens& tokens, std::vector<float>& out, std::string& err) = 0;
};

// "mulaw" is the only built-in backend. Returns nullptr for unknown names.
std::unique_ptr<Codec> makeCodec(const std::string& name);

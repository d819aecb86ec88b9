#pragma once
#include <string>
#include <vector>
#include "codec/codec.hpp"

// Result of feeding one frame of tokens to the model.
//
//   userText + endOfTurn       the user's turn is over (final transcript)
//   assistantText + endOfTurn  the reply is decided; audio follows
//   audio                      one frame of reply tokens
//
// While a reply is being spoken the model returns audio on every step;
// the first step without audio ends the reply.
struct ModelStep {
    Tokens audio;
    std::string userText;
    std::string assistantText;
    bool endOfTurn = false;
};

// ------------------------------------------------------------
// LanguageModel
// Pluggable inference step called once per coded frame from the audio
// loop. Implementations must return promptly; slow work belongs on their
// own workers, polled from step().
// ------------------------------------------------------------
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    virtual std::string name() const = 0;

    // advisory holds context text drained from the injection queue since the
    // previous step. It is a hint only; output must not depend on it.
    virtual ModelStep step(const Tokens& input, const std::vector<std::string>& advisory) = 0;

    // Forget per-conversation state (new session).
    virtual void reset() = 0;

    // True while part of a user turn is held but not yet reported: speech
    // is still being heard or its transcript is being produced. The engine
    // keeps stepping the model until this clears.
    virtual bool userTurnPending() const { return false; }
};

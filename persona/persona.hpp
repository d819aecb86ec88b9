#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "error_manager.hpp"

enum class Tone { Professional, Friendly, Casual, Authoritative, Supportive, Analytical };
enum class Verbosity { Concise, Balanced, Detailed, Elaborate };

const char* toneName(Tone tone);
const char* verbosityName(Verbosity verbosity);
bool parseTone(const std::string& name, Tone& out);
bool parseVerbosity(const std::string& name, Verbosity& out);

// Each in [0,1]
struct PersonalityTraits {
    float extraversion      = 0.5f;
    float agreeableness     = 0.5f;
    float conscientiousness = 0.5f;
    float neuroticism       = 0.5f;
    float openness          = 0.5f;
    float formality         = 0.5f;
    float enthusiasm        = 0.5f;
};

struct ResponseStyle {
    Tone      tone           = Tone::Professional;
    Verbosity verbosity      = Verbosity::Balanced;
    float     humor          = 0.3f;
    float     technicalDepth = 0.5f;
    float     empathy        = 0.5f;
    float     proactivity    = 0.5f;
};

struct PersonaProfile {
    std::string name;               // persona name ("Jarvis")
    std::string description;
    std::string roleName;           // how the assistant introduces itself
    std::string primaryFunction;
    PersonalityTraits traits;
    ResponseStyle style;
    std::vector<std::string> guidelines;
    std::vector<std::string> expertise;
    std::string greeting;           // empty: derived from role and formality
    bool proactiveAssistance = true;

    static PersonaProfile jarvis();
    static PersonaProfile friendly();

    // Preset by name ("jarvis", "friendly"), case-insensitive.
    static std::optional<PersonaProfile> preset(const std::string& name);

    // Missing fields keep the defaults above. Trait values are clamped.
    static PersonaProfile fromJson(const nlohmann::json& j);
    static bool loadFile(const std::string& path, PersonaProfile& out, EngineError* err);
    nlohmann::json toJson() const;

    std::string generateContextPrompt() const;
    std::string generateGreeting() const;
    std::optional<std::string> generateResponsePrefix(const std::string& userInput) const;
};

#include "persona/persona.hpp"
#include "audio/amplitude.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

using json = nlohmann::json;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ------------------------------------------------------------
// Enum names
// ------------------------------------------------------------
const char* toneName(Tone tone) {
    switch (tone) {
        case Tone::Professional:  return "professional";
        case Tone::Friendly:      return "friendly";
        case Tone::Casual:        return "casual";
        case Tone::Authoritative: return "authoritative";
        case Tone::Supportive:    return "supportive";
        case Tone::Analytical:    return "analytical";
    }
    return "professional";
}

const char* verbosityName(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Concise:   return "concise";
        case Verbosity::Balanced:  return "balanced";
        case Verbosity::Detailed:  return "detailed";
        case Verbosity::Elaborate: return "elaborate";
    }
    return "balanced";
}

bool parseTone(const std::string& name, Tone& out) {
    static const Tone all[] = {Tone::Professional, Tone::Friendly, Tone::Casual,
                               Tone::Authoritative, Tone::Supportive, Tone::Analytical};
    std::string n = lower(name);
    for (Tone t : all) {
        if (n == toneName(t)) { out = t; return true; }
    }
    return false;
}

bool parseVerbosity(const std::string& name, Verbosity& out) {
    static const Verbosity all[] = {Verbosity::Concise, Verbosity::Balanced,
                                    Verbosity::Detailed, Verbosity::Elaborate};
    std::string n = lower(name);
    for (Verbosity v : all) {
        if (n == verbosityName(v)) { out = v; return true; }
    }
    return false;
}

// ------------------------------------------------------------
// Presets
// ------------------------------------------------------------
PersonaProfile PersonaProfile::jarvis() {
    PersonaProfile p;
    p.name = "Jarvis";
    p.description = "Helpful AI assistant inspired by Jarvis - professional, intelligent, and proactive";
    p.roleName = "Jarvis";
    p.primaryFunction = "Intelligent personal assistant for task management, scheduling, and information retrieval";
    p.traits = {0.6f, 0.8f, 0.9f, 0.2f, 0.7f, 0.7f, 0.6f};
    p.style.tone = Tone::Professional;
    p.style.verbosity = Verbosity::Balanced;
    p.style.humor = 0.3f;
    p.style.technicalDepth = 0.7f;
    p.style.empathy = 0.7f;
    p.style.proactivity = 0.8f;
    p.guidelines = {
        "Address the user professionally but warmly",
        "Anticipate needs and offer proactive suggestions",
        "Be direct and clear in communication",
        "Ask clarifying questions to ensure accuracy",
        "Provide concise updates and confirmations",
        "Maintain context across conversations"
    };
    p.expertise = {"Task management", "Calendar scheduling",
                   "Information retrieval", "Personal productivity"};
    p.greeting = "Good day. How may I assist you?";
    p.proactiveAssistance = true;
    return p;
}

PersonaProfile PersonaProfile::friendly() {
    PersonaProfile p;
    p.name = "Friendly Assistant";
    p.description = "Warm and approachable AI assistant";
    p.roleName = "Assistant";
    p.primaryFunction = "Friendly voice assistant";
    p.traits = {0.8f, 0.9f, 0.7f, 0.3f, 0.8f, 0.3f, 0.8f};
    p.style.tone = Tone::Friendly;
    p.style.verbosity = Verbosity::Balanced;
    p.style.humor = 0.6f;
    p.style.technicalDepth = 0.5f;
    p.style.empathy = 0.9f;
    p.style.proactivity = 0.7f;
    p.guidelines = {
        "Be warm and approachable",
        "Use casual, conversational language",
        "Show empathy and understanding"
    };
    p.expertise = {"General assistance"};
    p.proactiveAssistance = true;
    return p;
}

std::optional<PersonaProfile> PersonaProfile::preset(const std::string& name) {
    std::string n = lower(name);
    if (n == "jarvis") return jarvis();
    if (n == "friendly") return friendly();
    return std::nullopt;
}

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------
static std::vector<std::string> stringList(const json& j, const char* key,
                                           const std::vector<std::string>& fallback) {
    if (!j.contains(key) || !j[key].is_array()) return fallback;
    std::vector<std::string> out;
    for (const auto& v : j[key]) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

PersonaProfile PersonaProfile::fromJson(const json& j) {
    PersonaProfile p;
    p.name            = j.value("name", std::string("Assistant"));
    p.description     = j.value("description", std::string());
    p.roleName        = j.value("role_name", p.name);
    p.primaryFunction = j.value("primary_function", std::string("Voice assistant"));
    p.greeting        = j.value("greeting", std::string());
    p.proactiveAssistance = j.value("proactive_assistance", true);
    p.guidelines = stringList(j, "guidelines", {});
    p.expertise  = stringList(j, "expertise", {});

    if (j.contains("traits") && j["traits"].is_object()) {
        const auto& t = j["traits"];
        auto trait = [&](const char* key, float def) {
            return Amplitude::clamp01(t.value(key, def));
        };
        p.traits.extraversion      = trait("extraversion", p.traits.extraversion);
        p.traits.agreeableness     = trait("agreeableness", p.traits.agreeableness);
        p.traits.conscientiousness = trait("conscientiousness", p.traits.conscientiousness);
        p.traits.neuroticism       = trait("neuroticism", p.traits.neuroticism);
        p.traits.openness          = trait("openness", p.traits.openness);
        p.traits.formality         = trait("formality", p.traits.formality);
        p.traits.enthusiasm        = trait("enthusiasm", p.traits.enthusiasm);
    }

    if (j.contains("style") && j["style"].is_object()) {
        const auto& s = j["style"];
        Tone tone;
        if (parseTone(s.value("tone", std::string()), tone)) p.style.tone = tone;
        Verbosity verbosity;
        if (parseVerbosity(s.value("verbosity", std::string()), verbosity)) p.style.verbosity = verbosity;
        p.style.humor          = Amplitude::clamp01(s.value("humor", p.style.humor));
        p.style.technicalDepth = Amplitude::clamp01(s.value("technical_depth", p.style.technicalDepth));
        p.style.empathy        = Amplitude::clamp01(s.value("empathy", p.style.empathy));
        p.style.proactivity    = Amplitude::clamp01(s.value("proactivity", p.style.proactivity));
    }

    return p;
}

json PersonaProfile::toJson() const {
    return {
        {"name", name},
        {"description", description},
        {"role_name", roleName},
        {"primary_function", primaryFunction},
        {"greeting", greeting},
        {"proactive_assistance", proactiveAssistance},
        {"guidelines", guidelines},
        {"expertise", expertise},
        {"traits", {
            {"extraversion", traits.extraversion},
            {"agreeableness", traits.agreeableness},
            {"conscientiousness", traits.conscientiousness},
            {"neuroticism", traits.neuroticism},
            {"openness", traits.openness},
            {"formality", traits.formality},
            {"enthusiasm", traits.enthusiasm}
        }},
        {"style", {
            {"tone", toneName(style.tone)},
            {"verbosity", verbosityName(style.verbosity)},
            {"humor", style.humor},
            {"technical_depth", style.technicalDepth},
            {"empathy", style.empathy},
            {"proactivity", style.proactivity}
        }}
    };
}

bool PersonaProfile::loadFile(const std::string& path, PersonaProfile& out, EngineError* err) {
    std::ifstream f(path);
    if (!f) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_PERSONA_LOAD", "cannot open " + path);
        if (err) *err = e;
        return false;
    }

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_PERSONA_LOAD", "invalid JSON in " + path);
        if (err) *err = e;
        return false;
    }

    try {
        out = fromJson(j);
    } catch (const std::exception& ex) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_PERSONA_LOAD", path + ": " + ex.what());
        if (err) *err = e;
        return false;
    }

    LOG_DEBUG("Persona", "Loaded persona '" + out.name + "' from " + path);
    return true;
}

// ------------------------------------------------------------
// Text generation
// ------------------------------------------------------------
static const char* toneSentence(Tone tone) {
    switch (tone) {
        case Tone::Professional:  return "I communicate professionally and clearly. ";
        case Tone::Friendly:      return "I'm warm and friendly in my communication. ";
        case Tone::Casual:        return "I keep things casual and relaxed. ";
        case Tone::Authoritative: return "I provide confident, directive guidance. ";
        case Tone::Supportive:    return "I'm supportive and encouraging. ";
        case Tone::Analytical:    return "I focus on logical, fact-based communication. ";
    }
    return "";
}

static const char* verbositySentence(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Concise:   return "I keep responses brief and to the point. ";
        case Verbosity::Balanced:  return "I provide balanced, conversational responses. ";
        case Verbosity::Detailed:  return "I give comprehensive explanations. ";
        case Verbosity::Elaborate: return "I provide thorough, detailed responses. ";
    }
    return "";
}

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::string PersonaProfile::generateContextPrompt() const {
    std::string prompt = "I am " + roleName + ", " + primaryFunction + ". ";

    if (!guidelines.empty()) {
        prompt += "My approach: " + join(guidelines, "; ") + ". ";
    }
    if (!expertise.empty()) {
        prompt += "I can help with " + join(expertise, ", ") + ". ";
    }

    prompt += toneSentence(style.tone);
    prompt += verbositySentence(style.verbosity);
    return prompt;
}

std::string PersonaProfile::generateGreeting() const {
    if (!greeting.empty()) return greeting;
    if (roleName == "Jarvis") return "Good day. How may I assist you?";
    if (traits.formality > 0.6f) return "Hello. How can I help you?";
    return "Hey there! What can I do for you?";
}

std::optional<std::string> PersonaProfile::generateResponsePrefix(const std::string& userInput) const {
    (void)userInput;
    if (!proactiveAssistance) return std::nullopt;

    if (traits.formality > 0.7f) return std::string("Certainly. ");
    if (traits.enthusiasm > 0.7f) return std::string("Sure thing! ");
    return std::nullopt;
}

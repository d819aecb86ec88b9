#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include "persona/personality_context.hpp"
#include "logger.hpp"

static bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

static void jarvisPrompt() {
    auto p = PersonaProfile::jarvis();
    std::string prompt = p.generateContextPrompt();

    assert(prompt.rfind("I am Jarvis, Intelligent personal assistant", 0) == 0);
    assert(contains(prompt, "My approach: Address the user professionally but warmly; "));
    assert(contains(prompt, "I can help with Task management, Calendar scheduling, "));
    assert(contains(prompt, "I communicate professionally and clearly. "));
    assert(contains(prompt, "I provide balanced, conversational responses. "));

    assert(p.generateGreeting() == "Good day. How may I assist you?");
}

static void greetingAndPrefix() {
    auto friendly = PersonaProfile::friendly();
    assert(friendly.generateGreeting() == "Hey there! What can I do for you?");
    assert(contains(friendly.generateContextPrompt(), "I'm warm and friendly in my communication."));

    // Jarvis formality 0.7 is not above 0.7, enthusiasm 0.6 neither
    assert(!PersonaProfile::jarvis().generateResponsePrefix("hi").has_value());
    assert(friendly.generateResponsePrefix("hi") == std::string("Sure thing! "));

    PersonaProfile formal = PersonaProfile::jarvis();
    formal.traits.formality = 0.9f;
    assert(formal.generateResponsePrefix("x") == std::string("Certainly. "));

    formal.proactiveAssistance = false;
    assert(!formal.generateResponsePrefix("x").has_value());

    PersonaProfile plain = PersonaProfile::friendly();
    plain.roleName = "Helper";
    plain.traits.formality = 0.8f;
    assert(plain.generateGreeting() == "Hello. How can I help you?");
}

static void presetsAndJson() {
    assert(PersonaProfile::preset("JARVIS").has_value());
    assert(PersonaProfile::preset("friendly")->name == "Friendly Assistant");
    assert(!PersonaProfile::preset("nobody").has_value());

    auto j = PersonaProfile::jarvis().toJson();
    auto back = PersonaProfile::fromJson(j);
    assert(back.generateContextPrompt() == PersonaProfile::jarvis().generateContextPrompt());

    nlohmann::json custom = {
        {"name", "Ada"},
        {"primary_function", "Research aide"},
        {"traits", {{"formality", 3.0}}},
        {"style", {{"tone", "analytical"}, {"verbosity", "concise"}}}
    };
    auto ada = PersonaProfile::fromJson(custom);
    assert(ada.roleName == "Ada");
    assert(ada.traits.formality == 1.0f);
    assert(ada.style.tone == Tone::Analytical);
    assert(ada.style.verbosity == Verbosity::Concise);
    assert(ada.generateContextPrompt() ==
           "I am Ada, Research aide. I focus on logical, fact-based communication. "
           "I keep responses brief and to the point. ");

    const std::string path = "test_persona.json";
    std::ofstream(path) << custom.dump();
    PersonaProfile loaded;
    assert(PersonaProfile::loadFile(path, loaded, nullptr));
    assert(loaded.name == "Ada");

    std::ofstream(path) << "[1, 2";
    EngineError err;
    assert(!PersonaProfile::loadFile(path, loaded, &err));
    assert(err.code == "ERR_PERSONA_LOAD");
    assert(!PersonaProfile::loadFile("does_not_exist.json", loaded, &err));
    std::remove(path.c_str());
}

static void shippedAnalystPersona() {
    PersonaProfile ada;
    EngineError err;
    assert(PersonaProfile::loadFile(CADENCE_RESOURCE_DIR "/personas/analyst.json", ada, &err));
    assert(ada.name == "Ada");
    assert(ada.style.tone == Tone::Analytical);
    assert(contains(ada.generateContextPrompt(), "I am Ada"));
}

static void swapAffectsLaterCallsOnly() {
    PersonalityContext ctx;
    std::string before = ctx.generateContextPrompt();
    assert(ctx.name() == "Jarvis");

    ctx.swap(PersonaProfile::friendly());
    assert(ctx.name() == "Friendly Assistant");
    assert(ctx.generateContextPrompt() != before);
    assert(contains(before, "I am Jarvis"));

    // Readers and a writer at the same time
    std::thread writer([&] {
        for (int i = 0; i < 200; ++i) {
            ctx.swap(i % 2 ? PersonaProfile::jarvis() : PersonaProfile::friendly());
        }
    });
    for (int i = 0; i < 200; ++i) {
        std::string p = ctx.generateContextPrompt();
        assert(contains(p, "I am Jarvis") || contains(p, "I am Assistant"));
    }
    writer.join();
}

int main() {
    setLogLevel(LogLevel::Off);

    jarvisPrompt();
    greetingAndPrefix();
    presetsAndJson();
    shippedAnalystPersona();
    swapAffectsLaterCallsOnly();
    return 0;
}

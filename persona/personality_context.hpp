#pragma once
#include <shared_mutex>
#include "persona/persona.hpp"

// ------------------------------------------------------------
// PersonalityContext
// The active persona. Readers take a shared lock and work on a copy, so a
// swap never changes text that is already generated.
// ------------------------------------------------------------
class PersonalityContext {
public:
    explicit PersonalityContext(PersonaProfile profile = PersonaProfile::jarvis());

    PersonaProfile profile() const;
    std::string name() const;

    // Affects only calls made after it returns.
    void swap(PersonaProfile profile);

    std::string generateContextPrompt() const;
    std::string generateGreeting() const;
    std::optional<std::string> generateResponsePrefix(const std::string& userInput) const;

private:
    mutable std::shared_mutex mtx_;
    PersonaProfile profile_;
};

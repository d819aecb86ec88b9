#include "persona/personality_context.hpp"
#include "logger.hpp"

#include <mutex>

PersonalityContext::PersonalityContext(PersonaProfile profile)
    : profile_(std::move(profile)) {}

PersonaProfile PersonalityContext::profile() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return profile_;
}

std::string PersonalityContext::name() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return profile_.name;
}

void PersonalityContext::swap(PersonaProfile profile) {
    std::string from, to = profile.name;
    {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        from = profile_.name;
        profile_ = std::move(profile);
    }
    LOG_DEBUG("Persona", "Persona changed: " + from + " -> " + to);
}

std::string PersonalityContext::generateContextPrompt() const {
    return profile().generateContextPrompt();
}

std::string PersonalityContext::generateGreeting() const {
    return profile().generateGreeting();
}

std::optional<std::string> PersonalityContext::generateResponsePrefix(const std::string& userInput) const {
    return profile().generateResponsePrefix(userInput);
}

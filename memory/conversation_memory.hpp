#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "error_manager.hpp"

enum class Speaker { User, Assistant };

const char* speakerName(Speaker speaker);   // "User" / "Assistant"

struct Utterance {
    std::string id;
    Speaker speaker = Speaker::User;
    std::string text;
    std::chrono::system_clock::time_point timestamp{};
    float importance = 0.0f;    // 0.8 user, 0.7 assistant
};

struct ConversationSession {
    std::string id;
    std::chrono::system_clock::time_point startTime{};
    std::optional<std::chrono::system_clock::time_point> endTime;
    std::vector<Utterance> messages;
    std::optional<std::string> summary;
};

// ------------------------------------------------------------
// ConversationMemory
// Current session (rolling, capped at maxRecent) plus an archive of past
// sessions (capped at maxArchived, oldest evicted). Every accessor takes the
// lock briefly and returns copies; nothing here blocks on I/O while locked.
// ------------------------------------------------------------
class ConversationMemory {
public:
    ConversationMemory(size_t maxRecent = 50, size_t maxArchived = 10);

    // Return the new utterance id.
    std::string addUserMessage(const std::string& text);
    std::string addAssistantResponse(const std::string& text);

    // Last `limit` utterances of the current session, oldest first.
    std::vector<Utterance> getRecentMessages(size_t limit) const;

    // "Conversation history:\nUser: ...\nAssistant: ...\n" or "" when empty.
    std::string getContextForPrompt(size_t maxMessages) const;

    // Archive the current session and begin an empty one. Returns its id.
    std::string startNewSession();

    ConversationSession currentSession() const;
    std::string currentSessionId() const;
    size_t messageCount() const;
    std::vector<ConversationSession> archivedSessions() const;
    void clear();

    // "Session: <id> | Messages: N (User: u, Assistant: a)"
    std::string summary() const;

    size_t maxRecent() const { return maxRecent_; }
    size_t maxArchived() const { return maxArchived_; }

    // Persistence (memory.json). Limits are re-applied on load.
    nlohmann::json toJson() const;
    bool fromJson(const nlohmann::json& j, std::string* err = nullptr);
    bool save(const std::string& path, EngineError* err = nullptr) const;
    bool load(const std::string& path, EngineError* err = nullptr);

private:
    std::string add(Speaker speaker, const std::string& text, float importance);

    const size_t maxRecent_;
    const size_t maxArchived_;

    mutable std::mutex mtx_;
    ConversationSession current_;
    std::deque<ConversationSession> archive_;
};

namespace MemoryIds {
    // Random 128-bit id rendered as 8-4-4-4-12 hex.
    std::string generate();
}

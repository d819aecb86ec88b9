#include "memory/conversation_memory.hpp"
#include "logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

using json = nlohmann::json;
using SysClock = std::chrono::system_clock;

const char* speakerName(Speaker speaker) {
    return speaker == Speaker::User ? "User" : "Assistant";
}

namespace MemoryIds {

std::string generate() {
    static thread_local std::mt19937_64 rg{std::random_device{}()};
    static const char hex[] = "0123456789abcdef";

    uint64_t hi = rg();
    uint64_t lo = rg();

    std::string out;
    out.reserve(36);
    for (int i = 0; i < 32; ++i) {
        uint64_t word = (i < 16) ? hi : lo;
        int shift = (15 - (i % 16)) * 4;
        out.push_back(hex[(word >> shift) & 0xF]);
        if (i == 7 || i == 11 || i == 15 || i == 19) out.push_back('-');
    }
    return out;
}

} // namespace MemoryIds

static ConversationSession freshSession() {
    ConversationSession s;
    s.id = MemoryIds::generate();
    s.startTime = SysClock::now();
    return s;
}

ConversationMemory::ConversationMemory(size_t maxRecent, size_t maxArchived)
    : maxRecent_(std::max<size_t>(1, maxRecent)),
      maxArchived_(maxArchived),
      current_(freshSession()) {}

// ------------------------------------------------------------
// Messages
// ------------------------------------------------------------
std::string ConversationMemory::add(Speaker speaker, const std::string& text, float importance) {
    Utterance u;
    u.id = MemoryIds::generate();
    u.speaker = speaker;
    u.text = text;
    u.timestamp = SysClock::now();
    u.importance = importance;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        current_.messages.push_back(u);
        if (current_.messages.size() > maxRecent_) {
            current_.messages.erase(current_.messages.begin(),
                                    current_.messages.end() - maxRecent_);
        }
    }

    LOG_TRACE("Memory", std::string("Added ") + speakerName(speaker) + " message: " +
              std::to_string(text.size()) + " chars");
    return u.id;
}

std::string ConversationMemory::addUserMessage(const std::string& text) {
    return add(Speaker::User, text, 0.8f);
}

std::string ConversationMemory::addAssistantResponse(const std::string& text) {
    return add(Speaker::Assistant, text, 0.7f);
}

std::vector<Utterance> ConversationMemory::getRecentMessages(size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t n = std::min(limit, current_.messages.size());
    return std::vector<Utterance>(current_.messages.end() - n, current_.messages.end());
}

std::string ConversationMemory::getContextForPrompt(size_t maxMessages) const {
    auto messages = getRecentMessages(maxMessages);
    if (messages.empty()) return "";

    std::string context = "Conversation history:\n";
    for (const auto& m : messages) {
        context += speakerName(m.speaker);
        context += ": ";
        context += m.text;
        context += "\n";
    }
    return context;
}

// ------------------------------------------------------------
// Sessions
// ------------------------------------------------------------
std::string ConversationMemory::startNewSession() {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        current_.endTime = SysClock::now();
        archive_.push_back(std::move(current_));
        while (archive_.size() > maxArchived_) archive_.pop_front();

        current_ = freshSession();
        id = current_.id;
    }

    LOG_DEBUG("Memory", "Started new conversation session: " + id);
    return id;
}

ConversationSession ConversationMemory::currentSession() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
}

std::string ConversationMemory::currentSessionId() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_.id;
}

size_t ConversationMemory::messageCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_.messages.size();
}

std::vector<ConversationSession> ConversationMemory::archivedSessions() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<ConversationSession>(archive_.begin(), archive_.end());
}

void ConversationMemory::clear() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        current_.messages.clear();
        current_.summary.reset();
        archive_.clear();
    }
    LOG_DEBUG("Memory", "Cleared all conversation memory");
}

std::string ConversationMemory::summary() const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t total = current_.messages.size();
    size_t user = static_cast<size_t>(std::count_if(
        current_.messages.begin(), current_.messages.end(),
        [](const Utterance& u) { return u.speaker == Speaker::User; }));

    return "Session: " + current_.id +
           " | Messages: " + std::to_string(total) +
           " (User: " + std::to_string(user) +
           ", Assistant: " + std::to_string(total - user) + ")";
}

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------
static int64_t toMillis(SysClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

static SysClock::time_point fromMillis(int64_t ms) {
    return SysClock::time_point(std::chrono::duration_cast<SysClock::duration>(
        std::chrono::milliseconds(ms)));
}

static json utteranceToJson(const Utterance& u) {
    return {
        {"id", u.id},
        {"speaker", speakerName(u.speaker)},
        {"text", u.text},
        {"timestamp_ms", toMillis(u.timestamp)},
        {"importance", u.importance}
    };
}

static json sessionToJson(const ConversationSession& s) {
    json j = {
        {"id", s.id},
        {"start_ms", toMillis(s.startTime)},
        {"messages", json::array()}
    };
    if (s.endTime) j["end_ms"] = toMillis(*s.endTime);
    if (s.summary) j["summary"] = *s.summary;
    for (const auto& u : s.messages) j["messages"].push_back(utteranceToJson(u));
    return j;
}

static ConversationSession sessionFromJson(const json& j, size_t maxRecent) {
    ConversationSession s;
    s.id = j.value("id", "");
    if (s.id.empty()) s.id = MemoryIds::generate();
    s.startTime = fromMillis(j.value("start_ms", int64_t(0)));
    if (j.contains("end_ms")) s.endTime = fromMillis(j["end_ms"].get<int64_t>());
    if (j.contains("summary") && j["summary"].is_string()) s.summary = j["summary"].get<std::string>();

    if (j.contains("messages") && j["messages"].is_array()) {
        for (const auto& m : j["messages"]) {
            Utterance u;
            u.id = m.value("id", "");
            u.speaker = (m.value("speaker", "User") == "Assistant") ? Speaker::Assistant : Speaker::User;
            u.text = m.value("text", "");
            u.timestamp = fromMillis(m.value("timestamp_ms", int64_t(0)));
            u.importance = m.value("importance", u.speaker == Speaker::User ? 0.8f : 0.7f);
            s.messages.push_back(u);
        }
    }
    if (s.messages.size() > maxRecent) {
        s.messages.erase(s.messages.begin(), s.messages.end() - maxRecent);
    }
    return s;
}

json ConversationMemory::toJson() const {
    std::lock_guard<std::mutex> lock(mtx_);
    json j = {
        {"current", sessionToJson(current_)},
        {"archive", json::array()}
    };
    for (const auto& s : archive_) j["archive"].push_back(sessionToJson(s));
    return j;
}

bool ConversationMemory::fromJson(const json& j, std::string* err) {
    try {
        if (!j.is_object() || !j.contains("current") || !j["current"].is_object()) {
            if (err) *err = "missing \"current\" session";
            return false;
        }

        ConversationSession current = sessionFromJson(j["current"], maxRecent_);
        std::deque<ConversationSession> archive;
        if (j.contains("archive") && j["archive"].is_array()) {
            for (const auto& s : j["archive"]) archive.push_back(sessionFromJson(s, maxRecent_));
        }
        while (archive.size() > maxArchived_) archive.pop_front();

        std::lock_guard<std::mutex> lock(mtx_);
        current_ = std::move(current);
        archive_ = std::move(archive);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

bool ConversationMemory::save(const std::string& path, EngineError* err) const {
    json snapshot = toJson();    // serialized outside the lock

    std::ofstream f(path);
    if (!f) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_MEMORY_SAVE", path);
        if (err) *err = e;
        return false;
    }

    f << snapshot.dump(2);
    if (!f) {
        EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_MEMORY_SAVE", path);
        if (err) *err = e;
        return false;
    }

    LOG_PHASE("Memory saved", true);
    return true;
}

bool ConversationMemory::load(const std::string& path, EngineError* err) {
    std::ifstream f(path);
    if (!f) {
        LOG_DEBUG("Memory", "No " + path + " found. Starting fresh.");
        return true;
    }

    json j = json::parse(f, nullptr, false);
    std::string detail;
    if (j.is_discarded()) {
        detail = "parse error";
    } else if (fromJson(j, &detail)) {
        LOG_PHASE("Memory loaded", true);
        LOG_DEBUG("Memory", "Loaded " + std::filesystem::absolute(path).string() +
                  " (" + std::to_string(messageCount()) + " messages)");
        return true;
    }

    EngineError e = ErrorManager::report(ErrorKind::Config, "ERR_MEMORY_LOAD", path + ": " + detail);
    if (err) *err = e;
    LOG_PHASE("Memory load", false);
    return false;
}

#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "memory/conversation_memory.hpp"

// Finalized turn, pushed to the supervisor and then forgotten.
struct TranscriptionEvent {
    Speaker speaker = Speaker::User;
    std::string text;
    std::string sessionId;
    std::chrono::system_clock::time_point timestamp{};
};

// ------------------------------------------------------------
// Wire format (JSON)
//   {type:"transcription", speaker, text, session_id, timestamp}
//   {type:"amplitude", value}
//   {type:"auth", token}  ->  {type:"auth_result", success}
// ------------------------------------------------------------
namespace SupervisorEvents {
    nlohmann::json transcription(const TranscriptionEvent& ev);
    nlohmann::json amplitude(float value);
    nlohmann::json auth(const std::string& token);

    // False when reply is not an auth_result message.
    bool parseAuthResult(const nlohmann::json& reply, bool& success);

    // UTC, millisecond precision: 2024-05-01T12:00:00.250Z
    std::string isoTimestamp(std::chrono::system_clock::time_point tp);
}

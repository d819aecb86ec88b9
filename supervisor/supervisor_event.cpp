#include "supervisor/supervisor_event.hpp"
#include "audio/amplitude.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace SupervisorEvents {

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

json transcription(const TranscriptionEvent& ev) {
    return {
        {"type", "transcription"},
        {"speaker", ev.speaker == Speaker::User ? "user" : "assistant"},
        {"text", ev.text},
        {"session_id", ev.sessionId},
        {"timestamp", isoTimestamp(ev.timestamp)}
    };
}

json amplitude(float value) {
    return {
        {"type", "amplitude"},
        {"value", Amplitude::clamp01(value)}
    };
}

json auth(const std::string& token) {
    return {
        {"type", "auth"},
        {"token", token}
    };
}

bool parseAuthResult(const json& reply, bool& success) {
    if (!reply.is_object() || reply.value("type", "") != "auth_result") return false;
    if (!reply.contains("success") || !reply["success"].is_boolean()) return false;
    success = reply["success"].get<bool>();
    return true;
}

} // namespace SupervisorEvents

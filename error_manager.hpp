#pragma once

#include <string>
#include <chrono>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

// ------------------------------------------------------------
// Error taxonomy
// ------------------------------------------------------------
enum class ErrorKind {
    Device,          // capture/playback failure
    Codec,           // per-frame encode/decode/model failure
    SupervisorLink,  // outbound event link failure
    Config           // construction/startup configuration failure
};

const char* errorKindName(ErrorKind kind);

// ------------------------------------------------------------
// EngineError: unified error record for every component
// ------------------------------------------------------------
struct EngineError {
    ErrorKind kind = ErrorKind::Config;
    std::string code;       // key into errors.json (e.g. "ERR_DEVICE_CAPTURE")
    std::string message;    // user-facing text (+ detail)
    std::chrono::system_clock::time_point timestamp{};
};

// ------------------------------------------------------------
// ErrorSink: receives recovered errors from the audio path
// ------------------------------------------------------------
class ErrorSink {
public:
    virtual ~ErrorSink() = default;
    virtual void record(const EngineError& error) = 0;
};

// Thread-safe "last error" cell. Holds a short critical section only.
class LastErrorCell : public ErrorSink {
public:
    void record(const EngineError& error) override;
    std::optional<EngineError> get() const;
    size_t count() const;
    void clear();

private:
    mutable std::mutex mtx_;
    std::optional<EngineError> last_;
    size_t count_ = 0;
};

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    bool load(const std::string& path);
    void loadFromJson(const nlohmann::json& catalog);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the error and build the record. detail is appended to the
    // user message when non-empty.
    EngineError report(ErrorKind kind,
                       const std::string& code,
                       const std::string& detail = "");

    // report() + forward to sink (if any)
    EngineError reportTo(ErrorSink* sink,
                         ErrorKind kind,
                         const std::string& code,
                         const std::string& detail = "");
}

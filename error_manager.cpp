#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Device:         return "DeviceError";
        case ErrorKind::Codec:          return "CodecError";
        case ErrorKind::SupervisorLink: return "SupervisorLinkError";
        case ErrorKind::Config:         return "ConfigError";
    }
    return "UnknownError";
}

// ------------------------------------------------------------
// LastErrorCell
// ------------------------------------------------------------
void LastErrorCell::record(const EngineError& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    last_ = error;
    ++count_;
}

std::optional<EngineError> LastErrorCell::get() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_;
}

size_t LastErrorCell::count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return count_;
}

void LastErrorCell::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    last_.reset();
    count_ = 0;
}

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
namespace ErrorManager {

static std::mutex g_catalogMutex;
static nlohmann::json g_root = nlohmann::json::object();

void loadFromJson(const nlohmann::json& catalog) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (catalog.contains("errors") && catalog["errors"].is_object()) {
        g_root = catalog["errors"];
    } else if (catalog.is_object()) {
        g_root = catalog;
    } else {
        g_root = nlohmann::json::object();
    }
}

bool load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json errors;
        in >> errors;
        loadFromJson(errors);

        std::string codes;
        {
            std::lock_guard<std::mutex> lock(g_catalogMutex);
            for (auto& [key, val] : g_root.items()) {
                (void)val;
                codes += key + " ";
            }
        }
        LOG_DEBUG("ErrorManager", "Loaded " + fs::absolute(path).string());
        LOG_TRACE("ErrorManager", "Available error codes: " + codes);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (g_root.contains(code) && g_root[code].contains("user")) {
        return g_root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (g_root.contains(code) && g_root[code].contains("debug")) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

EngineError report(ErrorKind kind, const std::string& code, const std::string& detail) {
    EngineError error;
    error.kind      = kind;
    error.code      = code;
    error.message   = getUserMessage(code);
    error.timestamp = std::chrono::system_clock::now();
    if (!detail.empty()) error.message += ": " + detail;

    LOG_ERROR(errorKindName(kind),
              code + " -> " + getDebugMessage(code) + (detail.empty() ? "" : " (" + detail + ")"));
    return error;
}

EngineError reportTo(ErrorSink* sink, ErrorKind kind,
                     const std::string& code, const std::string& detail) {
    EngineError error = report(kind, code, detail);
    if (sink) sink->record(error);
    return error;
}

} // namespace ErrorManager

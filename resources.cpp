#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#if defined(__APPLE__)
    #include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
#if defined(CADENCE_PORTABLE_ONLY)
    fs::path exePath;
  #if defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        exePath = fs::path(buffer).parent_path();
    } else {
        exePath = fs::current_path();
    }
  #else
    std::error_code ec;
    exePath = fs::canonical("/proc/self/exe", ec).parent_path();
    if (ec) exePath = fs::current_path();
  #endif

    fs::path portablePath = exePath / "resources";
    if (fs::exists(portablePath)) {
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return exePath.string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    if (fs::exists(projectPath)) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Last resort: current working directory
    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

// -------------------------------------------------------------
// Load text resource from resources/ folder
// -------------------------------------------------------------
std::string loadTextResource(const std::string& filename) {
    fs::path filePath = resolveResource(filename);

    std::ifstream in(filePath);
    if (!in) {
        LOG_ERROR("Resources", "Resource file not found: " + filePath.string());
        return {};
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string resolveResource(const std::string& filename) {
    fs::path p(filename);
    if (p.is_absolute() || fs::exists(p)) return p.string();
    return (fs::path(getResourcePath()) / p).string();
}

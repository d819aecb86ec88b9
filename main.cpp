#include "bootstrap.hpp"
#include "resources.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <iostream>
#include <sstream>
#include <string>

// ============================================================
// Console commands
// ============================================================
static void printStatus(const ConversationEngine& engine, const VisualizerAnimator* animator) {
    auto s = engine.stats();
    std::cout << "state      " << engineStateName(engine.state())
              << "  amplitude " << engine.amplitude() << "\n"
              << "persona    " << engine.persona().name << "\n"
              << "session    " << engine.memory().currentSessionId()
              << " (" << engine.memory().messageCount() << " messages, "
              << engine.memory().archivedSessions().size() << " archived)\n"
              << "frames     " << s.framesProcessed << " processed, "
              << s.silentFrames << " silent, " << s.framesDropped << " dropped\n"
              << "codec      " << s.codecFailures << " failures, avg "
              << static_cast<int>(s.codecAvgMicros) << " us\n"
              << "turns      " << s.turns << " (" << s.modelFailures << " model failures)\n"
              << "context    " << s.advisoryForwarded << " forwarded, "
              << s.contextEvicted << " evicted\n";
    if (s.sourceDegraded || s.sinkDegraded) {
        std::cout << "devices    degraded (" << (s.sourceDegraded ? "input " : "")
                  << (s.sinkDegraded ? "output" : "") << ")\n";
    }
    if (animator) {
        auto f = animator->snapshot();
        std::cout << "visualizer tick " << f.tick << " level "
                  << amplitudeLevelName(f.level) << "\n";
    }
    if (const auto* b = engine.broadcaster()) {
        auto bs = b->stats();
        std::cout << "supervisor " << (bs.connected ? "connected" : "disconnected")
                  << ", " << bs.sent << " sent, " << bs.dropped << " dropped\n";
    }
    if (auto e = engine.lastError()) {
        std::cout << "last error " << e->code << ": " << e->message << "\n";
    }
    PhaseInfo phase = lastPhase();
    std::cout << "last phase " << phase.phaseName << " (" << phase.fileName << ", "
              << (phase.success ? "ok" : "failed") << ")\n";
}

static void printHelp() {
    std::cout << "commands:\n"
                 "  status               engine, memory and device state\n"
                 "  persona <name|file>  switch persona (jarvis, friendly, or a JSON file)\n"
                 "  inject <text>        queue advisory context for the model\n"
                 "  wake                 open the wake gate for the next turn\n"
                 "  reset                archive the session and start a new one\n"
                 "  quit                 stop and exit\n";
}

static void handleCommand(ConversationEngine& engine, const VisualizerAnimator* animator,
                          const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    std::string arg;
    std::getline(in >> std::ws, arg);

    if (cmd == "status") {
        printStatus(engine, animator);
    } else if (cmd == "persona") {
        if (arg.empty()) {
            std::cout << engine.persona().generateContextPrompt() << "\n";
            return;
        }
        PersonaProfile profile;
        EngineError err;
        if (resolvePersona(arg, profile, &err)) {
            engine.swapPersona(profile);
            std::cout << profile.generateGreeting() << "\n";
        } else {
            std::cout << err.message << "\n";
        }
    } else if (cmd == "inject") {
        if (arg.empty()) {
            std::cout << "Usage: inject <text>\n";
            return;
        }
        engine.injectContext(arg);
    } else if (cmd == "wake") {
        engine.triggerWake();
    } else if (cmd == "reset") {
        std::cout << "New session " << engine.resetSession() << "\n";
    } else if (cmd == "help") {
        printHelp();
    } else {
        std::cout << "Unknown command '" << cmd << "' (try help)\n";
    }
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    // Initialize logger (writes to cadence.log + stderr)
    initLogger("cadence.log");
    LOG_PHASE("Startup begin", true);

    std::string configPath = argc > 1 ? argv[1] : CONFIG_FILE;

    bootstrap_config::AppSettings settings;
    EngineError err;
    if (!runBootstrapChecks(configPath, settings, &err)) {
        std::cerr << err.message << "\n";
        shutdownLogger();
        return 1;
    }

    auto engine = buildEngine(settings, &err);
    if (!engine) {
        std::cerr << err.message << "\n";
        shutdownLogger();
        return 1;
    }

    if (!engine->start(&err)) {
        std::cerr << err.message << "\n";
        shutdownLogger();
        return 1;
    }

    auto animator = buildVisualizer(settings, *engine);
    if (animator) animator->start();

    std::cout << engine->persona().generateGreeting() << "\n";
    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (line.empty()) {
            continue;
        }

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        handleCommand(*engine, animator.get(), line);
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    if (animator) animator->stop();
    engine->stop();
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}

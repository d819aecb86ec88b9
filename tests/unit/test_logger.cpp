#include <cassert>
#include "logger.hpp"

int main() {
    LogLevel level = LogLevel::Debug;
    assert(parseLogLevel("trace", level) && level == LogLevel::Trace);
    assert(parseLogLevel("off", level) && level == LogLevel::Off);
    assert(!parseLogLevel("verbose", level));
    assert(level == LogLevel::Off);

    setLogLevel(LogLevel::Warn);
    assert(getLogLevel() == LogLevel::Warn);

    // Phases are recorded even when below the threshold
    setLogLevel(LogLevel::Off);
    LOG_PHASE("Unit phase", false);
    PhaseInfo p = lastPhase();
    assert(p.phaseName == "Unit phase");
    assert(!p.success);
    assert(p.fileName == "test_logger.cpp");

    beginPhaseGroup();
    LOG_PHASE("Grouped", true);
    endPhaseGroup();
    assert(lastPhase().phaseName == "Grouped" && lastPhase().success);

    LOG_DEBUG("Test", "suppressed");
    return 0;
}

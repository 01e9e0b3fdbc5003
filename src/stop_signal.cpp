#include "stop_signal.hpp"

#include <csignal>

static volatile std::sig_atomic_t g_stop_requested = 0;

static void handleStopSignal(int) {
    g_stop_requested = 1;
}

bool commandWaitsForStop(const std::string& command) {
    return command == "auto" || command == "watch";
}

void installStopHandlers() {
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);
}

bool stopRequested() {
    return g_stop_requested != 0;
}

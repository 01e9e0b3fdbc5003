#ifndef STOP_SIGNAL_HPP
#define STOP_SIGNAL_HPP

#include <string>

// Commands that run until interrupted and poll stopRequested() between steps.
// Everything else keeps the default SIGINT/SIGTERM behaviour.
bool commandWaitsForStop(const std::string& command);

void installStopHandlers();
bool stopRequested();

#endif

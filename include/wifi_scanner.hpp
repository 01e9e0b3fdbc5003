#ifndef WIFI_SCANNER_HPP
#define WIFI_SCANNER_HPP

#include "process_invoker.hpp"
#include "survey_parser.hpp"
#include "wifi_settings.hpp"

#include <string>
#include <vector>

class WifiScanner {
public:
    WifiScanner(const WifiSettings& settings, ProcessInvoker& invoker,
                SleepFunction sleep = realSleep());

    // Triggers a survey, waits for it to settle, then reads and parses it.
    // Returns an empty list when the survey command cannot be run.
    std::vector<NetworkRecord> scanNetwork();

private:
    std::vector<std::string> surveyCommand() const;

    const WifiSettings& settings_;
    ProcessInvoker& invoker_;
    SleepFunction sleep_;
};

// First wlan*/wlp*/wlo*/wlx* interface, or "wlan0" when none is present.
std::string findWirelessInterface();

#endif

#include "wifi_scanner.hpp"

#include <spdlog/spdlog.h>

#include <ifaddrs.h>
#include <utility>

static const auto kSurveyTimeout = std::chrono::seconds(10);
static const auto kSurveySettle = std::chrono::seconds(2);

std::string findWirelessInterface() {
    struct ifaddrs *ifaddr, *ifa;
    std::string interface;

    if (getifaddrs(&ifaddr) == -1) {
        spdlog::debug("[Scanner] getifaddrs failed, assuming wlan0");
        return "wlan0";
    }

    for (ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == NULL) continue;

        std::string name(ifa->ifa_name);
        if (name.find("wlan") == 0 || name.find("wlp") == 0 ||
            name.find("wlo") == 0 || name.find("wlx") == 0) {
            interface = name;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return interface.empty() ? "wlan0" : interface;
}

WifiScanner::WifiScanner(const WifiSettings& settings, ProcessInvoker& invoker,
                         SleepFunction sleep)
    : settings_(settings), invoker_(invoker), sleep_(std::move(sleep)) {}

std::vector<std::string> WifiScanner::surveyCommand() const {
    return settings_.privileged({"iwlist", settings_.interface, "scan"});
}

std::vector<NetworkRecord> WifiScanner::scanNetwork() {
    spdlog::debug("[Scanner] Triggering survey on {}", settings_.interface);

    ProcessResult trigger = invoker_.run(surveyCommand(), kSurveyTimeout);
    if (!trigger.succeeded()) {
        spdlog::debug("[Scanner] Survey trigger: {}", trigger.describe());
    }

    sleep_(kSurveySettle);

    ProcessResult survey = invoker_.run(surveyCommand(), kSurveyTimeout);
    if (survey.error == ProcessError::LaunchFailed || survey.error == ProcessError::TimedOut) {
        spdlog::error("[Scanner] Failed to scan networks: {}", survey.describe());
        return {};
    }
    if (survey.error == ProcessError::NonZeroExit) {
        spdlog::warn("[Scanner] Survey command reported {}", survey.describe());
    }

    std::vector<NetworkRecord> networks = SurveyParser::parse(survey.stdout_text);
    spdlog::info("[Scanner] Found {} WiFi networks", networks.size());
    return networks;
}

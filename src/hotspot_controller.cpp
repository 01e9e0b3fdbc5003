#include "hotspot_controller.hpp"

#include <spdlog/spdlog.h>

#include <vector>

const char* const kHotspotGatewayAddress = "192.168.24.1";

static const auto kScriptTimeout = std::chrono::seconds(30);
static const auto kServiceTimeout = std::chrono::seconds(10);

HotspotController::HotspotController(const WifiSettings& settings, ProcessInvoker& invoker)
    : settings_(settings), invoker_(invoker) {}

bool HotspotController::start(const std::string& ssid, const std::string& password,
                              int channel) {
    spdlog::info("[Hotspot] Starting hotspot '{}' on channel {}", ssid, channel);

    ProcessResult result = invoker_.run(
        helperCommand({"start", ssid, password, std::to_string(channel)}), kScriptTimeout);

    if (!result.succeeded()) {
        spdlog::error("[Hotspot] Helper script failed to start hotspot: {}", result.describe());
        return false;
    }

    spdlog::info("[Hotspot] Hotspot started: {}", ssid);
    return true;
}

bool HotspotController::stop() {
    spdlog::info("[Hotspot] Stopping hotspot");

    ProcessResult result = invoker_.run(helperCommand({"stop"}), kScriptTimeout);

    if (result.succeeded()) {
        spdlog::info("[Hotspot] Hotspot stopped via helper script");
        restartDhcpClient();
        return true;
    }

    spdlog::warn("[Hotspot] Helper script failed: {}. Falling back to manual stop.",
                 result.describe());
    manualStop();
    return false;
}

bool HotspotController::isActive() {
    std::vector<std::string> query = {"systemctl", "is-active", "--quiet", settings_.ap_service};
    ProcessResult result = invoker_.run(query, kServiceTimeout);
    if (result.error == ProcessError::LaunchFailed || result.error == ProcessError::TimedOut) {
        spdlog::debug("[Hotspot] '{}' failed: {}", joinCommand(query), result.describe());
    }
    return result.succeeded();
}

// The interface travels in the environment of the helper itself, since sudo
// resets ours.
std::vector<std::string> HotspotController::helperCommand(
    const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {"env", "WIFIARBITER_IFACE=" + settings_.interface,
                                     settings_.hotspot_script};
    argv.insert(argv.end(), args.begin(), args.end());
    return settings_.privileged(argv);
}

void HotspotController::restartDhcpClient() {
    ProcessResult result = invoker_.run(
        settings_.privileged({"systemctl", "restart", settings_.dhcp_client_service}),
        kServiceTimeout);
    if (!result.succeeded()) {
        spdlog::warn("[Hotspot] Could not restart {}: {}", settings_.dhcp_client_service,
                     result.describe());
    }
}

void HotspotController::manualStop() {
    const std::vector<std::vector<std::string>> commands = {
        {"systemctl", "stop", settings_.ap_service},
        {"systemctl", "stop", settings_.dns_service},
        {"ip", "addr", "flush", "dev", settings_.interface},
    };

    for (const auto& command : commands) {
        std::vector<std::string> argv = settings_.privileged(command);
        ProcessResult result = invoker_.run(argv, kServiceTimeout);
        if (!result.succeeded()) {
            spdlog::error("[Hotspot] '{}' failed: {}", joinCommand(argv), result.describe());
        }
    }

    restartDhcpClient();
}

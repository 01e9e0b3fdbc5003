#include "connectivity_orchestrator.hpp"

#include "json_util.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>

static const auto kServiceTimeout = std::chrono::seconds(10);
static const auto kSupplicantSettle = std::chrono::seconds(2);
static const auto kPollInterval = std::chrono::seconds(1);

const char* toString(ConnectivityMode mode) {
    switch (mode) {
        case ConnectivityMode::Disconnected: return "disconnected";
        case ConnectivityMode::Client: return "client";
        case ConnectivityMode::Hotspot: return "hotspot";
    }
    return "unknown";
}

std::string OrchestratorStatus::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"mode\":" << jsonQuote(toString(mode)) << ",";
    json << "\"connected\":" << (connected() ? "true" : "false") << ",";
    json << "\"hotspot_active\":" << (hotspotActive() ? "true" : "false") << ",";
    json << "\"current_ssid\":" << jsonOptional(current_ssid) << ",";
    json << "\"ip_address\":" << jsonOptional(ip_address) << ",";
    json << "\"configured_ssid\":" << jsonQuote(configured_ssid) << ",";
    json << "\"hotspot_ssid\":" << jsonQuote(hotspot_ssid) << ",";
    json << "\"signal_strength\":" << jsonOptional(signal_strength) << ",";
    json << "\"network_info\":" << link.toJson();
    json << "}";
    return json.str();
}

ConnectivityOrchestrator::ConnectivityOrchestrator(const WifiSettings& settings,
                                                   ProcessInvoker& invoker, LinkProbe& probe,
                                                   WifiScanner& scanner,
                                                   ConfigSynthesizer& synthesizer,
                                                   HotspotController& hotspot,
                                                   SleepFunction sleep)
    : settings_(settings),
      invoker_(invoker),
      probe_(probe),
      scanner_(scanner),
      synthesizer_(synthesizer),
      hotspot_(hotspot),
      sleep_(std::move(sleep)) {
    state_.configured_ssid = settings.ssid;
    state_.configured_password = settings.password;
    spdlog::debug("[Orchestrator] Initialized on {}", settings.interface);
}

std::vector<NetworkRecord> ConnectivityOrchestrator::scan() {
    return scanner_.scanNetwork();
}

LinkStatus ConnectivityOrchestrator::currentLink() {
    return probe_.currentLink();
}

bool ConnectivityOrchestrator::connect(const std::string& ssid, const std::string& password) {
    std::lock_guard<std::mutex> operation(operation_mutex_);

    if (shut_down_) {
        spdlog::warn("[Orchestrator] Ignoring connect to '{}' after shutdown", ssid);
        return false;
    }

    bool hotspot_active;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        hotspot_active = state_.mode == ConnectivityMode::Hotspot;
    }

    if (hotspot_active) {
        spdlog::info("[Orchestrator] Hotspot is active, stopping it first");
        if (!stopHotspotLocked()) {
            spdlog::warn("[Orchestrator] Failed to stop hotspot, connection may fail");
        }
    }

    spdlog::info("[Orchestrator] Attempting to connect to '{}'", ssid);

    if (!synthesizer_.upsertClientBlock(settings_.supplicant_conf, ssid, password)) {
        spdlog::error("[Orchestrator] Could not write supplicant configuration for '{}'", ssid);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.mode = ConnectivityMode::Disconnected;
        state_.current_ssid.reset();
        state_.ip_address.reset();
    }

    restartSupplicant();

    for (int attempt = 1; attempt <= kConnectAttempts; ++attempt) {
        sleep_(kPollInterval);
        LinkStatus link = probe_.currentLink();

        if (link.connected() && link.ssid == ssid) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.mode = ConnectivityMode::Client;
            state_.current_ssid = ssid;
            state_.ip_address = link.ip_address;
            state_.configured_ssid = ssid;
            state_.configured_password = password;
            spdlog::info("[Orchestrator] Connected to '{}' with IP {}", ssid, *link.ip_address);
            return true;
        }

        spdlog::debug("[Orchestrator] Waiting for '{}' ({}/{})", ssid, attempt, kConnectAttempts);
    }

    spdlog::warn("[Orchestrator] Failed to connect to '{}' within timeout", ssid);
    return false;
}

bool ConnectivityOrchestrator::connectConfigured() {
    std::string ssid;
    std::string password;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ssid = state_.configured_ssid;
        password = state_.configured_password;
    }

    if (ssid.empty()) {
        spdlog::info("[Orchestrator] No WiFi SSID configured");
        return false;
    }
    return connect(ssid, password);
}

void ConnectivityOrchestrator::restartSupplicant() {
    std::vector<std::string> restart =
        settings_.privileged({"systemctl", "restart", settings_.supplicant_service});
    ProcessResult result = invoker_.run(restart, kServiceTimeout);
    if (!result.succeeded()) {
        spdlog::warn("[Orchestrator] '{}' failed: {}", joinCommand(restart), result.describe());
    }

    sleep_(kSupplicantSettle);

    std::vector<std::string> reconfigure =
        settings_.privileged({"wpa_cli", "-i", settings_.interface, "reconfigure"});
    result = invoker_.run(reconfigure, kServiceTimeout);
    if (!result.succeeded()) {
        spdlog::warn("[Orchestrator] '{}' failed: {}", joinCommand(reconfigure),
                     result.describe());
    }
}

bool ConnectivityOrchestrator::startHotspot() {
    std::lock_guard<std::mutex> operation(operation_mutex_);

    if (shut_down_) {
        spdlog::warn("[Orchestrator] Ignoring hotspot start after shutdown");
        return false;
    }

    if (!hotspot_.start(settings_.hotspot_ssid, settings_.hotspot_password,
                        settings_.hotspot_channel)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.mode = ConnectivityMode::Hotspot;
    state_.current_ssid.reset();
    state_.ip_address = std::string(kHotspotGatewayAddress);
    return true;
}

bool ConnectivityOrchestrator::stopHotspot() {
    std::lock_guard<std::mutex> operation(operation_mutex_);
    return stopHotspotLocked();
}

bool ConnectivityOrchestrator::stopHotspotLocked() {
    bool stopped = hotspot_.stop();

    // Whatever the helper reported, the access point is no longer treated
    // as running.
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.mode == ConnectivityMode::Hotspot) {
        state_.mode = ConnectivityMode::Disconnected;
        state_.ip_address.reset();
    }
    return stopped;
}

bool ConnectivityOrchestrator::adoptRunningHotspot() {
    std::lock_guard<std::mutex> operation(operation_mutex_);

    if (shut_down_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_.mode != ConnectivityMode::Disconnected) {
            return false;
        }
    }

    if (!hotspot_.isActive()) {
        return false;
    }

    spdlog::info("[Orchestrator] Found a running hotspot, taking it over");
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.mode = ConnectivityMode::Hotspot;
    state_.current_ssid.reset();
    state_.ip_address = std::string(kHotspotGatewayAddress);
    return true;
}

OrchestratorStatus ConnectivityOrchestrator::status() {
    OrchestratorStatus status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status.mode = state_.mode;
        status.current_ssid = state_.current_ssid;
        status.ip_address = state_.ip_address;
        status.configured_ssid = state_.configured_ssid;
    }
    status.hotspot_ssid = settings_.hotspot_ssid;
    status.link = probe_.currentLink();
    status.signal_strength = status.link.signal_strength;
    return status;
}

ConnectivityState ConnectivityOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void ConnectivityOrchestrator::shutdown() {
    std::lock_guard<std::mutex> operation(operation_mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    bool hotspot_active;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        hotspot_active = state_.mode == ConnectivityMode::Hotspot;
    }
    if (hotspot_active) {
        stopHotspotLocked();
    }

    spdlog::info("[Orchestrator] WiFi manager cleaned up");
}

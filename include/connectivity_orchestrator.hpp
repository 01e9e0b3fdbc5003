#ifndef CONNECTIVITY_ORCHESTRATOR_HPP
#define CONNECTIVITY_ORCHESTRATOR_HPP

#include "config_synthesizer.hpp"
#include "hotspot_controller.hpp"
#include "link_probe.hpp"
#include "process_invoker.hpp"
#include "survey_parser.hpp"
#include "wifi_scanner.hpp"
#include "wifi_settings.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class ConnectivityMode {
    Disconnected,
    Client,
    Hotspot
};

const char* toString(ConnectivityMode mode);

struct ConnectivityState {
    ConnectivityMode mode = ConnectivityMode::Disconnected;
    std::optional<std::string> current_ssid;    // set only in Client mode
    std::optional<std::string> ip_address;
    std::string configured_ssid;
    std::string configured_password;
};

struct OrchestratorStatus {
    ConnectivityMode mode = ConnectivityMode::Disconnected;
    std::optional<std::string> current_ssid;
    std::optional<std::string> ip_address;
    std::string configured_ssid;
    std::string hotspot_ssid;
    std::optional<std::string> signal_strength;
    LinkStatus link;

    bool connected() const { return mode == ConnectivityMode::Client; }
    bool hotspotActive() const { return mode == ConnectivityMode::Hotspot; }
    std::string toJson() const;
};

// Decides between client and hotspot operation and sequences the scanner,
// link probe, supplicant configuration and hotspot helper to get there.
//
// Mutating calls (connect, startHotspot, stopHotspot, shutdown) run one at a
// time; a second caller blocks until the first finishes. Reads never wait on
// a mutating call and may observe its intermediate state.
class ConnectivityOrchestrator {
public:
    static constexpr int kConnectAttempts = 30;

    ConnectivityOrchestrator(const WifiSettings& settings, ProcessInvoker& invoker,
                             LinkProbe& probe, WifiScanner& scanner,
                             ConfigSynthesizer& synthesizer, HotspotController& hotspot,
                             SleepFunction sleep = realSleep());

    ConnectivityOrchestrator(const ConnectivityOrchestrator&) = delete;
    ConnectivityOrchestrator& operator=(const ConnectivityOrchestrator&) = delete;

    std::vector<NetworkRecord> scan();
    LinkStatus currentLink();

    // Blocks for up to ~32 s while the supplicant associates.
    bool connect(const std::string& ssid, const std::string& password);
    bool connectConfigured();

    bool startHotspot();
    bool stopHotspot();

    // Takes over an access point started by an earlier process, so that a
    // later connect stops it first.
    bool adoptRunningHotspot();

    OrchestratorStatus status();
    ConnectivityState state() const;

    void shutdown();

private:
    bool stopHotspotLocked();
    void restartSupplicant();

    const WifiSettings& settings_;
    ProcessInvoker& invoker_;
    LinkProbe& probe_;
    WifiScanner& scanner_;
    ConfigSynthesizer& synthesizer_;
    HotspotController& hotspot_;
    SleepFunction sleep_;

    std::mutex operation_mutex_;
    mutable std::mutex state_mutex_;
    ConnectivityState state_;
    bool shut_down_ = false;
};

#endif

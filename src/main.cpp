#include "config_synthesizer.hpp"
#include "connectivity_orchestrator.hpp"
#include "hotspot_controller.hpp"
#include "link_probe.hpp"
#include "process_invoker.hpp"
#include "stop_signal.hpp"
#include "ttl_cache.hpp"
#include "wifi_scanner.hpp"
#include "wifi_settings.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <thread>
#include <unistd.h>
#include <utility>

static const auto kStatusTtl = std::chrono::seconds(5);

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <command> [args]\n";
    std::cout << "Commands:\n";
    std::cout << "  scan                     Survey nearby networks\n";
    std::cout << "  link                     Show the current association\n";
    std::cout << "  status                   Show connectivity status\n";
    std::cout << "  connect <ssid> [pass]    Join a network as a client\n";
    std::cout << "  hotspot start|stop       Start or stop the access point\n";
    std::cout << "  auto                     Join the configured network, else host a hotspot,\n";
    std::cout << "                           and supervise until interrupted\n";
    std::cout << "  watch                    Print status until interrupted\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -j, --json               Output scan as JSON (default)\n";
    std::cout << "  -t, --table              Output scan as formatted table\n";
    std::cout << "  -c, --config FILE        Settings file (key=value)\n";
    std::cout << "  -i, --interface IFACE    Wireless interface (default: detected)\n";
    std::cout << "      --hotspot-ssid SSID\n";
    std::cout << "      --hotspot-password PASS\n";
    std::cout << "      --hotspot-channel N\n";
    std::cout << "      --hotspot-script PATH\n";
    std::cout << "      --supplicant-conf PATH\n";
    std::cout << "      --interval SECONDS   Poll interval for auto and watch\n";
    std::cout << "      --no-sudo            Run system commands without sudo\n";
    std::cout << "  -v, --verbose            Debug logging\n";
    std::cout << "  -q, --quiet              Only log warnings and errors\n";
    std::cout << "\nNote: system commands run through sudo unless --no-sudo is given.\n";
}

void printAsTable(const std::vector<NetworkRecord>& networks) {
    if (networks.empty()) {
        std::cout << "No networks found.\n";
        return;
    }

    std::cout << std::left
              << std::setw(32) << "SSID"
              << std::setw(20) << "BSSID"
              << std::setw(10) << "Quality"
              << std::setw(10) << "Security"
              << "\n";

    std::cout << std::string(72, '-') << "\n";

    for (const auto& net : networks) {
        std::string quality = net.quality ? std::to_string(*net.quality) + "%" : "?";

        std::cout << std::left
                  << std::setw(32) << (net.ssid.empty() ? "<hidden>" : net.ssid)
                  << std::setw(20) << net.bssid
                  << std::setw(10) << quality
                  << std::setw(10) << (net.encrypted ? "Encrypted" : "Open")
                  << "\n";
    }

    std::cout << "\nTotal networks found: " << networks.size() << "\n";
}

void printAsJson(const std::vector<NetworkRecord>& networks) {
    std::cout << "[";
    for (size_t i = 0; i < networks.size(); ++i) {
        std::cout << networks[i].toJson();
        if (i < networks.size() - 1) {
            std::cout << ",";
        }
    }
    std::cout << "]\n";
}

static void applyOverride(WifiSettings& settings, const std::string& option,
                          const std::string& value) {
    if (option == "--interface") {
        settings.interface = value;
    } else if (option == "--hotspot-ssid") {
        settings.hotspot_ssid = value;
    } else if (option == "--hotspot-password") {
        settings.hotspot_password = value;
    } else if (option == "--hotspot-channel") {
        settings.hotspot_channel = std::stoi(value);
    } else if (option == "--hotspot-script") {
        settings.hotspot_script = value;
    } else if (option == "--supplicant-conf") {
        settings.supplicant_conf = value;
    }
}

// Sleeps in short steps so a stop signal is honoured promptly.
static void waitFor(std::chrono::seconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stopRequested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

static OrchestratorStatus cachedStatus(TtlCache<OrchestratorStatus>& cache,
                                       ConnectivityOrchestrator& orchestrator) {
    if (auto cached = cache.get()) {
        return *cached;
    }
    OrchestratorStatus status = orchestrator.status();
    cache.put(status);
    return status;
}

static int runSupervisor(ConnectivityOrchestrator& orchestrator, std::chrono::seconds interval) {
    bool ok = orchestrator.connectConfigured();
    if (!ok) {
        spdlog::info("Falling back to hotspot mode");
        ok = orchestrator.startHotspot();
    }
    if (!ok) {
        spdlog::error("Neither client nor hotspot mode could be established");
    }

    TtlCache<OrchestratorStatus> cache(kStatusTtl);
    while (!stopRequested()) {
        waitFor(interval);
        if (stopRequested()) break;

        OrchestratorStatus status = cachedStatus(cache, orchestrator);
        if (status.mode == ConnectivityMode::Client && !status.link.connected()) {
            spdlog::warn("Lost connection to '{}', reconnecting", status.configured_ssid);
            if (!orchestrator.connectConfigured() && !orchestrator.startHotspot()) {
                spdlog::error("Reconnect failed and hotspot could not be started");
            }
            cache.invalidate();
        }
    }

    orchestrator.shutdown();
    return ok ? 0 : 1;
}

static void runWatch(ConnectivityOrchestrator& orchestrator, std::chrono::seconds interval) {
    TtlCache<OrchestratorStatus> cache(kStatusTtl);
    while (!stopRequested()) {
        std::cout << cachedStatus(cache, orchestrator).toJson() << std::endl;
        waitFor(interval);
    }
}

int main(int argc, char* argv[]) {
    bool useTable = false;
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> positional;
    bool noSudo = false;
    long intervalSeconds = -1;
    spdlog::level::level_enum logLevel = spdlog::level::info;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "-t" || arg == "--table") {
            useTable = true;
        } else if (arg == "-j" || arg == "--json") {
            useTable = false;
        } else if (arg == "-v" || arg == "--verbose") {
            logLevel = spdlog::level::debug;
        } else if (arg == "-q" || arg == "--quiet") {
            logLevel = spdlog::level::warn;
        } else if (arg == "--no-sudo") {
            noSudo = true;
        } else if (arg == "-c" || arg == "--config" || arg == "-i" || arg == "--interface" ||
                   arg == "--hotspot-ssid" || arg == "--hotspot-password" ||
                   arg == "--hotspot-channel" || arg == "--hotspot-script" ||
                   arg == "--supplicant-conf" || arg == "--interval") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for option: " << arg << "\n";
                printHelp(argv[0]);
                return 1;
            }
            std::string value(argv[++i]);
            if (arg == "-c" || arg == "--config") {
                configPath = value;
            } else if (arg == "--interval") {
                intervalSeconds = std::strtol(value.c_str(), nullptr, 10);
            } else {
                overrides.emplace_back(arg == "-i" ? "--interface" : arg, value);
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printHelp(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printHelp(argv[0]);
        return 1;
    }

    spdlog::set_level(logLevel);

    const std::string command = positional[0];

    try {
        WifiSettings settings;
        if (!configPath.empty()) {
            loadSettingsFile(configPath, settings);
        }
        for (const auto& option : overrides) {
            applyOverride(settings, option.first, option.second);
        }
        if (noSudo) {
            settings.use_sudo = false;
        }
        if (settings.interface.empty()) {
            settings.interface = findWirelessInterface();
        }

        if (command != "link" && command != "status" && command != "watch" &&
            !settings.use_sudo && geteuid() != 0) {
            std::cerr << "Error: This program requires root privileges.\n";
            std::cerr << "Please run with: sudo " << argv[0] << "\n";
            return 1;
        }

        PosixProcessInvoker invoker;
        SystemLinkProbe probe(settings.interface);
        WifiScanner scanner(settings, invoker);
        ConfigSynthesizer synthesizer;
        HotspotController hotspot(settings, invoker);
        ConnectivityOrchestrator orchestrator(settings, invoker, probe, scanner, synthesizer,
                                              hotspot);

        if (command != "scan" && command != "link") {
            orchestrator.adoptRunningHotspot();
        }

        if (commandWaitsForStop(command)) {
            installStopHandlers();
        }

        if (command == "scan") {
            if (useTable) {
                std::cout << "Scanning for WiFi networks...\n\n";
            }

            auto networks = orchestrator.scan();

            if (useTable) {
                printAsTable(networks);
            } else {
                printAsJson(networks);
            }
            return 0;
        }

        if (command == "link") {
            std::cout << orchestrator.currentLink().toJson() << "\n";
            return 0;
        }

        if (command == "status") {
            std::cout << orchestrator.status().toJson() << "\n";
            return 0;
        }

        if (command == "connect") {
            if (positional.size() < 2) {
                std::cerr << "connect requires an SSID\n";
                return 1;
            }
            const std::string& ssid = positional[1];
            const std::string password = positional.size() > 2 ? positional[2] : "";

            if (!orchestrator.connect(ssid, password)) {
                std::cerr << "Failed to connect to " << ssid << "\n";
                return 1;
            }
            if (!configPath.empty()) {
                settings.ssid = ssid;
                settings.password = password;
                if (!saveSettingsFile(configPath, settings)) {
                    std::cerr << "Warning: could not save credentials to " << configPath << "\n";
                }
            }
            std::cout << orchestrator.status().toJson() << "\n";
            return 0;
        }

        if (command == "hotspot") {
            std::string action = positional.size() > 1 ? positional[1] : "";
            if (action == "start") {
                return orchestrator.startHotspot() ? 0 : 1;
            }
            if (action == "stop") {
                return orchestrator.stopHotspot() ? 0 : 1;
            }
            std::cerr << "hotspot requires 'start' or 'stop'\n";
            return 1;
        }

        if (command == "auto") {
            return runSupervisor(orchestrator,
                                 std::chrono::seconds(intervalSeconds > 0 ? intervalSeconds : 10));
        }

        if (command == "watch") {
            runWatch(orchestrator, std::chrono::seconds(intervalSeconds > 0 ? intervalSeconds : 1));
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        printHelp(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

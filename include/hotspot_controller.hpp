#ifndef HOTSPOT_CONTROLLER_HPP
#define HOTSPOT_CONTROLLER_HPP

#include "process_invoker.hpp"
#include "wifi_settings.hpp"

#include <string>
#include <vector>

extern const char* const kHotspotGatewayAddress;

// Brings the access point and its DHCP/DNS service up or down through the
// hotspot helper script. Never throws; every failure is logged.
class HotspotController {
public:
    HotspotController(const WifiSettings& settings, ProcessInvoker& invoker);

    bool start(const std::string& ssid, const std::string& password, int channel);

    // False when the helper script failed, even though the manual cleanup
    // that follows leaves the access point stopped.
    bool stop();

    // True when the access point service is running, whoever started it.
    bool isActive();

private:
    std::vector<std::string> helperCommand(const std::vector<std::string>& args) const;
    void restartDhcpClient();
    void manualStop();

    const WifiSettings& settings_;
    ProcessInvoker& invoker_;
};

#endif

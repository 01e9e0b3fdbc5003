#ifndef WIFI_SETTINGS_HPP
#define WIFI_SETTINGS_HPP

#include <string>
#include <vector>

struct WifiSettings {
    std::string interface;             // empty: detect at startup

    std::string ssid;
    std::string password;

    std::string hotspot_ssid = "LOOP-Setup";
    std::string hotspot_password = "loop123";
    int hotspot_channel = 11;
    std::string hotspot_script = "/usr/lib/wifiarbiter/hotspot.sh";

    std::string supplicant_conf = "/etc/wpa_supplicant/wpa_supplicant.conf";
    std::string supplicant_service = "wpa_supplicant";
    std::string ap_service = "hostapd";
    std::string dns_service = "dnsmasq";
    std::string dhcp_client_service = "dhcpcd";

    bool use_sudo = true;

    // argv for a privileged command: prefixed with sudo when enabled.
    std::vector<std::string> privileged(std::vector<std::string> argv) const;
};

// Reads key=value lines into `settings`, leaving unspecified keys untouched.
// Throws std::runtime_error when the file cannot be read.
void loadSettingsFile(const std::string& path, WifiSettings& settings);

bool saveSettingsFile(const std::string& path, const WifiSettings& settings);

#endif

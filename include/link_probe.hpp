#ifndef LINK_PROBE_HPP
#define LINK_PROBE_HPP

#include <optional>
#include <string>

struct LinkStatus {
    std::optional<std::string> ssid;
    std::optional<std::string> ip_address;
    std::optional<std::string> signal_strength;

    bool connected() const { return ssid.has_value() && ip_address.has_value(); }
    std::string toJson() const;
};

class LinkProbe {
public:
    virtual ~LinkProbe() = default;
    virtual LinkStatus currentLink() = 0;
};

// Reads association from nl80211, the address from getifaddrs and the
// signal level from the kernel's wireless statistics table.
class SystemLinkProbe : public LinkProbe {
public:
    explicit SystemLinkProbe(std::string interface,
                             std::string wireless_stats_path = "/proc/net/wireless");

    LinkStatus currentLink() override;

    std::optional<std::string> associatedSsid() const;
    std::optional<std::string> ipv4Address() const;
    std::optional<std::string> signalLevel() const;

private:
    std::string interface_;
    std::string wireless_stats_path_;
};

// Signal level column of `interface`'s row in /proc/net/wireless format.
std::optional<std::string> parseWirelessStats(const std::string& text,
                                              const std::string& interface);

#endif

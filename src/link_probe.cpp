#include "link_probe.hpp"

#include "json_util.hpp"

#include <linux/nl80211.h>
#include <netlink/netlink.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <fstream>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sstream>
#include <utility>
#include <vector>

static int interface_handler(struct nl_msg* msg, void* arg) {
    auto* ssid = static_cast<std::optional<std::string>*>(arg);
    struct genlmsghdr* gnlh = static_cast<struct genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));
    struct nlattr* tb[NL80211_ATTR_MAX + 1];

    nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0),
              genlmsg_attrlen(gnlh, 0), NULL);

    if (tb[NL80211_ATTR_SSID]) {
        int len = nla_len(tb[NL80211_ATTR_SSID]);
        if (len > 0 && len <= 32) {
            *ssid = std::string(static_cast<char*>(nla_data(tb[NL80211_ATTR_SSID])), len);
        }
    }

    return NL_SKIP;
}

static int finish_handler(struct nl_msg* msg, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_SKIP;
}

static int error_handler(struct sockaddr_nl* nla, struct nlmsgerr* err, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = err->error;
    return NL_STOP;
}

static int ack_handler(struct nl_msg* msg, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_STOP;
}

std::string LinkStatus::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"ssid\":" << jsonOptional(ssid) << ",";
    json << "\"ip_address\":" << jsonOptional(ip_address) << ",";
    json << "\"signal_strength\":" << jsonOptional(signal_strength) << ",";
    json << "\"connected\":" << (connected() ? "true" : "false");
    json << "}";
    return json.str();
}

std::optional<std::string> parseWirelessStats(const std::string& text,
                                              const std::string& interface) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string part;
        while (fields >> part) {
            parts.push_back(part);
        }
        if (parts.empty()) continue;

        std::string name = parts[0];
        if (!name.empty() && name.back() == ':') name.pop_back();
        if (name != interface) continue;

        if (parts.size() < 4) {
            return std::nullopt;
        }
        std::string level = parts[3];
        while (!level.empty() && level.back() == '.') level.pop_back();
        if (level.empty()) {
            return std::nullopt;
        }
        return level;
    }
    return std::nullopt;
}

SystemLinkProbe::SystemLinkProbe(std::string interface, std::string wireless_stats_path)
    : interface_(std::move(interface)), wireless_stats_path_(std::move(wireless_stats_path)) {}

LinkStatus SystemLinkProbe::currentLink() {
    LinkStatus status;
    status.ssid = associatedSsid();
    status.ip_address = ipv4Address();
    status.signal_strength = signalLevel();
    return status;
}

std::optional<std::string> SystemLinkProbe::associatedSsid() const {
    std::optional<std::string> ssid;

    int if_index = if_nametoindex(interface_.c_str());
    if (if_index == 0) {
        spdlog::debug("[LinkProbe] Wireless interface {} not found", interface_);
        return ssid;
    }

    struct nl_sock* sock = nl_socket_alloc();
    if (!sock) {
        spdlog::debug("[LinkProbe] Failed to allocate netlink socket");
        return ssid;
    }

    if (genl_connect(sock) < 0) {
        spdlog::debug("[LinkProbe] Failed to connect to generic netlink");
        nl_socket_free(sock);
        return ssid;
    }

    int nl80211_id = genl_ctrl_resolve(sock, "nl80211");
    if (nl80211_id < 0) {
        spdlog::debug("[LinkProbe] nl80211 not available");
        nl_close(sock);
        nl_socket_free(sock);
        return ssid;
    }

    struct nl_msg* msg = nlmsg_alloc();
    if (!msg) {
        spdlog::debug("[LinkProbe] Failed to allocate netlink message");
        nl_close(sock);
        nl_socket_free(sock);
        return ssid;
    }

    genlmsg_put(msg, 0, 0, nl80211_id, 0, 0, NL80211_CMD_GET_INTERFACE, 0);
    nla_put_u32(msg, NL80211_ATTR_IFINDEX, if_index);

    struct nl_cb* cb = nl_cb_alloc(NL_CB_DEFAULT);
    if (!cb) {
        spdlog::debug("[LinkProbe] Failed to allocate netlink callbacks");
        nlmsg_free(msg);
        nl_close(sock);
        nl_socket_free(sock);
        return ssid;
    }

    int err = 1;
    nl_cb_set(cb, NL_CB_VALID, NL_CB_CUSTOM, interface_handler, &ssid);
    nl_cb_err(cb, NL_CB_CUSTOM, error_handler, &err);
    nl_cb_set(cb, NL_CB_FINISH, NL_CB_CUSTOM, finish_handler, &err);
    nl_cb_set(cb, NL_CB_ACK, NL_CB_CUSTOM, ack_handler, &err);

    if (nl_send_auto(sock, msg) < 0) {
        spdlog::debug("[LinkProbe] Failed to send interface query");
        err = 0;
    }

    while (err > 0) {
        int rc = nl_recvmsgs(sock, cb);
        if (rc < 0) {
            err = rc;
        }
    }

    if (err < 0) {
        spdlog::debug("[LinkProbe] Interface query for {} failed with error: {}", interface_, err);
    }

    nlmsg_free(msg);
    nl_cb_put(cb);
    nl_close(sock);
    nl_socket_free(sock);

    return ssid;
}

std::optional<std::string> SystemLinkProbe::ipv4Address() const {
    struct ifaddrs *ifaddr, *ifa;
    std::optional<std::string> address;

    if (getifaddrs(&ifaddr) == -1) {
        spdlog::debug("[LinkProbe] getifaddrs failed");
        return address;
    }

    for (ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == NULL || ifa->ifa_addr == NULL) continue;
        if (interface_ != ifa->ifa_name || ifa->ifa_addr->sa_family != AF_INET) continue;

        char buffer[INET_ADDRSTRLEN];
        auto* in = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer))) {
            address = std::string(buffer);
            break;
        }
    }

    freeifaddrs(ifaddr);

    if (!address) {
        spdlog::debug("[LinkProbe] No IPv4 address on {}", interface_);
    }
    return address;
}

std::optional<std::string> SystemLinkProbe::signalLevel() const {
    std::ifstream in(wireless_stats_path_);
    if (!in) {
        spdlog::debug("[LinkProbe] Cannot read {}", wireless_stats_path_);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    auto level = parseWirelessStats(buffer.str(), interface_);
    if (!level) {
        spdlog::debug("[LinkProbe] No statistics row for {}", interface_);
    }
    return level;
}

#include "link_probe.hpp"

#include <gtest/gtest.h>

static const char* kWirelessStats =
    "Inter-| sta-|   Quality        |   Discarded packets               | Missed | WE\n"
    " face | tus | link level noise |  nwid  crypt   frag  retry   misc | beacon | 22\n"
    " wlan1: 0000   40.  -70.  -256        0      0      0      0      0        0\n"
    " wlan0: 0000   58.  -52.  -256        0      0      0     12      0        0\n";

TEST(ParseWirelessStatsTest, ReadsLevelColumnOfInterfaceRow) {
    EXPECT_EQ(parseWirelessStats(kWirelessStats, "wlan0"), "-52");
    EXPECT_EQ(parseWirelessStats(kWirelessStats, "wlan1"), "-70");
}

TEST(ParseWirelessStatsTest, MissingRowIsAbsent) {
    EXPECT_FALSE(parseWirelessStats(kWirelessStats, "wlan2").has_value());
    EXPECT_FALSE(parseWirelessStats("", "wlan0").has_value());
}

TEST(ParseWirelessStatsTest, ShortRowIsAbsent) {
    EXPECT_FALSE(parseWirelessStats(" wlan0: 0000   58.\n", "wlan0").has_value());
}

TEST(LinkStatusTest, ConnectedNeedsSsidAndAddress) {
    LinkStatus link;
    EXPECT_FALSE(link.connected());

    link.ssid = "Home";
    EXPECT_FALSE(link.connected());

    link.ip_address = "192.168.1.4";
    EXPECT_TRUE(link.connected());

    link.ssid.reset();
    EXPECT_FALSE(link.connected());
}

TEST(SystemLinkProbeTest, AbsentInterfaceReportsDisconnected) {
    SystemLinkProbe probe("wlnotthere0", "/nonexistent/wireless");

    LinkStatus link = probe.currentLink();

    EXPECT_FALSE(link.ssid.has_value());
    EXPECT_FALSE(link.ip_address.has_value());
    EXPECT_FALSE(link.signal_strength.has_value());
    EXPECT_FALSE(link.connected());
}

TEST(SystemLinkProbeTest, LoopbackAddressIsFound) {
    SystemLinkProbe probe("lo", "/nonexistent/wireless");

    auto address = probe.ipv4Address();

    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "127.0.0.1");
}

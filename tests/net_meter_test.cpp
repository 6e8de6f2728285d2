#include "net_meter.h"

#include <gtest/gtest.h>

namespace {

const char *NETDEV =
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
    "    lo:  123456     100    0    0    0     0          0         0   123456     100    0    0    0     0       0          0\n"
    "enp3s0: 9876543   12000    0    0    0     0          0        10  5432100    8000    0    0    0     0       0          0\n"
    " wlan0:     500       5    0    0    0     0          0         0      400       4    0    0    0     0       0          0\n";

IfaceInfo iface(const char *name, bool up, bool carrier, bool wireless) {
    IfaceInfo i;
    i.name = name;
    i.up = up;
    i.carrier = carrier;
    i.wireless = wireless;
    return i;
}

} // namespace

TEST(NetMeterTest, ParsesCountersForInterface) {
    uint64_t rx = 0, tx = 0;
    ASSERT_TRUE(parse_netdev(NETDEV, "enp3s0", rx, tx));
    EXPECT_EQ(rx, 9876543u);
    EXPECT_EQ(tx, 5432100u);

    ASSERT_TRUE(parse_netdev(NETDEV, "wlan0", rx, tx));
    EXPECT_EQ(rx, 500u);
    EXPECT_FALSE(parse_netdev(NETDEV, "eth9", rx, tx));
}

TEST(NetMeterTest, ScorePrefersLinkThenWired) {
    EXPECT_GT(iface_score(iface("eth0", true, true, false)),
              iface_score(iface("wlan0", true, true, true)));
    EXPECT_GT(iface_score(iface("wlan0", true, true, true)),
              iface_score(iface("eth2", false, false, false)));
    EXPECT_GT(iface_score(iface("eth1", true, false, false)),
              iface_score(iface("eth2", false, false, false)));
}

TEST(NetMeterTest, PickPrefersOverrideThenDefaultRoute) {
    std::vector<IfaceInfo> all = {iface("eth0", true, true, false),
                                  iface("wlan0", true, true, true)};
    std::vector<IfaceInfo> route = {iface("wlan0", true, true, true)};

    EXPECT_EQ(pick_iface("tun0", route, all), "tun0");
    EXPECT_EQ(pick_iface("", route, all), "wlan0");
    EXPECT_EQ(pick_iface("", {}, all), "eth0");
    EXPECT_EQ(pick_iface("", {}, {}), "");
}

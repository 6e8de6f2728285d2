#pragma once
#include "clock.h"

#include <cstdint>
#include <string>
#include <vector>

struct IfaceInfo {
    std::string name;
    bool up{false};
    bool carrier{false};
    bool wireless{false};
};

// Ranks an interface: up+carrier beats up beats down, wired beats wireless.
int iface_score(const IfaceInfo &inf);

// Chooses the interface to meter: the override if given, otherwise the best
// default-route interface, otherwise the best of all non-loopback ones.
std::string pick_iface(const std::string &preferred,
                       const std::vector<IfaceInfo> &default_route,
                       const std::vector<IfaceInfo> &all);

// rx/tx byte counters for `iface` out of /proc/net/dev text.
bool parse_netdev(const std::string &text, const std::string &iface,
                  uint64_t &rx, uint64_t &tx);

// Byte rates of the active interface from /proc/net/dev deltas. Re-picks
// the interface when the current one goes down.
class NetMeter {
public:
    NetMeter(Clock &clock, std::string preferred);

    // Bytes per second since the previous call; false on the first call
    // and whenever the interface changed.
    bool rates(double &rx_bytes_per_s, double &tx_bytes_per_s);

    const std::string &iface() const { return iface_; }

private:
    void prime();
    void maybe_repick();

    Clock      &clock_;
    std::string preferred_;
    std::string iface_;
    bool        primed_{false};
    uint64_t    rx0_{0};
    uint64_t    tx0_{0};
    Clock::time_point t0_{};
};

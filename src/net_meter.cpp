#include "net_meter.h"
#include "sys_util.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace {

IfaceInfo iface_info(const std::string &name)
{
    IfaceInfo inf;
    inf.name = name;
    inf.up = read_line("/sys/class/net/" + name + "/operstate") == "up";
    inf.carrier = read_line("/sys/class/net/" + name + "/carrier") == "1";
    inf.wireless = path_exists("/sys/class/net/" + name + "/wireless");
    return inf;
}

// Interfaces carrying a default route, from /proc/net/route.
std::vector<IfaceInfo> default_route_ifaces()
{
    std::vector<IfaceInfo> out;
    std::istringstream in(read_file("/proc/net/route"));
    std::string line;
    std::getline(in, line); // header
    while (std::getline(in, line))
    {
        std::istringstream ls(line);
        std::string name, dest;
        if (!(ls >> name >> dest) || dest != "00000000")
            continue;
        bool dup = std::any_of(out.begin(), out.end(),
                               [&name](const IfaceInfo &i) { return i.name == name; });
        if (!dup)
            out.push_back(iface_info(name));
    }
    return out;
}

std::vector<IfaceInfo> all_ifaces()
{
    std::vector<IfaceInfo> out;
    for (const auto &path : glob_paths("/sys/class/net/*"))
    {
        std::string name = path.substr(path.rfind('/') + 1);
        if (name != "lo")
            out.push_back(iface_info(name));
    }
    return out;
}

std::string best_of(const std::vector<IfaceInfo> &cands)
{
    const IfaceInfo *best = nullptr;
    for (const auto &c : cands)
    {
        int s = iface_score(c);
        if (s > 0 && (!best || s > iface_score(*best)))
            best = &c;
    }
    return best ? best->name : std::string();
}

} // namespace

int iface_score(const IfaceInfo &inf)
{
    int link = (inf.up && inf.carrier) ? 2 : (inf.up ? 1 : 0);
    return link + (inf.wireless ? 0 : 1);
}

std::string pick_iface(const std::string &preferred,
                       const std::vector<IfaceInfo> &default_route,
                       const std::vector<IfaceInfo> &all)
{
    if (!preferred.empty())
        return preferred;

    std::string name = best_of(default_route);
    if (!name.empty())
        return name;
    name = best_of(all);
    if (!name.empty())
        return name;
    return all.empty() ? std::string() : all.front().name;
}

bool parse_netdev(const std::string &text, const std::string &iface,
                  uint64_t &rx, uint64_t &tx)
{
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        if (trim(line.substr(0, colon)) != iface)
            continue;

        std::istringstream cols(line.substr(colon + 1));
        std::vector<uint64_t> v;
        uint64_t x = 0;
        while (cols >> x)
            v.push_back(x);
        if (v.size() < 16)
            return false;
        rx = v[0];
        tx = v[8];
        return true;
    }
    return false;
}

NetMeter::NetMeter(Clock &clock, std::string preferred)
    : clock_(clock), preferred_(std::move(preferred))
{
    iface_ = pick_iface(preferred_, default_route_ifaces(), all_ifaces());
    if (iface_.empty())
        std::cerr << "[Net] No network interface found\n";
    else
        std::cout << "[Net] Metering " << iface_ << "\n";
    prime();
}

void NetMeter::prime()
{
    primed_ = false;
    if (iface_.empty())
        return;
    if (parse_netdev(read_file("/proc/net/dev"), iface_, rx0_, tx0_))
    {
        t0_ = clock_.now();
        primed_ = true;
    }
}

void NetMeter::maybe_repick()
{
    if (!preferred_.empty())
        return;

    IfaceInfo inf = iface_.empty() ? IfaceInfo{} : iface_info(iface_);
    if (!iface_.empty() && inf.up && (!inf.wireless || inf.carrier))
        return;

    std::string next = pick_iface(std::string(), default_route_ifaces(), all_ifaces());
    if (!next.empty() && next != iface_)
    {
        std::cout << "[Net] Switching " << (iface_.empty() ? "-" : iface_) << " -> " << next << "\n";
        iface_ = next;
        prime();
    }
}

bool NetMeter::rates(double &rx_bytes_per_s, double &tx_bytes_per_s)
{
    maybe_repick();
    if (iface_.empty())
        return false;

    uint64_t rx1 = 0, tx1 = 0;
    if (!primed_ || !parse_netdev(read_file("/proc/net/dev"), iface_, rx1, tx1))
    {
        prime();
        return false;
    }

    auto t1 = clock_.now();
    double dt = std::chrono::duration<double>(t1 - t0_).count();
    dt = std::max(dt, 1e-3);

    // counters can reset when the interface bounces
    rx_bytes_per_s = rx1 >= rx0_ ? static_cast<double>(rx1 - rx0_) / dt : 0.0;
    tx_bytes_per_s = tx1 >= tx0_ ? static_cast<double>(tx1 - tx0_) / dt : 0.0;

    rx0_ = rx1;
    tx0_ = tx1;
    t0_ = t1;
    return true;
}

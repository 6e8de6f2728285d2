#pragma once
#include "metrics_snapshot.h"
#include "tile_registry.h"

#include <cstddef>
#include <string>

// Panel payload text for each tile. Pure functions of the snapshot.
//   CPU   {CPU:m;Tempr:t;Useage:u;Freq:kHz;Tempr1:t;}
//   GPU   {GPU:n;Tempr:t;Useage:u}
//   MEM   {Memory:l;Used:g;Available:g;Total:g;Useage:u}
//   DISK  {DiskName:l;Tempr:t;UsageSpace:g;AllSpace:g;Usage:u}
//   DATE  {Date:Y/M/D;Time:h:m:s;Week:w;Weather:c;TemprLo:l,TemprHi:h,Zone:z,Desc:d}
//   NET   {SPEED:rpm;NETWORK:rx,tx}
//   VOL   {VOLUME:v}
//   BAT   {Battery:b}
class PayloadFormatter {
public:
    static std::string format(TileId tile, const MetricsSnapshot &snap);

    static std::string cpu(const CpuMetrics &m);
    static std::string gpu(const GpuMetrics &m);
    static std::string memory(const MemoryMetrics &m);
    static std::string disk(const DiskMetrics &m);
    static std::string date(const DateMetrics &m);
    static std::string network(const NetworkMetrics &m);
    static std::string volume(const VolumeMetrics &m);
    static std::string battery(const BatteryMetrics &m);
};

// Panel reports "no battery" with this value.
constexpr int kNoBatteryCode = 177;

// Longest free-text field (names, labels, weather zone/description).
constexpr std::size_t kMaxTextField = 64;

// Rounded percentage of `total` that is not `available`; absent without
// a positive total.
MetricValue used_percent(const MetricValue &total, const MetricValue &available);

// Week number 0..6 with Sunday = 0, whatever numbering `weekday` uses.
int week_field(int weekday, WeekdayOrigin origin);

// Exact conversion to kHz; false when the reading is absent.
bool cpu_freq_khz(const CpuFrequency &f, long long &khz);

// "2400.123" MHz -> 2400123 kHz without going through floating point.
bool mhz_text_to_khz(const std::string &text, long long &khz);

// Bytes/s -> "X.X K/s" | "X.X M/s" | "X.X G/s" (1024-based).
std::string format_rate(double bytes_per_s);

// Printable ASCII only, clipped to kMaxTextField.
std::string panel_text(const std::string &text);

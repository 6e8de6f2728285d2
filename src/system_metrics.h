#pragma once
#include "cache_store.h"
#include "clock.h"
#include "fan_speed.h"
#include "metrics_snapshot.h"
#include "net_meter.h"

#include <cstdint>
#include <functional>
#include <map>
#include <string>

struct SystemMetricsOptions {
    FanPreference fan_prefer{FanPreference::Auto};
    std::string   net_iface;        // empty = pick automatically
    long long     label_ttl_s{3600};
};

// Linux collectors behind MetricsProvider: procfs, sysfs (hwmon, cpufreq,
// DRM, power_supply, nvme) and a few external tools (nvidia-smi, rocm-smi,
// lscpu, lspci, pactl, dmidecode, lshw, lsblk). Any source that is missing
// just leaves its field unset.
class SystemMetricsProvider : public MetricsProvider {
public:
    SystemMetricsProvider(Clock &clock,
                          const SystemMetricsOptions &opts,
                          CacheStore *cache);

    MetricsSnapshot collect(TileId tile) override;

    CpuMetrics     cpu();
    GpuMetrics     gpu();
    MemoryMetrics  memory();
    DiskMetrics    disk();
    DateMetrics    date();
    NetworkMetrics network();
    VolumeMetrics  volume();
    BatteryMetrics battery();

    FanRawReadings fan_raw();

private:
    struct CpuSample {
        bool valid{false};
        uint64_t idle{0};
        uint64_t total{0};
    };

    MetricValue cpu_usage();
    std::string cached_label(const std::string &key,
                             const std::function<std::string()> &detect);

    SystemMetricsOptions opts_;
    CacheStore          *cache_;
    NetMeter             net_;
    CpuSample            last_cpu_;
    std::string          cpu_model_;
    std::map<std::string, std::pair<std::string, long long>> labels_;
};

// Parsers kept separate from file access so they can be tested.
std::string parse_cpu_model(const std::string &cpuinfo);
bool parse_proc_stat(const std::string &stat, uint64_t &idle, uint64_t &total);
bool parse_meminfo(const std::string &meminfo, long long &total_kb, long long &available_kb);
std::string clean_gpu_name(const std::string &name);
std::string clean_ram_vendor(const std::string &vendor);
bool parse_volume_percent(const std::string &pactl_out, long long &pct);

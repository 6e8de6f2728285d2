#pragma once
#include "fan_speed.h"
#include "tile_registry.h"

#include <cstdint>
#include <string>

// Numeric reading that may be unavailable.
struct MetricValue {
    bool      present{false};
    long long value{0};

    static MetricValue of(long long v) { return MetricValue{true, v}; }
};

enum class FreqUnit : uint8_t { Hz, KHz, MHz };

struct CpuFrequency {
    bool      present{false};
    long long value{0};
    FreqUnit  unit{FreqUnit::KHz};
};

struct CpuMetrics {
    std::string  model;
    MetricValue  temp_c;
    MetricValue  usage_pct;
    CpuFrequency freq;
};

struct GpuMetrics {
    std::string name;
    MetricValue temp_c;
    MetricValue usage_pct;
};

struct MemoryMetrics {
    std::string vendor;       // empty when unknown
    MetricValue total_kb;
    MetricValue available_kb;
};

struct DiskMetrics {
    std::string label;
    MetricValue temp_c;
    MetricValue total_bytes;
    MetricValue available_bytes;
};

struct WeatherInfo {
    MetricValue code;         // panel icon 1..40
    MetricValue low_c;
    MetricValue high_c;
    std::string zone;
    std::string desc;
};

// Weekday numbering used by whoever filled DateMetrics::weekday.
enum class WeekdayOrigin : uint8_t {
    SundayZero, // struct tm::tm_wday
    MondayZero,
    MondayOne   // ISO 8601, Sunday = 7
};

struct DateMetrics {
    int year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    int second{0};
    int weekday{0};
    WeekdayOrigin weekday_origin{WeekdayOrigin::SundayZero};
    WeatherInfo weather;
};

struct NetworkMetrics {
    bool           rates_present{false};
    double         rx_bytes_per_s{0.0};
    double         tx_bytes_per_s{0.0};
    std::string    iface;
    FanRawReadings fan_raw;
    FanReading     fan;       // resolved by the scheduler before formatting
};

struct VolumeMetrics {
    MetricValue percent;
};

struct BatteryMetrics {
    bool        battery_present{false};
    MetricValue percent;
};

// Per-tile value bag; only the member matching `tile` is filled.
struct MetricsSnapshot {
    TileId         tile{TileId::Cpu};
    CpuMetrics     cpu;
    GpuMetrics     gpu;
    MemoryMetrics  memory;
    DiskMetrics    disk;
    DateMetrics    date;
    NetworkMetrics network;
    VolumeMetrics  volume;
    BatteryMetrics battery;
};

class MetricsProvider {
public:
    virtual ~MetricsProvider() = default;
    virtual MetricsSnapshot collect(TileId tile) = 0;
};

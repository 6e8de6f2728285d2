#pragma once
#include "clock.h"
#include "tile_scheduler.h"

#include <chrono>
#include <ostream>
#include <string>

enum class Severity : uint8_t { Good, Warn, Bad, Unknown };

// Thresholds used for coloring: temperatures 60/80 C, utilization 40/80 %,
// memory and disk usage 70/90 %.
Severity temp_severity(const MetricValue &c);
Severity util_severity(const MetricValue &pct);
Severity usage_severity(const MetricValue &pct);

// Console view of the latest snapshot of every tile. Redraws the whole
// screen (ANSI clear + home) at most once per `min_interval`.
class Dashboard : public FrameObserver {
public:
    Dashboard(std::ostream &out,
              Clock &clock,
              bool color,
              std::chrono::milliseconds min_interval = std::chrono::milliseconds(1000));

    void on_frame_sent(const TileDefinition &tile,
                       const std::string &payload,
                       const MetricsSnapshot &snap,
                       const SchedulerState &state) override;
    void on_cycle_complete(const SchedulerState &state) override;

    void render(const SchedulerState &state);

private:
    std::string paint(const std::string &text, Severity s) const;
    std::string value(const MetricValue &v, const char *unit) const;

    std::ostream &out_;
    Clock        &clock_;
    bool          color_;
    std::chrono::milliseconds min_interval_;
    Clock::time_point last_render_{};
    bool rendered_{false};

    CpuMetrics     cpu_;
    GpuMetrics     gpu_;
    MemoryMetrics  mem_;
    DiskMetrics    disk_;
    DateMetrics    date_;
    NetworkMetrics net_;
    VolumeMetrics  vol_;
    BatteryMetrics bat_;
};

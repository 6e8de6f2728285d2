#pragma once
#include "clock.h"
#include "fan_speed.h"
#include "metrics_snapshot.h"
#include "panel_link.h"
#include "tile_registry.h"
#include "unlock_handshake.h"
#include "weather_service.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct SchedulerConfig {
    std::chrono::milliseconds send_interval{50};    // gap between two tiles
    std::chrono::milliseconds refresh_period{1000}; // start-to-start of a full cycle
    std::chrono::milliseconds poll_read{20};        // read slice while draining polls
    std::chrono::seconds      weather_refresh{600};
    std::chrono::seconds      weather_max_age{1800}; // older reports are blanked
    FanPreference fan_prefer{FanPreference::Auto};
    int fan_max_rpm{5000};
};

// Everything the loop carries from one tile to the next.
struct SchedulerState {
    HandshakeState    mode{HandshakeState::Degraded};
    std::size_t       next_index{0};
    Clock::time_point cycle_started{};
    uint64_t          cycles{0};
    uint64_t          skipped{0};     // payloads rejected by the codec

    bool              seq_observed{false};
    uint8_t           last_seq{0};    // last poll sequence byte from the panel

    bool              weather_present{false};
    bool              weather_requested{false};
    WeatherInfo       weather;
    Clock::time_point weather_fetched_at{};  // last good report
    Clock::time_point weather_checked_at{};  // last completed attempt
};

// Told about every frame that reached the panel.
class FrameObserver {
public:
    virtual ~FrameObserver() = default;
    virtual void on_frame_sent(const TileDefinition &tile,
                               const std::string &payload,
                               const MetricsSnapshot &snap,
                               const SchedulerState &state) = 0;
    virtual void on_cycle_complete(const SchedulerState &) {}
};

// Steady-state loop: one tile per step, in registry order, each sent with
// the tile's own sequence character. Polls arriving in between are
// decoded and dropped.
class TileScheduler {
public:
    TileScheduler(PanelLink &link,
                  Clock &clock,
                  MetricsProvider &provider,
                  const SchedulerConfig &cfg,
                  WeatherFeed *weather = nullptr,
                  const std::atomic<bool> *cancel = nullptr);

    void add_observer(FrameObserver *obs);

    // Sends one tile and waits out its pacing. Throws TransportError.
    SchedulerState step(SchedulerState state);

    // Steps until cancelled.
    SchedulerState run(SchedulerState state);

    // Snapshot for `tile` with fan and weather policy applied.
    MetricsSnapshot snapshot_for(TileId tile, SchedulerState &state);

private:
    void apply_weather(SchedulerState &state, DateMetrics &date);
    void drain_until(SchedulerState &state, Clock::time_point until);
    bool cancelled() const;

    PanelLink       &link_;
    Clock           &clock_;
    MetricsProvider &provider_;
    SchedulerConfig  cfg_;
    WeatherFeed     *weather_;
    const std::atomic<bool> *cancel_;
    std::vector<FrameObserver *> observers_;
};

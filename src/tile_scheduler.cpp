#include "tile_scheduler.h"
#include "payload_formatter.h"

#include <algorithm>
#include <iostream>

TileScheduler::TileScheduler(PanelLink &link,
                             Clock &clock,
                             MetricsProvider &provider,
                             const SchedulerConfig &cfg,
                             WeatherFeed *weather,
                             const std::atomic<bool> *cancel)
    : link_(link),
      clock_(clock),
      provider_(provider),
      cfg_(cfg),
      weather_(weather),
      cancel_(cancel)
{
    if (cfg_.poll_read.count() < 1)
        cfg_.poll_read = std::chrono::milliseconds(1);
}

void TileScheduler::add_observer(FrameObserver *obs)
{
    if (obs)
        observers_.push_back(obs);
}

bool TileScheduler::cancelled() const
{
    return cancel_ && cancel_->load(std::memory_order_relaxed);
}

void TileScheduler::apply_weather(SchedulerState &state, DateMetrics &date)
{
    auto now = clock_.now();

    if (weather_)
    {
        WeatherResult r;
        if (weather_->poll_result(r))
        {
            state.weather_requested = false;
            state.weather_checked_at = r.fetched_at;
            if (r.ok)
            {
                state.weather = r.info;
                state.weather_present = true;
                state.weather_fetched_at = r.fetched_at;
            }
        }

        bool due = !state.weather_requested &&
                   (state.weather_checked_at == Clock::time_point{} ||
                    now - state.weather_checked_at >= cfg_.weather_refresh);
        if (due)
            state.weather_requested = weather_->request_refresh();
    }

    if (state.weather_present && now - state.weather_fetched_at > cfg_.weather_max_age)
    {
        std::cerr << "[Scheduler] Weather report expired, blanking\n";
        state.weather_present = false;
        state.weather = WeatherInfo{};
    }

    date.weather = state.weather_present ? state.weather : WeatherInfo{};
}

MetricsSnapshot TileScheduler::snapshot_for(TileId tile, SchedulerState &state)
{
    MetricsSnapshot snap = provider_.collect(tile);
    snap.tile = tile;

    if (tile == TileId::Network)
    {
        snap.network.fan = resolve_fan_speed(cfg_.fan_prefer, snap.network.fan_raw,
                                             cfg_.fan_max_rpm);
    }
    else if (tile == TileId::Date)
    {
        apply_weather(state, snap.date);
    }
    return snap;
}

void TileScheduler::drain_until(SchedulerState &state, Clock::time_point until)
{
    while (!cancelled())
    {
        auto now = clock_.now();
        if (now >= until)
            return;

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(until - now);
        uint8_t seq = 0;
        if (link_.read_poll(std::min(remaining, cfg_.poll_read), seq))
        {
            state.seq_observed = true;
            state.last_seq = seq;
        }
    }
}

SchedulerState TileScheduler::step(SchedulerState state)
{
    const auto &tiles = TileRegistry::all();
    state.next_index %= tiles.size();
    if (state.next_index == 0)
    {
        state.cycle_started = clock_.now();
    }

    const TileDefinition &def = tiles[state.next_index];
    MetricsSnapshot snap = snapshot_for(def.id, state);
    std::string payload = PayloadFormatter::format(def.id, snap);

    bool sent = false;
    try
    {
        link_.send(def.id, static_cast<uint8_t>(def.seq), payload);
        sent = true;
    }
    catch (const InvalidPayload &ex)
    {
        state.skipped++;
        std::cerr << "[Scheduler] Skipping " << def.name << " tile: " << ex.what() << "\n";
    }

    if (sent)
    {
        for (auto *obs : observers_)
            obs->on_frame_sent(def, payload, snap, state);
    }

    drain_until(state, clock_.now() + cfg_.send_interval);

    state.next_index = (state.next_index + 1) % tiles.size();
    if (state.next_index == 0)
    {
        state.cycles++;
        drain_until(state, state.cycle_started + cfg_.refresh_period);
        for (auto *obs : observers_)
            obs->on_cycle_complete(state);
    }
    return state;
}

SchedulerState TileScheduler::run(SchedulerState state)
{
    std::cout << "[Scheduler] Steady state (" << handshake_state_name(state.mode)
              << "), " << TileRegistry::all().size() << " tiles, refresh "
              << cfg_.refresh_period.count() << "ms\n";

    while (!cancelled())
    {
        state = step(std::move(state));
    }

    std::cout << "[Scheduler] Stopped after " << state.cycles << " cycle(s)\n";
    return state;
}

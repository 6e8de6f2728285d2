#include "atomman_agent.h"
#include "dashboard.h"
#include "panel_link.h"
#include "payload_formatter.h"
#include "serial_port.h"
#include "status_publisher.h"
#include "system_metrics.h"
#include "tile_scheduler.h"
#include "unlock_handshake.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>

AtommanAgent::AtommanAgent(const AgentConfig &cfg, const std::atomic<bool> &stop)
    : cfg_(cfg), stop_(stop) {}

void AtommanAgent::open_cache()
{
    if (cfg_.cache_path.empty())
        return;
    cache_ = std::make_unique<CacheStore>(cfg_.cache_path);
    try
    {
        cache_->ensure_schema();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[Agent] Cache disabled: " << ex.what() << "\n";
        cache_.reset();
    }
}

void AtommanAgent::open_redis()
{
    if (cfg_.redis_uri.empty())
        return;
    redis_ = std::make_unique<RedisConnector>(cfg_.redis_uri);
    if (!redis_->connect())
    {
        std::cerr << "[Agent] Failed to connect Redis, will retry later\n";
    }
}

void AtommanAgent::start_weather()
{
    if (cfg_.weather_cmd.empty())
        return;
    weather_ = std::make_unique<WeatherService>(
        std::make_unique<CommandWeatherSource>(cfg_.weather_cmd), clock_, cache_.get(),
        3LL * cfg_.weather_refresh_s);
    if (weather_->restore_cached())
    {
        std::cout << "[Agent] Using cached weather report\n";
    }
}

bool AtommanAgent::wait_start_delay()
{
    auto delay = std::chrono::milliseconds((long long)(cfg_.start_delay_s * 1000.0));
    if (delay.count() <= 0)
        return !stopping();

    std::cout << "[Agent] Waiting " << cfg_.start_delay_s << "s before opening "
              << cfg_.port << "\n";
    auto until = clock_.now() + delay;
    while (!stopping())
    {
        auto now = clock_.now();
        if (now >= until)
            return true;
        auto left = std::chrono::ceil<std::chrono::milliseconds>(until - now);
        clock_.sleep_for(std::min(left, std::chrono::milliseconds(100)));
    }
    return false;
}

void AtommanAgent::run()
{
    open_cache();
    open_redis();
    start_weather();

    if (!wait_start_delay())
    {
        std::cout << "[Agent] Stopped before start\n";
        return;
    }

    SerialPort port(serial_options(cfg_));
    std::cout << "[Agent] Opened " << port.device() << " @" << cfg_.baud
              << " rtscts=" << cfg_.rtscts << " dsrdtr=" << cfg_.dsrdtr << "\n";

    PanelLink link(port, clock_, metrics_);
    SystemMetricsProvider provider(clock_, system_metrics_options(cfg_), cache_.get());
    TileScheduler scheduler(link, clock_, provider, scheduler_config(cfg_),
                            weather_.get(), &stop_);

    SchedulerState state;
    UnlockHandshake handshake(link, clock_, unlock_config(cfg_), metrics_);
    auto payloads = [&](TileId tile)
    {
        return PayloadFormatter::format(tile, scheduler.snapshot_for(tile, state));
    };

    state.mode = handshake.run(payloads, &stop_);
    if (state.mode == HandshakeState::Cancelled)
    {
        std::cout << "[Agent] Stopped during unlock\n";
        return;
    }

    std::unique_ptr<StatusPublisher> publisher;
    if (redis_)
    {
        publisher = std::make_unique<StatusPublisher>(*redis_, metrics_, cfg_.agent_id);
        scheduler.add_observer(publisher.get());
    }
    std::unique_ptr<Dashboard> dashboard;
    if (cfg_.dashboard)
    {
        dashboard = std::make_unique<Dashboard>(std::cout, clock_, !cfg_.no_color);
        scheduler.add_observer(dashboard.get());
    }

    state = scheduler.run(std::move(state));

    std::cout << "[Agent] Done: frames=" << metrics_.frames_sent.load()
              << " polls=" << metrics_.polls_seen.load()
              << " malformed=" << metrics_.malformed.load() << "\n";
}

#pragma once
#include "cache_store.h"
#include "clock.h"
#include "config.h"
#include "metrics.h"
#include "redis_connector.h"
#include "weather_service.h"

#include <atomic>
#include <memory>
#include <string>

class AtommanAgent {
public:
    AtommanAgent(const AgentConfig &cfg, const std::atomic<bool> &stop);

    // Blocking. Returns when `stop` is set; throws std::runtime_error when
    // the port can't be opened and TransportError when it fails later.
    void run();

private:
    void open_cache();
    void open_redis();
    void start_weather();
    bool wait_start_delay();
    bool stopping() const { return stop_.load(std::memory_order_relaxed); }

    AgentConfig cfg_;
    const std::atomic<bool> &stop_;
    SteadyClock  clock_;
    AgentMetrics metrics_;

    std::unique_ptr<CacheStore>     cache_;
    std::unique_ptr<RedisConnector> redis_;
    std::unique_ptr<WeatherService> weather_;
};

#pragma once
#include "background_worker.h"
#include "cache_store.h"
#include "clock.h"
#include "metrics_snapshot.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

struct WeatherResult {
    bool              ok{false};
    WeatherInfo       info;
    Clock::time_point fetched_at{};
};

// What the scheduler sees of the weather collaborator. Neither call blocks.
class WeatherFeed {
public:
    virtual ~WeatherFeed() = default;

    // Starts a fetch. False when none was started (one already running,
    // or the worker refused it).
    virtual bool request_refresh() = 0;

    // Hands over a fetch completed since the last call.
    virtual bool poll_result(WeatherResult &out) = 0;
};

class WeatherSource {
public:
    virtual ~WeatherSource() = default;
    virtual bool fetch(WeatherInfo &out) = 0;
};

// Runs a user command that prints one line: "code;lo;hi;zone;desc"
// (any field may be empty), e.g. a wrapper around a weather API.
class CommandWeatherSource : public WeatherSource {
public:
    explicit CommandWeatherSource(std::string command, double timeout_s = 10.0);
    bool fetch(WeatherInfo &out) override;

private:
    std::string command_;
    double timeout_s_;
};

bool parse_weather_line(const std::string &line, WeatherInfo &out);
std::string format_weather_line(const WeatherInfo &w);

// Fetches on a BackgroundWorker; the last good report is kept in the
// CacheStore (if any) so a restart can reuse it while it is fresh.
class WeatherService : public WeatherFeed {
public:
    WeatherService(std::unique_ptr<WeatherSource> source,
                   Clock &clock,
                   CacheStore *cache,
                   long long cache_ttl_s);

    bool request_refresh() override;
    bool poll_result(WeatherResult &out) override;

    // Publishes a still-fresh cached report as the first result.
    bool restore_cached();

private:
    void fetch_job();

    std::unique_ptr<WeatherSource> source_;
    Clock      &clock_;
    CacheStore *cache_;
    long long   cache_ttl_s_;

    std::mutex        mutex_;
    bool              has_result_{false};
    WeatherResult     result_;
    std::atomic<bool> in_flight_{false};

    BackgroundWorker worker_; // last member: joined before the rest is torn down
};

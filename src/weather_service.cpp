#include "weather_service.h"
#include "sys_util.h"

#include <exception>
#include <iostream>
#include <sstream>
#include <vector>

static const char *kWeatherCacheKey = "weather";

namespace {

std::vector<std::string> split(const std::string &s, char sep)
{
    std::vector<std::string> out;
    std::string cur;
    for (char c : s)
    {
        if (c == sep)
        {
            out.push_back(cur);
            cur.clear();
        }
        else
        {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

MetricValue int_field(const std::string &s)
{
    long long v = 0;
    return parse_int(s, v) ? MetricValue::of(v) : MetricValue{};
}

} // namespace

bool parse_weather_line(const std::string &line, WeatherInfo &out)
{
    std::string text = trim(line.substr(0, line.find('\n')));
    if (text.empty())
        return false;

    std::vector<std::string> f = split(text, ';');
    WeatherInfo w;
    w.code   = int_field(f[0]);
    if (f.size() > 1) w.low_c  = int_field(f[1]);
    if (f.size() > 2) w.high_c = int_field(f[2]);
    if (f.size() > 3) w.zone   = trim(f[3]);
    // description may itself contain ';'
    if (f.size() > 4)
    {
        std::size_t pos = 0;
        for (int i = 0; i < 4; ++i)
            pos = text.find(';', pos) + 1;
        w.desc = trim(text.substr(pos));
    }

    if (w.code.present && (w.code.value < 1 || w.code.value > 40))
        w.code = MetricValue{};

    out = w;
    return true;
}

std::string format_weather_line(const WeatherInfo &w)
{
    std::ostringstream os;
    if (w.code.present)   os << w.code.value;
    os << ';';
    if (w.low_c.present)  os << w.low_c.value;
    os << ';';
    if (w.high_c.present) os << w.high_c.value;
    os << ';' << w.zone << ';' << w.desc;
    return os.str();
}

CommandWeatherSource::CommandWeatherSource(std::string command, double timeout_s)
    : command_(std::move(command)), timeout_s_(timeout_s) {}

bool CommandWeatherSource::fetch(WeatherInfo &out)
{
    std::string text = run_command(command_, timeout_s_);
    if (text.empty())
    {
        std::cerr << "[Weather] Command produced no output: " << command_ << "\n";
        return false;
    }
    if (!parse_weather_line(text, out))
    {
        std::cerr << "[Weather] Unparsable report: " << trim(text) << "\n";
        return false;
    }
    return true;
}

WeatherService::WeatherService(std::unique_ptr<WeatherSource> source,
                               Clock &clock,
                               CacheStore *cache,
                               long long cache_ttl_s)
    : source_(std::move(source)),
      clock_(clock),
      cache_(cache),
      cache_ttl_s_(cache_ttl_s),
      worker_("Weather", 1) {}

bool WeatherService::request_refresh()
{
    if (!source_)
        return false;
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true))
        return false;
    if (!worker_.submit([this]() { fetch_job(); }))
    {
        in_flight_.store(false);
        return false;
    }
    return true;
}

namespace {

// Clears the in-flight flag however the job ends.
class InFlightReset {
public:
    explicit InFlightReset(std::atomic<bool> &flag) : flag_(flag) {}
    ~InFlightReset() { flag_.store(false); }

private:
    std::atomic<bool> &flag_;
};

} // namespace

void WeatherService::fetch_job()
{
    InFlightReset reset(in_flight_);

    WeatherResult r;
    try
    {
        r.ok = source_->fetch(r.info);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[Weather] Fetch failed: " << ex.what() << "\n";
        r.ok = false;
        r.info = WeatherInfo{};
    }
    r.fetched_at = clock_.now();

    if (r.ok)
    {
        std::cout << "[Weather] Updated: code=" << (r.info.code.present ? std::to_string(r.info.code.value) : "-")
                  << " zone=" << r.info.zone << "\n";
        if (cache_ && !cache_->put(kWeatherCacheKey, format_weather_line(r.info), wall_clock_seconds()))
            std::cerr << "[Weather] Report not cached\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    result_ = r;
    has_result_ = true;
}

bool WeatherService::poll_result(WeatherResult &out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_result_)
        return false;
    out = result_;
    has_result_ = false;
    return true;
}

bool WeatherService::restore_cached()
{
    if (!cache_)
        return false;

    std::string line;
    long long updated_at = 0;
    long long now_s = wall_clock_seconds();
    if (!cache_->get(kWeatherCacheKey, line, updated_at) ||
        !cache_fresh(updated_at, cache_ttl_s_, now_s))
        return false;

    WeatherResult r;
    if (!parse_weather_line(line, r.info))
        return false;
    r.ok = true;
    r.fetched_at = clock_.now() - std::chrono::seconds(now_s - updated_at);

    std::lock_guard<std::mutex> lock(mutex_);
    result_ = r;
    has_result_ = true;
    std::cout << "[Weather] Restored cached report (" << (now_s - updated_at) << "s old)\n";
    return true;
}

#include "fakes.h"
#include "tile_scheduler.h"

#include <gtest/gtest.h>

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

class StubProvider : public MetricsProvider {
public:
    MetricsSnapshot collect(TileId tile) override {
        ++calls;
        MetricsSnapshot s;
        s.tile = tile;
        s.cpu.model = "Test CPU";
        s.cpu.temp_c = MetricValue::of(50);
        s.volume.percent = MetricValue::of(30);
        s.network.fan_raw.hwmon_present = true;
        s.network.fan_raw.hwmon_rpm = 0;
        s.network.fan_raw.nvidia_present = true;
        s.network.fan_raw.nvidia_percent = 40.0;
        return s;
    }
    int calls{0};
};

class StubWeather : public WeatherFeed {
public:
    bool request_refresh() override { ++requests; return accept; }
    bool poll_result(WeatherResult &out) override {
        if (!ready)
            return false;
        ready = false;
        out = result;
        return true;
    }
    int  requests{0};
    bool accept{true};
    bool ready{false};
    WeatherResult result;
};

class CountingObserver : public FrameObserver {
public:
    void on_frame_sent(const TileDefinition &tile, const std::string &payload,
                       const MetricsSnapshot &, const SchedulerState &) override {
        tiles.push_back(tile.id);
        payloads.push_back(payload);
    }
    void on_cycle_complete(const SchedulerState &) override { ++cycles; }

    std::vector<TileId> tiles;
    std::vector<std::string> payloads;
    int cycles{0};
};

} // namespace

class TileSchedulerTest : public ::testing::Test {
protected:
    SchedulerConfig config() {
        SchedulerConfig c;
        c.send_interval = milliseconds(50);
        c.refresh_period = milliseconds(1000);
        c.poll_read = milliseconds(20);
        c.fan_prefer = FanPreference::Auto;
        c.fan_max_rpm = 5000;
        return c;
    }

    SchedulerState run_cycle(TileScheduler &s, SchedulerState st) {
        for (std::size_t i = 0; i < TileRegistry::all().size(); ++i)
            st = s.step(std::move(st));
        return st;
    }

    FakeClock clock;
    FakeTransport transport{clock};
    AgentMetrics metrics;
    PanelLink link{transport, clock, metrics};
    StubProvider provider;
};

TEST_F(TileSchedulerTest, OneCycleSendsEveryTileInOrderWithPacing) {
    TileScheduler sched(link, clock, provider, config());
    auto t0 = clock.now();

    SchedulerState st = run_cycle(sched, SchedulerState{});

    const auto &tiles = TileRegistry::all();
    ASSERT_EQ(transport.writes.size(), tiles.size());
    for (std::size_t i = 0; i < tiles.size(); ++i) {
        const auto &w = transport.writes[i];
        EXPECT_EQ(w.bytes[1], tile_byte(tiles[i].id)) << i;
        EXPECT_EQ(w.bytes[3], static_cast<uint8_t>(tiles[i].seq)) << i;
        EXPECT_EQ(w.at, t0 + milliseconds(50) * static_cast<int>(i)) << i;
    }
    EXPECT_EQ(st.cycles, 1u);
    EXPECT_EQ(st.next_index, 0u);
    EXPECT_EQ(clock.now(), t0 + milliseconds(1000));
}

TEST_F(TileSchedulerTest, SecondCycleStartsAfterRefreshPeriod) {
    TileScheduler sched(link, clock, provider, config());
    auto t0 = clock.now();
    SchedulerState st = run_cycle(sched, SchedulerState{});
    st = sched.step(std::move(st));

    ASSERT_EQ(transport.writes.size(), 9u);
    EXPECT_EQ(transport.writes[8].at, t0 + milliseconds(1000));
    EXPECT_EQ(transport.writes[8].bytes[1], tile_byte(TileId::Cpu));
}

TEST_F(TileSchedulerTest, FanFallbackAppliedToNetworkTile) {
    TileScheduler sched(link, clock, provider, config());
    run_cycle(sched, SchedulerState{});

    std::string net = payload_of(transport.writes[5].bytes);
    EXPECT_EQ(net.rfind("{SPEED:2000;NETWORK:", 0), 0u) << net;
}

TEST_F(TileSchedulerTest, PollsDuringSteadyStateAreDrainedAndRecorded) {
    auto t0 = clock.now();
    transport.push_at(t0 + milliseconds(10), poll_frame(0x53));
    transport.push_at(t0 + milliseconds(60), {0x01, 0x02});

    TileScheduler sched(link, clock, provider, config());
    SchedulerState st = sched.step(SchedulerState{});
    EXPECT_TRUE(st.seq_observed);
    EXPECT_EQ(st.last_seq, 0x53);

    st = sched.step(std::move(st));
    EXPECT_EQ(metrics.malformed.load(), 1u);
    EXPECT_EQ(link.buffered(), 0u);
    // replies keep the tile's own sequence byte
    EXPECT_EQ(transport.writes[1].bytes[3], '3');
}

TEST_F(TileSchedulerTest, WriteFailurePropagates) {
    transport.fail_writes = true;
    TileScheduler sched(link, clock, provider, config());
    EXPECT_THROW(sched.step(SchedulerState{}), TransportError);
}

TEST_F(TileSchedulerTest, ObserversSeeFramesAndCycles) {
    CountingObserver obs;
    TileScheduler sched(link, clock, provider, config());
    sched.add_observer(&obs);
    run_cycle(sched, SchedulerState{});

    ASSERT_EQ(obs.tiles.size(), 8u);
    EXPECT_EQ(obs.tiles.front(), TileId::Cpu);
    EXPECT_EQ(obs.tiles.back(), TileId::Battery);
    EXPECT_EQ(obs.payloads[6], "{VOLUME:30}");
    EXPECT_EQ(obs.cycles, 1);
}

TEST_F(TileSchedulerTest, WeatherResultFlowsIntoDateTile) {
    StubWeather weather;
    weather.ready = true;
    weather.result.ok = true;
    weather.result.info.code = MetricValue::of(7);
    weather.result.info.zone = "Berlin";
    weather.result.fetched_at = clock.now();

    TileScheduler sched(link, clock, provider, config(), &weather);
    SchedulerState st = run_cycle(sched, SchedulerState{});

    std::string date = payload_of(transport.writes[4].bytes);
    EXPECT_NE(date.find(";Weather:7;"), std::string::npos) << date;
    EXPECT_NE(date.find(",Zone:Berlin,"), std::string::npos) << date;
    EXPECT_TRUE(st.weather_present);
    EXPECT_EQ(weather.requests, 0); // fresh result, not due yet
}

TEST_F(TileSchedulerTest, WeatherRefreshRequestedWhenDueWithoutBlocking) {
    StubWeather weather;
    TileScheduler sched(link, clock, provider, config(), &weather);

    SchedulerState st = run_cycle(sched, SchedulerState{});
    EXPECT_EQ(weather.requests, 1);
    EXPECT_TRUE(st.weather_requested);
    EXPECT_NE(payload_of(transport.writes[4].bytes).find(";Weather:;"), std::string::npos);

    // still in flight: no second request
    st = run_cycle(sched, std::move(st));
    EXPECT_EQ(weather.requests, 1);
}

TEST_F(TileSchedulerTest, RefusedWeatherRequestIsRetriedNextCycle) {
    StubWeather weather;
    weather.accept = false;
    TileScheduler sched(link, clock, provider, config(), &weather);

    SchedulerState st = run_cycle(sched, SchedulerState{});
    EXPECT_EQ(weather.requests, 1);
    EXPECT_FALSE(st.weather_requested);

    weather.accept = true;
    st = run_cycle(sched, std::move(st));
    EXPECT_EQ(weather.requests, 2);
    EXPECT_TRUE(st.weather_requested);
}

TEST_F(TileSchedulerTest, StaleWeatherIsBlanked) {
    StubWeather weather;
    weather.ready = true;
    weather.result.ok = true;
    weather.result.info.code = MetricValue::of(3);
    weather.result.fetched_at = clock.now() - seconds(2000);

    TileScheduler sched(link, clock, provider, config(), &weather);
    SchedulerState st = run_cycle(sched, SchedulerState{});
    EXPECT_FALSE(st.weather_present);
    EXPECT_NE(payload_of(transport.writes[4].bytes).find(";Weather:;"), std::string::npos);
}

TEST_F(TileSchedulerTest, CancelStopsRun) {
    std::atomic<bool> cancel{true};
    TileScheduler sched(link, clock, provider, config(), nullptr, &cancel);
    SchedulerState st = sched.run(SchedulerState{});
    EXPECT_TRUE(transport.writes.empty());
    EXPECT_EQ(st.cycles, 0u);
}

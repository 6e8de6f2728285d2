#include "dashboard.h"
#include "fakes.h"

#include <gtest/gtest.h>

#include <sstream>

namespace {

std::size_t count_of(const std::string &hay, const std::string &needle) {
    std::size_t n = 0;
    for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1))
        ++n;
    return n;
}

MetricsSnapshot hot_cpu() {
    MetricsSnapshot s;
    s.tile = TileId::Cpu;
    s.cpu.model = "Test CPU";
    s.cpu.temp_c = MetricValue::of(85);
    s.cpu.usage_pct = MetricValue::of(20);
    return s;
}

} // namespace

TEST(DashboardTest, Thresholds) {
    EXPECT_EQ(temp_severity(MetricValue::of(59)), Severity::Good);
    EXPECT_EQ(temp_severity(MetricValue::of(60)), Severity::Warn);
    EXPECT_EQ(temp_severity(MetricValue::of(80)), Severity::Bad);
    EXPECT_EQ(util_severity(MetricValue::of(39)), Severity::Good);
    EXPECT_EQ(util_severity(MetricValue::of(79)), Severity::Warn);
    EXPECT_EQ(usage_severity(MetricValue::of(69)), Severity::Good);
    EXPECT_EQ(usage_severity(MetricValue::of(90)), Severity::Bad);
    EXPECT_EQ(usage_severity(MetricValue{}), Severity::Unknown);
}

TEST(DashboardTest, PlainRenderShowsLatestValues) {
    FakeClock clock;
    std::ostringstream out;
    Dashboard dash(out, clock, false);

    SchedulerState st;
    st.mode = HandshakeState::Unlocked;
    dash.on_frame_sent(*TileRegistry::find(TileId::Cpu), "{}", hot_cpu(), st);

    std::string text = out.str();
    EXPECT_NE(text.find("AtomMan - unlocked"), std::string::npos);
    EXPECT_NE(text.find("Processor temp : 85 C"), std::string::npos) << text;
    EXPECT_NE(text.find("CPU usage      : 20 %"), std::string::npos) << text;
    EXPECT_EQ(text.find("\033[9"), std::string::npos);
}

TEST(DashboardTest, ColorMarksHotTemperatureRed) {
    FakeClock clock;
    std::ostringstream out;
    Dashboard dash(out, clock, true);
    dash.on_frame_sent(*TileRegistry::find(TileId::Cpu), "{}", hot_cpu(), SchedulerState{});
    EXPECT_NE(out.str().find("\033[91m85 C\033[0m"), std::string::npos);
    EXPECT_NE(out.str().find("\033[92m20 %\033[0m"), std::string::npos);
}

TEST(DashboardTest, RedrawsAreThrottled) {
    FakeClock clock;
    std::ostringstream out;
    Dashboard dash(out, clock, false, std::chrono::milliseconds(1000));
    const TileDefinition &cpu = *TileRegistry::find(TileId::Cpu);

    dash.on_frame_sent(cpu, "{}", hot_cpu(), SchedulerState{});
    clock.advance(std::chrono::milliseconds(300));
    dash.on_frame_sent(cpu, "{}", hot_cpu(), SchedulerState{});
    dash.on_cycle_complete(SchedulerState{});
    EXPECT_EQ(count_of(out.str(), "\033[2J"), 1u);

    clock.advance(std::chrono::milliseconds(800));
    dash.on_cycle_complete(SchedulerState{});
    EXPECT_EQ(count_of(out.str(), "\033[2J"), 2u);
}

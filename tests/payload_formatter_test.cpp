#include "frame_codec.h"
#include "payload_formatter.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(PayloadFormatterTest, CpuLayoutRepeatsTemperature) {
    CpuMetrics m;
    m.model = "Intel(R) Core(TM) i7-12700H";
    m.temp_c = MetricValue::of(55);
    m.usage_pct = MetricValue::of(12);
    m.freq = CpuFrequency{true, 3000000, FreqUnit::KHz};

    EXPECT_EQ(PayloadFormatter::cpu(m),
              "{CPU:Intel(R) Core(TM) i7-12700H;Tempr:55;Useage:12;Freq:3000000;Tempr1:55;}");
}

TEST(PayloadFormatterTest, CpuFrequencyConvertsExactly) {
    long long khz = 0;
    ASSERT_TRUE(cpu_freq_khz(CpuFrequency{true, 2400, FreqUnit::MHz}, khz));
    EXPECT_EQ(khz, 2400000);
    ASSERT_TRUE(cpu_freq_khz(CpuFrequency{true, 3100000000LL, FreqUnit::Hz}, khz));
    EXPECT_EQ(khz, 3100000);
    EXPECT_FALSE(cpu_freq_khz(CpuFrequency{}, khz));

    ASSERT_TRUE(mhz_text_to_khz("2400.123", khz));
    EXPECT_EQ(khz, 2400123);
    ASSERT_TRUE(mhz_text_to_khz("3600.5", khz));
    EXPECT_EQ(khz, 3600500);
    ASSERT_TRUE(mhz_text_to_khz(" 800", khz));
    EXPECT_EQ(khz, 800000);
    EXPECT_FALSE(mhz_text_to_khz("n/a", khz));
}

TEST(PayloadFormatterTest, MissingCpuValuesAreEmpty) {
    CpuMetrics m;
    m.model = "AMD Ryzen 7";
    EXPECT_EQ(PayloadFormatter::cpu(m), "{CPU:AMD Ryzen 7;Tempr:;Useage:;Freq:;Tempr1:;}");
}

TEST(PayloadFormatterTest, GpuLayout) {
    GpuMetrics m;
    m.name = "GeForce RTX 3060";
    m.temp_c = MetricValue::of(48);
    m.usage_pct = MetricValue::of(7);
    EXPECT_EQ(PayloadFormatter::gpu(m), "{GPU:GeForce RTX 3060;Tempr:48;Useage:7}");
}

TEST(PayloadFormatterTest, MemoryInGigabytesWithOneDecimal) {
    MemoryMetrics m;
    m.vendor = "Samsung";
    m.total_kb = MetricValue::of(16LL * 1024 * 1024);
    m.available_kb = MetricValue::of(4LL * 1024 * 1024);
    EXPECT_EQ(PayloadFormatter::memory(m),
              "{Memory:Memory (Samsung);Used:12.0;Available:4.0;Total:16.0;Useage:75}");
}

TEST(PayloadFormatterTest, DiskLayout) {
    DiskMetrics m;
    m.label = "Samsung SSD 980";
    m.temp_c = MetricValue::of(41);
    m.total_bytes = MetricValue::of(512LL * 1024 * 1024 * 1024);
    m.available_bytes = MetricValue::of(128LL * 1024 * 1024 * 1024);
    EXPECT_EQ(PayloadFormatter::disk(m),
              "{DiskName:Samsung SSD 980;Tempr:41;UsageSpace:384.0;AllSpace:512.0;Usage:75}");
}

TEST(PayloadFormatterTest, DateWithWeather) {
    DateMetrics m;
    m.year = 2025; m.month = 3; m.day = 9;
    m.hour = 8; m.minute = 5; m.second = 7;
    m.weekday = 0;
    m.weather.code = MetricValue::of(7);
    m.weather.low_c = MetricValue::of(3);
    m.weather.high_c = MetricValue::of(12);
    m.weather.zone = "Berlin";
    m.weather.desc = "Cloudy";
    EXPECT_EQ(PayloadFormatter::date(m),
              "{Date:2025/03/09;Time:08:05:07;Week:0;Weather:7;"
              "TemprLo:3,TemprHi:12,Zone:Berlin,Desc:Cloudy}");
}

TEST(PayloadFormatterTest, WeatherCodeOutOfRangeIsEmpty) {
    DateMetrics m;
    m.weather.code = MetricValue::of(41);
    std::string p = PayloadFormatter::date(m);
    EXPECT_NE(p.find(";Weather:;"), std::string::npos) << p;

    m.weather.code = MetricValue::of(0);
    p = PayloadFormatter::date(m);
    EXPECT_NE(p.find(";Weather:;"), std::string::npos) << p;
}

TEST(PayloadFormatterTest, WeekMapsEveryOriginToSundayZero) {
    // Sunday .. Saturday in each numbering
    for (int d = 0; d < 7; ++d)
        EXPECT_EQ(week_field(d, WeekdayOrigin::SundayZero), d);

    const int monday_zero[7] = {6, 0, 1, 2, 3, 4, 5};
    const int monday_one[7]  = {7, 1, 2, 3, 4, 5, 6};
    for (int want = 0; want < 7; ++want) {
        EXPECT_EQ(week_field(monday_zero[want], WeekdayOrigin::MondayZero), want);
        EXPECT_EQ(week_field(monday_one[want], WeekdayOrigin::MondayOne), want);
    }
}

TEST(PayloadFormatterTest, NetworkRatesScaleBy1024) {
    EXPECT_EQ(format_rate(512), "0.5 K/s");
    EXPECT_EQ(format_rate(2048), "2.0 K/s");
    EXPECT_EQ(format_rate(1048576), "1.0 M/s");
    EXPECT_EQ(format_rate(1073741824.0), "1.0 G/s");
    EXPECT_EQ(format_rate(0), "0.0 K/s");
}

TEST(PayloadFormatterTest, NetworkLayout) {
    NetworkMetrics m;
    m.rates_present = true;
    m.rx_bytes_per_s = 2048;
    m.tx_bytes_per_s = 1048576;
    m.fan = FanReading{FanReading::Source::Hwmon, 1450};
    EXPECT_EQ(PayloadFormatter::network(m), "{SPEED:1450;NETWORK:2.0 K/s,1.0 M/s}");

    NetworkMetrics unknown;
    EXPECT_EQ(PayloadFormatter::network(unknown), "{SPEED:-1;NETWORK:N/A,N/A}");
}

TEST(PayloadFormatterTest, VolumeAndBattery) {
    VolumeMetrics v;
    EXPECT_EQ(PayloadFormatter::volume(v), "{VOLUME:}");
    v.percent = MetricValue::of(35);
    EXPECT_EQ(PayloadFormatter::volume(v), "{VOLUME:35}");

    BatteryMetrics b;
    EXPECT_EQ(PayloadFormatter::battery(b), "{Battery:177}");
    b.battery_present = true;
    b.percent = MetricValue::of(85);
    EXPECT_EQ(PayloadFormatter::battery(b), "{Battery:85}");
}

TEST(PayloadFormatterTest, FreeTextIsReducedToPrintableAscii) {
    EXPECT_EQ(panel_text("Caf\xC3\xA9 \xE2\x80\x94 z\xC3\xBCrich"), "Caf  zrich");
    EXPECT_EQ(panel_text(std::string(100, 'a')).size(), kMaxTextField);
}

TEST(PayloadFormatterTest, WorstCaseDatePayloadStillEncodes) {
    DateMetrics m;
    m.weather.code = MetricValue::of(40);
    m.weather.low_c = MetricValue::of(-40);
    m.weather.high_c = MetricValue::of(-10);
    m.weather.zone = std::string(200, 'Z') + "\xFF";
    m.weather.desc = std::string(200, 'D');
    std::string p = PayloadFormatter::date(m);
    EXPECT_LE(p.size(), kMaxPayload);
    EXPECT_NO_THROW(FrameCodec::encode(0x6B, '6', p));
}

TEST(PayloadFormatterTest, DispatchesOnTile) {
    MetricsSnapshot s;
    s.volume.percent = MetricValue::of(10);
    EXPECT_EQ(PayloadFormatter::format(TileId::Volume, s), "{VOLUME:10}");
    EXPECT_EQ(PayloadFormatter::format(TileId::Battery, s), "{Battery:177}");
}

TEST(PayloadFormatterTest, UsedPercentRoundsAndClamps) {
    EXPECT_EQ(used_percent(MetricValue::of(200), MetricValue::of(50)).value, 75);
    EXPECT_EQ(used_percent(MetricValue::of(3), MetricValue::of(1)).value, 67);
    EXPECT_EQ(used_percent(MetricValue::of(100), MetricValue::of(120)).value, 0);
    EXPECT_FALSE(used_percent(MetricValue::of(0), MetricValue::of(0)).present);
    EXPECT_FALSE(used_percent(MetricValue::of(100), MetricValue{}).present);
}

namespace {

// Keys of a "{K:v;K:v,K:v}" payload in wire order.
std::vector<std::string> payload_keys(std::string text) {
    if (!text.empty() && text.front() == '{')
        text.erase(0, 1);
    if (!text.empty() && text.back() == '}')
        text.pop_back();

    std::vector<std::string> keys;
    std::string token;
    auto flush = [&]() {
        auto colon = token.find(':');
        if (colon != std::string::npos)
            keys.push_back(token.substr(0, colon));
        token.clear();
    };
    for (char c : text) {
        if (c == ';' || c == ',')
            flush();
        else
            token += c;
    }
    flush();
    return keys;
}

} // namespace

TEST(PayloadFormatterTest, EveryTileEmitsRegistryKeysInOrder) {
    MetricsSnapshot snap;
    snap.cpu.model = "CPU";
    snap.gpu.name = "GPU";
    for (const auto &tile : TileRegistry::all()) {
        snap.tile = tile.id;
        std::string payload = PayloadFormatter::format(tile.id, snap);
        std::vector<std::string> expected(tile.fields.begin(), tile.fields.end());
        EXPECT_EQ(payload_keys(payload), expected) << tile.name << ": " << payload;
    }
}

#include "payload_formatter.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace {

std::string num(const MetricValue &v)
{
    return v.present ? std::to_string(v.value) : std::string();
}

std::string one_decimal(double v)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << v;
    return os.str();
}

std::string gb_from_kb(const MetricValue &kb)
{
    if (!kb.present)
        return std::string();
    return one_decimal(static_cast<double>(kb.value) / 1024.0 / 1024.0);
}

std::string gb_from_bytes(const MetricValue &b)
{
    if (!b.present)
        return std::string();
    return one_decimal(static_cast<double>(b.value) / 1024.0 / 1024.0 / 1024.0);
}

MetricValue used_of(const MetricValue &total, const MetricValue &available)
{
    if (!total.present || !available.present)
        return MetricValue{};
    long long used = total.value - available.value;
    return MetricValue::of(used < 0 ? 0 : used);
}

std::string two_digits(int v)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d", v);
    return buf;
}

} // namespace

MetricValue used_percent(const MetricValue &total, const MetricValue &available)
{
    if (!total.present || !available.present || total.value <= 0)
        return MetricValue{};
    long long used = total.value - available.value;
    if (used < 0)
        used = 0;
    return MetricValue::of(std::llround(100.0 * static_cast<double>(used) /
                                        static_cast<double>(total.value)));
}

int week_field(int weekday, WeekdayOrigin origin)
{
    int shifted = weekday;
    if (origin == WeekdayOrigin::MondayZero)
        shifted = weekday + 1;
    // MondayOne: Sunday = 7 lands on 0, Monday = 1 stays 1
    return ((shifted % 7) + 7) % 7;
}

bool cpu_freq_khz(const CpuFrequency &f, long long &khz)
{
    if (!f.present || f.value < 0)
        return false;
    switch (f.unit)
    {
    case FreqUnit::Hz:  khz = f.value / 1000; break;
    case FreqUnit::KHz: khz = f.value;        break;
    case FreqUnit::MHz: khz = f.value * 1000; break;
    }
    return true;
}

bool mhz_text_to_khz(const std::string &text, long long &khz)
{
    std::size_t i = 0;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t'))
        ++i;

    long long whole = 0;
    bool digits = false;
    for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i)
    {
        whole = whole * 10 + (text[i] - '0');
        digits = true;
    }

    // three fractional digits are kHz; the rest truncate
    long long frac = 0;
    int frac_digits = 0;
    if (i < text.size() && text[i] == '.')
    {
        for (++i; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i)
        {
            digits = true;
            if (frac_digits < 3)
            {
                frac = frac * 10 + (text[i] - '0');
                ++frac_digits;
            }
        }
    }
    if (!digits)
        return false;
    while (frac_digits < 3)
    {
        frac *= 10;
        ++frac_digits;
    }
    khz = whole * 1000 + frac;
    return true;
}

std::string format_rate(double bytes_per_s)
{
    double k = std::max(0.0, bytes_per_s) / 1024.0;
    if (k < 1024.0)
        return one_decimal(k) + " K/s";
    double m = k / 1024.0;
    if (m < 1024.0)
        return one_decimal(m) + " M/s";
    return one_decimal(m / 1024.0) + " G/s";
}

std::string panel_text(const std::string &text)
{
    std::string out;
    out.reserve(std::min(text.size(), kMaxTextField));
    for (char c : text)
    {
        unsigned char b = static_cast<unsigned char>(c);
        if (b < 0x20 || b > 0x7E)
            continue;
        if (out.size() == kMaxTextField)
            break;
        out.push_back(c);
    }
    return out;
}

std::string PayloadFormatter::cpu(const CpuMetrics &m)
{
    long long khz = 0;
    std::string freq = cpu_freq_khz(m.freq, khz) ? std::to_string(khz) : std::string();
    std::string t = num(m.temp_c);
    return "{CPU:" + panel_text(m.model) +
           ";Tempr:" + t +
           ";Useage:" + num(m.usage_pct) +
           ";Freq:" + freq +
           ";Tempr1:" + t + ";}";
}

std::string PayloadFormatter::gpu(const GpuMetrics &m)
{
    return "{GPU:" + panel_text(m.name) +
           ";Tempr:" + num(m.temp_c) +
           ";Useage:" + num(m.usage_pct) + "}";
}

std::string PayloadFormatter::memory(const MemoryMetrics &m)
{
    std::string vendor = panel_text(m.vendor);
    std::string label = vendor.empty() ? "Memory" : "Memory (" + vendor + ")";
    return "{Memory:" + panel_text(label) +
           ";Used:" + gb_from_kb(used_of(m.total_kb, m.available_kb)) +
           ";Available:" + gb_from_kb(m.available_kb) +
           ";Total:" + gb_from_kb(m.total_kb) +
           ";Useage:" + num(used_percent(m.total_kb, m.available_kb)) + "}";
}

std::string PayloadFormatter::disk(const DiskMetrics &m)
{
    std::string label = panel_text(m.label);
    return "{DiskName:" + (label.empty() ? std::string("Disk") : label) +
           ";Tempr:" + num(m.temp_c) +
           ";UsageSpace:" + gb_from_bytes(used_of(m.total_bytes, m.available_bytes)) +
           ";AllSpace:" + gb_from_bytes(m.total_bytes) +
           ";Usage:" + num(used_percent(m.total_bytes, m.available_bytes)) + "}";
}

std::string PayloadFormatter::date(const DateMetrics &m)
{
    const WeatherInfo &w = m.weather;
    std::string code;
    if (w.code.present && w.code.value >= 1 && w.code.value <= 40)
        code = std::to_string(w.code.value);

    std::ostringstream os;
    os << "{Date:" << std::setfill('0') << std::setw(4) << m.year
       << '/' << two_digits(m.month) << '/' << two_digits(m.day)
       << ";Time:" << two_digits(m.hour) << ':' << two_digits(m.minute)
       << ':' << two_digits(m.second)
       << ";Week:" << week_field(m.weekday, m.weekday_origin)
       << ";Weather:" << code
       << ";TemprLo:" << num(w.low_c)
       << ",TemprHi:" << num(w.high_c)
       << ",Zone:" << panel_text(w.zone)
       << ",Desc:" << panel_text(w.desc) << '}';
    return os.str();
}

std::string PayloadFormatter::network(const NetworkMetrics &m)
{
    std::string rx = m.rates_present ? format_rate(m.rx_bytes_per_s) : "N/A";
    std::string tx = m.rates_present ? format_rate(m.tx_bytes_per_s) : "N/A";
    return "{SPEED:" + std::to_string(m.fan.rpm) + ";NETWORK:" + rx + "," + tx + "}";
}

std::string PayloadFormatter::volume(const VolumeMetrics &m)
{
    return "{VOLUME:" + num(m.percent) + "}";
}

std::string PayloadFormatter::battery(const BatteryMetrics &m)
{
    if (!m.battery_present)
        return "{Battery:" + std::to_string(kNoBatteryCode) + "}";
    return "{Battery:" + num(m.percent) + "}";
}

std::string PayloadFormatter::format(TileId tile, const MetricsSnapshot &snap)
{
    switch (tile)
    {
    case TileId::Cpu:     return cpu(snap.cpu);
    case TileId::Gpu:     return gpu(snap.gpu);
    case TileId::Memory:  return memory(snap.memory);
    case TileId::Disk:    return disk(snap.disk);
    case TileId::Date:    return date(snap.date);
    case TileId::Network: return network(snap.network);
    case TileId::Volume:  return volume(snap.volume);
    case TileId::Battery: return battery(snap.battery);
    }
    return std::string();
}

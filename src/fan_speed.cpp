#include "fan_speed.h"
#include <algorithm>
#include <cctype>
#include <cmath>

bool parse_fan_preference(const std::string &text, FanPreference &out)
{
    std::string s;
    for (char c : text)
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (s.empty() || s == "auto") { out = FanPreference::Auto;   return true; }
    if (s == "hwmon")             { out = FanPreference::Hwmon;  return true; }
    if (s == "nvidia")            { out = FanPreference::Nvidia; return true; }
    return false;
}

const char *fan_preference_name(FanPreference p)
{
    switch (p)
    {
    case FanPreference::Hwmon:  return "hwmon";
    case FanPreference::Nvidia: return "nvidia";
    case FanPreference::Auto:   break;
    }
    return "auto";
}

static bool from_hwmon(const FanRawReadings &raw, FanReading &out)
{
    if (!raw.hwmon_present || raw.hwmon_rpm <= 0)
        return false;
    out.source = FanReading::Source::Hwmon;
    out.rpm    = static_cast<int>(raw.hwmon_rpm);
    return true;
}

static bool from_nvidia(const FanRawReadings &raw, int max_rpm, FanReading &out)
{
    if (!raw.nvidia_present)
        return false;
    // 0% is a real reading (fan stopped), not "unknown"
    double pct = std::max(0.0, raw.nvidia_percent);
    out.source = FanReading::Source::NvidiaUtility;
    out.rpm    = static_cast<int>(std::lround(pct / 100.0 * std::max(1, max_rpm)));
    return true;
}

FanReading resolve_fan_speed(FanPreference prefer,
                             const FanRawReadings &raw,
                             int max_rpm)
{
    FanReading r;
    if (prefer == FanPreference::Nvidia)
    {
        if (from_nvidia(raw, max_rpm, r) || from_hwmon(raw, r))
            return r;
    }
    else
    {
        if (from_hwmon(raw, r) || from_nvidia(raw, max_rpm, r))
            return r;
    }
    return FanReading{};
}

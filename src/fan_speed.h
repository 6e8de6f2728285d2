#pragma once
#include <cstdint>
#include <string>

enum class FanPreference : uint8_t {
    Auto   = 0, // hwmon, then GPU utility
    Hwmon  = 1,
    Nvidia = 2  // GPU utility, then hwmon
};

bool parse_fan_preference(const std::string &text, FanPreference &out);
const char *fan_preference_name(FanPreference p);

// Raw readings gathered by the collectors; nothing here is resolved yet.
struct FanRawReadings {
    bool      hwmon_present{false};  // at least one fan*_input was readable
    long long hwmon_rpm{0};          // largest value found
    bool      nvidia_present{false}; // nvidia-smi answered with a number
    double    nvidia_percent{0.0};
};

struct FanReading {
    enum class Source : uint8_t { Hwmon, NvidiaUtility, Unknown };

    Source source{Source::Unknown};
    int    rpm{-1};
};

// hwmon counts only when nonzero; the GPU utility reports duty cycle, scaled
// by max_rpm. Nothing usable gives {Unknown, -1}.
FanReading resolve_fan_speed(FanPreference prefer,
                             const FanRawReadings &raw,
                             int max_rpm);

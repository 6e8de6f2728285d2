#pragma once
#include "serial_port.h"
#include "system_metrics.h"
#include "tile_scheduler.h"
#include "unlock_handshake.h"

#include <functional>
#include <string>

// Agent settings. Sources, later ones win:
//   defaults -> flat JSON file -> ATOMMAN_* environment -> command line
//
// Example config.json:
//
// {
//   "port": "/dev/ttyACM0",
//   "attempts": 3,
//   "window": 5.0,
//   "fan_prefer": "auto",
//   "redis_uri": "redis://127.0.0.1:6379",
//   "dashboard": false
// }
struct AgentConfig {
    std::string port{"/dev/serial/by-id/usb-Synwit_USB_Virtual_COM-if00"};
    int    baud{115200};
    bool   rtscts{false};
    bool   dsrdtr{true};

    double start_delay_s{3.0};
    int    attempts{3};
    double window_s{5.0};
    int    unlock_polls{1};
    int    attempt_settle_ms{300};

    int    send_interval_ms{50};
    int    refresh_ms{1000};
    int    poll_read_ms{20};

    std::string fan_prefer{"auto"};
    int    fan_max_rpm{5000};
    std::string net_iface;

    std::string weather_cmd;
    int    weather_refresh_s{600};

    std::string cache_path{"atomman_cache.db"};
    std::string redis_uri;
    std::string agent_id{"atomman_1"};

    bool   dashboard{false};
    bool   no_color{false};
};

using EnvLookup = std::function<const char *(const char *)>;

// Applies the keys found in a flat JSON object; unknown keys are ignored.
void apply_config_json(const std::string &text, AgentConfig &cfg);

// False (and a log line) when the file can't be read.
bool load_config_file(const std::string &path, AgentConfig &cfg);

// Throws std::runtime_error on a value that doesn't parse.
void apply_env_overrides(AgentConfig &cfg, const EnvLookup &env);

// Command line result: run, print usage, or fail (std::runtime_error).
enum class ArgsResult { Run, Help };

ArgsResult apply_args(int argc, char **argv, AgentConfig &cfg);

// "--config PATH" or the first positional argument; empty when absent.
std::string config_path_from_args(int argc, char **argv);

// Full chain. Throws std::runtime_error on bad input or failed validation.
ArgsResult load_agent_config(int argc, char **argv, const EnvLookup &env, AgentConfig &cfg);

// Throws std::runtime_error describing the first invalid setting.
void validate(const AgentConfig &cfg);

void print_usage(const char *argv0);

SerialOptions        serial_options(const AgentConfig &cfg);
UnlockConfig         unlock_config(const AgentConfig &cfg);
SchedulerConfig      scheduler_config(const AgentConfig &cfg);
SystemMetricsOptions system_metrics_options(const AgentConfig &cfg);

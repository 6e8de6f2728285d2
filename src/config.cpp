#include "config.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

// Unlock window and start delay limits, seconds.
constexpr double kMinWindowS = 0.001;
constexpr double kMaxSeconds = 3600.0;

bool parse_bool_text(const std::string &s, bool &out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

int to_int(const std::string &key, const std::string &text) {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::exception &) {
        throw std::runtime_error("Bad integer for " + key + ": '" + text + "'");
    }
    if (used != text.size() || v < -2147483647LL || v > 2147483647LL) {
        throw std::runtime_error("Bad integer for " + key + ": '" + text + "'");
    }
    return (int)v;
}

double to_double(const std::string &key, const std::string &text) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception &) {
        throw std::runtime_error("Bad number for " + key + ": '" + text + "'");
    }
    if (used != text.size() || !std::isfinite(v)) {
        throw std::runtime_error("Bad number for " + key + ": '" + text + "'");
    }
    return v;
}

bool to_bool(const std::string &key, const std::string &text) {
    bool v = false;
    if (!parse_bool_text(text, v)) {
        throw std::runtime_error("Bad boolean for " + key + ": '" + text + "'");
    }
    return v;
}

} // namespace

void apply_config_json(const std::string &text, AgentConfig &cfg) {
    // position just after "key": with blanks skipped, npos if absent
    auto value_pos = [&](const std::string &key) -> std::size_t {
        auto pos = text.find("\"" + key + "\"");
        if (pos == std::string::npos) return std::string::npos;
        pos = text.find(':', pos);
        if (pos == std::string::npos) return std::string::npos;
        pos++;
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' ||
                                     text[pos] == '\n' || text[pos] == '\r')) pos++;
        return pos;
    };

    auto get_string = [&](const std::string &key, std::string &out) {
        auto pos = value_pos(key);
        if (pos >= text.size() || text[pos] != '"') return;
        pos++;
        std::string val;
        while (pos < text.size() && text[pos] != '"') {
            if (text[pos] == '\\' && pos + 1 < text.size()) pos++;
            val.push_back(text[pos]);
            pos++;
        }
        out = val;
    };

    // bare token up to the next separator: numbers, true/false
    auto get_token = [&](const std::string &key, std::string &out) -> bool {
        auto pos = value_pos(key);
        if (pos >= text.size()) return false;
        std::string tok;
        while (pos < text.size() && text[pos] != ',' && text[pos] != '}' &&
               text[pos] != ' ' && text[pos] != '\t' && text[pos] != '\n' && text[pos] != '\r') {
            tok.push_back(text[pos]);
            pos++;
        }
        out = tok;
        return !tok.empty() && tok[0] != '"';
    };

    auto get_int = [&](const std::string &key, int &out) {
        std::string tok;
        if (get_token(key, tok)) out = to_int(key, tok);
    };
    auto get_double = [&](const std::string &key, double &out) {
        std::string tok;
        if (get_token(key, tok)) out = to_double(key, tok);
    };
    auto get_bool = [&](const std::string &key, bool &out) {
        std::string tok;
        if (get_token(key, tok)) out = to_bool(key, tok);
    };

    get_string("port",        cfg.port);
    get_int("baud",           cfg.baud);
    get_bool("rtscts",        cfg.rtscts);
    get_bool("dsrdtr",        cfg.dsrdtr);
    get_double("start_delay", cfg.start_delay_s);
    get_int("attempts",       cfg.attempts);
    get_double("window",      cfg.window_s);
    get_int("unlock_polls",   cfg.unlock_polls);
    get_int("attempt_settle_ms", cfg.attempt_settle_ms);
    get_int("send_interval_ms",  cfg.send_interval_ms);
    get_int("refresh_ms",     cfg.refresh_ms);
    get_int("poll_read_ms",   cfg.poll_read_ms);
    get_string("fan_prefer",  cfg.fan_prefer);
    get_int("fan_max_rpm",    cfg.fan_max_rpm);
    get_string("net_iface",   cfg.net_iface);
    get_string("weather_cmd", cfg.weather_cmd);
    get_int("weather_refresh_s", cfg.weather_refresh_s);
    get_string("cache_path",  cfg.cache_path);
    get_string("redis_uri",   cfg.redis_uri);
    get_string("agent_id",    cfg.agent_id);
    get_bool("dashboard",     cfg.dashboard);
    get_bool("no_color",      cfg.no_color);
}

bool load_config_file(const std::string &path, AgentConfig &cfg) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[Config] Can't open " << path << ", using defaults.\n";
        return false;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    apply_config_json(buffer.str(), cfg);
    return true;
}

void apply_env_overrides(AgentConfig &cfg, const EnvLookup &env) {
    auto get = [&](const char *name, std::string &out) -> bool {
        const char *v = env ? env(name) : nullptr;
        if (!v || !*v) return false;
        out = v;
        return true;
    };

    std::string v;
    if (get("ATOMMAN_PORT", v))            cfg.port = v;
    if (get("ATOMMAN_BAUD", v))            cfg.baud = to_int("ATOMMAN_BAUD", v);
    if (get("ATOMMAN_RTSCTS", v))          cfg.rtscts = to_bool("ATOMMAN_RTSCTS", v);
    if (get("ATOMMAN_DSRDTR", v))          cfg.dsrdtr = to_bool("ATOMMAN_DSRDTR", v);
    if (get("ATOMMAN_WAIT_START", v))      cfg.start_delay_s = to_double("ATOMMAN_WAIT_START", v);
    if (get("ATOMMAN_ATTEMPTS", v))        cfg.attempts = to_int("ATOMMAN_ATTEMPTS", v);
    if (get("ATOMMAN_UNLOCK_SECONDS", v))  cfg.window_s = to_double("ATOMMAN_UNLOCK_SECONDS", v);
    if (get("ATOMMAN_WRITE_SLEEP_MS", v))  cfg.send_interval_ms = to_int("ATOMMAN_WRITE_SLEEP_MS", v);
    if (get("ATOMMAN_FAN_PREFER", v))      cfg.fan_prefer = v;
    if (get("ATOMMAN_FAN_MAX_RPM", v))     cfg.fan_max_rpm = to_int("ATOMMAN_FAN_MAX_RPM", v);
    if (get("ATOMMAN_NET_IFACE", v))       cfg.net_iface = v;
    if (get("ATOMMAN_WEATHER_CMD", v))     cfg.weather_cmd = v;
    if (get("ATOMMAN_CACHE_DB", v))        cfg.cache_path = v;
    if (get("ATOMMAN_REDIS_URI", v))       cfg.redis_uri = v;
}

std::string config_path_from_args(int argc, char **argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) return argv[i + 1];
        if (a.rfind("--config=", 0) == 0) return a.substr(9);
        if (a.rfind("--", 0) == 0) {
            // skip the value of options that take one
            if (a.find('=') == std::string::npos &&
                a != "--dashboard" && a != "--no-color" && a != "--help") {
                ++i;
            }
            continue;
        }
        return a;
    }
    return std::string();
}

ArgsResult apply_args(int argc, char **argv, AgentConfig &cfg) {
    bool positional_seen = false;
    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        std::string val;
        bool inline_val = false;

        if (flag.rfind("--", 0) != 0) {
            if (positional_seen) {
                throw std::runtime_error("Unexpected argument: " + flag);
            }
            positional_seen = true; // config path, handled earlier
            continue;
        }

        auto eq = flag.find('=');
        if (eq != std::string::npos) {
            val = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
            inline_val = true;
        }

        if (flag == "--help") return ArgsResult::Help;
        if (flag == "--dashboard") { cfg.dashboard = true; continue; }
        if (flag == "--no-color")  { cfg.no_color = true;  continue; }

        if (!inline_val) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + flag);
            }
            val = argv[++i];
        }

        if (flag == "--config")            continue;
        else if (flag == "--port")         cfg.port = val;
        else if (flag == "--baud")         cfg.baud = to_int(flag, val);
        else if (flag == "--start-delay")  cfg.start_delay_s = to_double(flag, val);
        else if (flag == "--attempts")     cfg.attempts = to_int(flag, val);
        else if (flag == "--window")       cfg.window_s = to_double(flag, val);
        else if (flag == "--unlock-polls") cfg.unlock_polls = to_int(flag, val);
        else if (flag == "--refresh-ms")   cfg.refresh_ms = to_int(flag, val);
        else if (flag == "--fan-prefer")   cfg.fan_prefer = val;
        else if (flag == "--fan-max-rpm")  cfg.fan_max_rpm = to_int(flag, val);
        else if (flag == "--cache-db")     cfg.cache_path = val;
        else if (flag == "--redis")        cfg.redis_uri = val;
        else throw std::runtime_error("Unknown option: " + flag);
    }
    return ArgsResult::Run;
}

ArgsResult load_agent_config(int argc, char **argv, const EnvLookup &env, AgentConfig &cfg) {
    std::string path = config_path_from_args(argc, argv);
    if (!path.empty()) {
        load_config_file(path, cfg);
    }
    apply_env_overrides(cfg, env);
    ArgsResult r = apply_args(argc, argv, cfg);
    if (r == ArgsResult::Run) {
        validate(cfg);
    }
    return r;
}

void validate(const AgentConfig &cfg) {
    if (cfg.port.empty())
        throw std::runtime_error("Config: serial port is empty");
    if (!supported_baud(cfg.baud))
        throw std::runtime_error("Config: unsupported baud rate " + std::to_string(cfg.baud));
    if (cfg.attempts < 1)
        throw std::runtime_error("Config: attempts must be at least 1");
    if (!(cfg.window_s >= kMinWindowS && cfg.window_s <= kMaxSeconds))
        throw std::runtime_error("Config: unlock window must be between 0.001 and 3600 seconds");
    if (!(cfg.start_delay_s >= 0.0 && cfg.start_delay_s <= kMaxSeconds))
        throw std::runtime_error("Config: start delay must be between 0 and 3600 seconds");
    if (cfg.unlock_polls < 1)
        throw std::runtime_error("Config: unlock_polls must be at least 1");
    if (cfg.attempt_settle_ms < 0 || cfg.send_interval_ms < 0)
        throw std::runtime_error("Config: negative pacing interval");
    if (cfg.refresh_ms < 1 || cfg.poll_read_ms < 1)
        throw std::runtime_error("Config: refresh_ms and poll_read_ms must be positive");
    FanPreference p;
    if (!parse_fan_preference(cfg.fan_prefer, p))
        throw std::runtime_error("Config: unknown fan preference '" + cfg.fan_prefer +
                                 "' (auto, hwmon, nvidia)");
    if (cfg.fan_max_rpm < 1)
        throw std::runtime_error("Config: fan_max_rpm must be positive");
    if (cfg.weather_refresh_s < 1)
        throw std::runtime_error("Config: weather_refresh_s must be positive");
}

void print_usage(const char *argv0) {
    std::cout << "Usage: " << argv0 << " [config.json] [options]\n"
              << "  --config PATH        flat JSON config file\n"
              << "  --port DEV           serial device\n"
              << "  --baud N             baud rate (115200)\n"
              << "  --start-delay S      wait before opening the port (3.0)\n"
              << "  --attempts N         unlock attempts (3)\n"
              << "  --window S           seconds per unlock attempt (5.0)\n"
              << "  --unlock-polls N     polls to answer before unlocked (1)\n"
              << "  --refresh-ms N       tile cycle period (1000)\n"
              << "  --fan-prefer P       auto | hwmon | nvidia\n"
              << "  --fan-max-rpm N      RPM at 100% GPU fan duty (5000)\n"
              << "  --cache-db PATH      SQLite cache, empty to disable\n"
              << "  --redis URI          mirror tiles to Redis\n"
              << "  --dashboard          live console view\n"
              << "  --no-color           no ANSI colors in the dashboard\n";
}

SerialOptions serial_options(const AgentConfig &cfg) {
    SerialOptions o;
    o.device = cfg.port;
    o.baud = cfg.baud;
    o.rtscts = cfg.rtscts;
    o.dsrdtr = cfg.dsrdtr;
    return o;
}

UnlockConfig unlock_config(const AgentConfig &cfg) {
    UnlockConfig u;
    u.attempts = cfg.attempts;
    u.window = std::chrono::milliseconds((long long)std::llround(cfg.window_s * 1000.0));
    u.polls_required = cfg.unlock_polls;
    u.attempt_settle = std::chrono::milliseconds(cfg.attempt_settle_ms);
    return u;
}

SchedulerConfig scheduler_config(const AgentConfig &cfg) {
    SchedulerConfig s;
    s.send_interval = std::chrono::milliseconds(cfg.send_interval_ms);
    s.refresh_period = std::chrono::milliseconds(cfg.refresh_ms);
    s.poll_read = std::chrono::milliseconds(cfg.poll_read_ms);
    s.weather_refresh = std::chrono::seconds(cfg.weather_refresh_s);
    s.weather_max_age = std::chrono::seconds(3LL * cfg.weather_refresh_s);
    parse_fan_preference(cfg.fan_prefer, s.fan_prefer);
    s.fan_max_rpm = cfg.fan_max_rpm;
    return s;
}

SystemMetricsOptions system_metrics_options(const AgentConfig &cfg) {
    SystemMetricsOptions o;
    parse_fan_preference(cfg.fan_prefer, o.fan_prefer);
    o.net_iface = cfg.net_iface;
    return o;
}

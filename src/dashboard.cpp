#include "dashboard.h"
#include "payload_formatter.h"

#include <cstdio>

namespace {

const char *ANSI_GREEN  = "\033[92m";
const char *ANSI_YELLOW = "\033[93m";
const char *ANSI_RED    = "\033[91m";
const char *ANSI_WHITE  = "\033[97m";
const char *ANSI_CYAN   = "\033[96m";
const char *ANSI_RESET  = "\033[0m";

Severity grade(const MetricValue &v, long long warn_at, long long bad_at) {
    if (!v.present) return Severity::Unknown;
    if (v.value < warn_at) return Severity::Good;
    if (v.value < bad_at) return Severity::Warn;
    return Severity::Bad;
}

std::string gigabytes(const MetricValue &v, double unit) {
    if (!v.present) return "?";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f GB", double(v.value) / unit);
    return buf;
}

MetricValue difference(const MetricValue &a, const MetricValue &b) {
    if (!a.present || !b.present) return MetricValue{};
    return MetricValue::of(a.value - b.value);
}

} // namespace

Severity temp_severity(const MetricValue &c)    { return grade(c, 60, 80); }
Severity util_severity(const MetricValue &pct)  { return grade(pct, 40, 80); }
Severity usage_severity(const MetricValue &pct) { return grade(pct, 70, 90); }

Dashboard::Dashboard(std::ostream &out,
                     Clock &clock,
                     bool color,
                     std::chrono::milliseconds min_interval)
    : out_(out), clock_(clock), color_(color), min_interval_(min_interval) {}

void Dashboard::on_frame_sent(const TileDefinition &tile,
                              const std::string &,
                              const MetricsSnapshot &snap,
                              const SchedulerState &state) {
    switch (tile.id) {
    case TileId::Cpu:     cpu_  = snap.cpu;     break;
    case TileId::Gpu:     gpu_  = snap.gpu;     break;
    case TileId::Memory:  mem_  = snap.memory;  break;
    case TileId::Disk:    disk_ = snap.disk;    break;
    case TileId::Date:    date_ = snap.date;    break;
    case TileId::Network: net_  = snap.network; break;
    case TileId::Volume:  vol_  = snap.volume;  break;
    case TileId::Battery: bat_  = snap.battery; break;
    }

    auto now = clock_.now();
    if (!rendered_ || now - last_render_ >= min_interval_) {
        render(state);
    }
}

void Dashboard::on_cycle_complete(const SchedulerState &state) {
    if (!rendered_ || clock_.now() - last_render_ >= min_interval_) {
        render(state);
    }
}

std::string Dashboard::paint(const std::string &text, Severity s) const {
    if (!color_ || s == Severity::Unknown) return text;
    const char *code = s == Severity::Good ? ANSI_GREEN
                     : s == Severity::Warn ? ANSI_YELLOW
                     : ANSI_RED;
    return std::string(code) + text + ANSI_RESET;
}

std::string Dashboard::value(const MetricValue &v, const char *unit) const {
    if (!v.present) return "?";
    return std::to_string(v.value) + unit;
}

void Dashboard::render(const SchedulerState &state) {
    last_render_ = clock_.now();
    rendered_ = true;

    std::string title = std::string("AtomMan - ") + handshake_state_name(state.mode);
    char when[32];
    std::snprintf(when, sizeof(when), "%04d-%02d-%02d %02d:%02d:%02d",
                  date_.year, date_.month, date_.day,
                  date_.hour, date_.minute, date_.second);

    out_ << "\033[2J\033[H";
    if (color_) {
        out_ << ANSI_WHITE << title << ANSI_RESET
             << "   Time: " << ANSI_CYAN << when << ANSI_RESET << "\n";
    } else {
        out_ << title << "   Time: " << when << "\n";
    }
    out_ << std::string(72, '-') << "\n";

    long long khz = 0;
    std::string freq = cpu_freq_khz(cpu_.freq, khz) ? std::to_string(khz) : "?";
    out_ << "Processor type : " << cpu_.model << "\n"
         << "Processor temp : " << paint(value(cpu_.temp_c, " C"), temp_severity(cpu_.temp_c)) << "\n"
         << "CPU usage      : " << paint(value(cpu_.usage_pct, " %"), util_severity(cpu_.usage_pct)) << "\n"
         << "CPU freq       : " << freq << " kHz\n\n";

    out_ << "GPU model      : " << (gpu_.name.empty() ? "N/A" : gpu_.name) << "\n"
         << "GPU temp       : " << paint(value(gpu_.temp_c, " C"), temp_severity(gpu_.temp_c)) << "\n"
         << "GPU usage      : " << paint(value(gpu_.usage_pct, " %"), util_severity(gpu_.usage_pct)) << "\n\n";

    MetricValue mem_usage = used_percent(mem_.total_kb, mem_.available_kb);
    const double KB_PER_GB = 1024.0 * 1024.0;
    out_ << "RAM (vendor)   : " << mem_.vendor << "\n"
         << "RAM used       : " << gigabytes(difference(mem_.total_kb, mem_.available_kb), KB_PER_GB) << "\n"
         << "RAM avail      : " << gigabytes(mem_.available_kb, KB_PER_GB) << "\n"
         << "RAM total      : " << gigabytes(mem_.total_kb, KB_PER_GB) << "\n"
         << "RAM usage      : " << paint(value(mem_usage, " %"), usage_severity(mem_usage)) << "\n\n";

    MetricValue disk_usage = used_percent(disk_.total_bytes, disk_.available_bytes);
    const double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;
    out_ << "Disk (label)   : " << disk_.label << "\n"
         << "Disk used      : " << gigabytes(difference(disk_.total_bytes, disk_.available_bytes), BYTES_PER_GB) << "\n"
         << "Disk total     : " << gigabytes(disk_.total_bytes, BYTES_PER_GB) << "\n"
         << "Disk usage     : " << paint(value(disk_usage, " %"), usage_severity(disk_usage)) << "\n\n";

    std::string rx = net_.rates_present ? format_rate(net_.rx_bytes_per_s) : "N/A";
    std::string tx = net_.rates_present ? format_rate(net_.tx_bytes_per_s) : "N/A";
    out_ << "Net iface      : " << (net_.iface.empty() ? "N/A" : net_.iface) << "\n"
         << "Net RX,TX      : " << rx << ", " << tx << "\n"
         << "Fan speed      : " << net_.fan.rpm << " r/min\n"
         << "Volume         : " << value(vol_.percent, " %") << "\n"
         << "Battery        : "
         << (bat_.battery_present ? value(bat_.percent, " %") : std::string("none")) << "\n";

    if (date_.weather.code.present) {
        out_ << "Weather        : " << date_.weather.desc << " "
             << value(date_.weather.low_c, "") << ".." << value(date_.weather.high_c, " C")
             << " " << date_.weather.zone << "\n";
    }
    out_ << "Cycles: " << state.cycles << "  skipped: " << state.skipped << "\n";
    out_ << std::string(72, '-') << "\n";
    out_.flush();
}

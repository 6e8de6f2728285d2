#include "system_metrics.h"
#include "payload_formatter.h"
#include "sys_util.h"

#include <sys/statvfs.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <regex>
#include <sstream>
#include <thread>

namespace {

// Temperatures from hwmon are millidegrees on most drivers.
long long hwmon_celsius(long long raw)
{
    return raw > 1000 ? raw / 1000 : raw;
}

bool first_hwmon_temp(const std::vector<std::string> &hwmons, long long &celsius)
{
    for (const auto &hw : hwmons)
    {
        for (int n = 0; n < 8; ++n)
        {
            long long v = 0;
            if (parse_int(read_line(hw + "/temp" + std::to_string(n) + "_input"), v))
            {
                celsius = hwmon_celsius(v);
                return true;
            }
        }
    }
    return false;
}

// hwmon directories whose driver name is one of `names`, in glob order.
std::vector<std::string> hwmons_named(std::initializer_list<const char *> names)
{
    std::vector<std::string> out;
    for (const auto &hw : glob_paths("/sys/class/hwmon/hwmon*"))
    {
        std::string n = read_line(hw + "/name");
        for (const char *want : names)
        {
            if (n == want)
            {
                out.push_back(hw);
                break;
            }
        }
    }
    return out;
}

std::vector<std::string> csv_fields(const std::string &line)
{
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string f;
    while (std::getline(ss, f, ','))
        out.push_back(trim(f));
    return out;
}

std::string first_line(const std::string &text)
{
    return trim(text.substr(0, text.find('\n')));
}

// Value of the first "Key: value" line, key compared case-insensitively.
std::string key_value(const std::string &text, const std::string &key)
{
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        std::string t = trim(line);
        if (t.size() <= key.size() || t[key.size()] != ':')
            continue;
        bool same = std::equal(key.begin(), key.end(), t.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
        if (same)
            return trim(t.substr(key.size() + 1));
    }
    return std::string();
}

} // namespace

std::string parse_cpu_model(const std::string &cpuinfo)
{
    std::istringstream in(cpuinfo);
    std::string line;
    while (std::getline(in, line))
    {
        if (line.compare(0, 10, "model name") == 0)
        {
            auto colon = line.find(':');
            if (colon != std::string::npos)
                return trim(line.substr(colon + 1));
        }
    }
    return std::string();
}

bool parse_proc_stat(const std::string &stat, uint64_t &idle, uint64_t &total)
{
    std::istringstream in(stat);
    std::string label;
    if (!(in >> label) || label != "cpu")
        return false;

    std::vector<uint64_t> v;
    uint64_t x = 0;
    while (v.size() < 10 && in >> x)
        v.push_back(x);
    if (v.size() < 5)
        return false;

    idle = v[3] + v[4]; // idle + iowait
    total = 0;
    for (uint64_t n : v)
        total += n;
    return true;
}

bool parse_meminfo(const std::string &meminfo, long long &total_kb, long long &available_kb)
{
    bool have_total = false, have_avail = false;
    std::istringstream in(meminfo);
    std::string key;
    long long value = 0;
    std::string line;
    while (std::getline(in, line))
    {
        std::istringstream ls(line);
        if (!(ls >> key >> value))
            continue;
        if (key == "MemTotal:")
        {
            total_kb = value;
            have_total = true;
        }
        else if (key == "MemAvailable:")
        {
            available_kb = value;
            have_avail = true;
        }
    }
    return have_total && have_avail;
}

std::string clean_gpu_name(const std::string &name)
{
    static const std::regex vendor_noise(
        R"(\(R\)|\(TM\)|NVIDIA Corporation|Advanced Micro Devices,? Inc\.?|Intel\(R\)\s*)",
        std::regex::icase);
    static const std::regex spaces(R"(\s+)");

    std::string s = std::regex_replace(name, vendor_noise, "");
    s = trim(std::regex_replace(s, spaces, " "));
    return s.empty() ? "GPU" : s;
}

std::string clean_ram_vendor(const std::string &vendor)
{
    std::string v = trim(vendor);
    if (v == "Undefined" || v == "Not Specified" || v == "Unknown" ||
        v == "To Be Filled By O.E.M.")
        return std::string();

    static const std::pair<const char *, const char *> renames[] = {
        {"Micron Technology", "Micron"},
        {"Samsung Electronics", "Samsung"},
        {"HYNIX", "SK hynix"},
        {"Hynix", "SK hynix"},
    };
    for (const auto &r : renames)
    {
        if (v.find(r.first) != std::string::npos)
            return r.second;
    }
    return v;
}

bool parse_volume_percent(const std::string &pactl_out, long long &pct)
{
    static const std::regex re(R"((\d+)%)");
    std::smatch m;
    if (!std::regex_search(pactl_out, m, re))
        return false;
    pct = std::stoll(m[1].str());
    return true;
}

SystemMetricsProvider::SystemMetricsProvider(Clock &clock,
                                             const SystemMetricsOptions &opts,
                                             CacheStore *cache)
    : opts_(opts),
      cache_(cache),
      net_(clock, opts.net_iface)
{
    cpu_model_ = parse_cpu_model(read_file("/proc/cpuinfo"));
    if (cpu_model_.empty())
        cpu_model_ = "Linux CPU";
}

std::string SystemMetricsProvider::cached_label(const std::string &key,
                                                const std::function<std::string()> &detect)
{
    long long now_s = wall_clock_seconds();

    auto it = labels_.find(key);
    if (it != labels_.end() && cache_fresh(it->second.second, opts_.label_ttl_s, now_s))
        return it->second.first;

    std::string value;
    long long updated_at = 0;
    if (cache_ && cache_->get(key, value, updated_at) &&
        cache_fresh(updated_at, opts_.label_ttl_s, now_s))
    {
        labels_[key] = std::make_pair(value, updated_at);
        return value;
    }

    value = detect();
    labels_[key] = std::make_pair(value, now_s);
    if (cache_)
        cache_->put(key, value, now_s);
    return value;
}

MetricValue SystemMetricsProvider::cpu_usage()
{
    CpuSample cur;
    cur.valid = parse_proc_stat(read_file("/proc/stat"), cur.idle, cur.total);
    if (!cur.valid)
        return MetricValue{};

    if (!last_cpu_.valid)
    {
        last_cpu_ = cur;
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        cur.valid = parse_proc_stat(read_file("/proc/stat"), cur.idle, cur.total);
        if (!cur.valid)
            return MetricValue{};
    }

    CpuSample prev = last_cpu_;
    last_cpu_ = cur;
    if (cur.total <= prev.total || cur.idle < prev.idle)
        return MetricValue{};
    uint64_t di = cur.idle - prev.idle;
    uint64_t dt = cur.total - prev.total;

    double busy = 1.0 - static_cast<double>(di) / static_cast<double>(dt);
    long long pct = std::llround(100.0 * busy);
    return MetricValue::of(std::max(0LL, std::min(100LL, pct)));
}

CpuMetrics SystemMetricsProvider::cpu()
{
    CpuMetrics m;
    m.model = cpu_model_;
    m.usage_pct = cpu_usage();

    long long c = 0;
    std::vector<std::string> preferred = hwmons_named({"coretemp", "k10temp", "zenpower", "cpu_thermal"});
    if (first_hwmon_temp(preferred, c) ||
        first_hwmon_temp(glob_paths("/sys/class/hwmon/hwmon*"), c))
        m.temp_c = MetricValue::of(c);

    // sysfs is already kHz; lscpu reports (fractional) MHz
    for (const char *p : {"/sys/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq",
                          "/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_cur_freq"})
    {
        long long khz = 0;
        if (parse_int(read_line(p), khz) && khz >= 0)
        {
            m.freq.present = true;
            m.freq.value = khz;
            m.freq.unit = FreqUnit::KHz;
            return m;
        }
    }

    static const std::regex mhz_re(R"(CPU MHz:\s*([\d.]+))");
    std::string lscpu = run_command("lscpu");
    std::smatch match;
    long long khz = 0;
    if (std::regex_search(lscpu, match, mhz_re) && mhz_text_to_khz(match[1].str(), khz))
    {
        m.freq.present = true;
        m.freq.value = khz;
        m.freq.unit = FreqUnit::KHz;
    }
    return m;
}

GpuMetrics SystemMetricsProvider::gpu()
{
    GpuMetrics m;

    std::string out = run_command(
        "nvidia-smi --query-gpu=name,temperature.gpu,utilization.gpu --format=csv,noheader,nounits");
    std::vector<std::string> f = csv_fields(first_line(out));
    long long t = 0, u = 0;
    if (f.size() == 3 && parse_int(f[1], t) && parse_int(f[2], u))
    {
        m.name = clean_gpu_name(f[0]);
        m.temp_c = MetricValue::of(t);
        m.usage_pct = MetricValue::of(u);
        return m;
    }

    out = run_command("rocm-smi --showtemp --showuse");
    if (!out.empty())
    {
        static const std::regex temp_re(R"((\d+(\.\d+)?)\s*c)", std::regex::icase);
        static const std::regex use_re(R"((\d+)\s*%)");
        static const std::regex name_re(R"(GPU\[\d+\].*?\s(.*?)\s{2,})");
        std::smatch sm;
        if (std::regex_search(out, sm, temp_re))
            m.temp_c = MetricValue::of(static_cast<long long>(std::stod(sm[1].str())));
        if (std::regex_search(out, sm, use_re))
            m.usage_pct = MetricValue::of(std::stoll(sm[1].str()));
        m.name = clean_gpu_name(std::regex_search(out, sm, name_re) ? sm[1].str() : "AMD Radeon");
        return m;
    }

    // integrated GPU: name from DRM or lspci, temperature from its hwmon
    std::string name;
    for (const char *p : {"/sys/class/drm/card0/device/product_name",
                          "/sys/class/drm/card0/device/name"})
    {
        name = read_line(p);
        if (!name.empty())
            break;
    }
    if (name.empty())
    {
        static const std::regex vga_re(R"re(VGA compatible controller \[0300\]\s+"([^"]+)")re");
        std::string pci = run_command("lspci -mmnn");
        std::smatch sm;
        if (std::regex_search(pci, sm, vga_re))
            name = sm[1].str();
    }
    for (const auto &cand : glob_paths("/sys/class/drm/card0/device/hwmon/hwmon*/temp*_input"))
    {
        long long v = 0;
        if (parse_int(read_line(cand), v))
        {
            m.temp_c = MetricValue::of(v / 1000);
            break;
        }
    }
    m.name = clean_gpu_name(name);
    return m;
}

MemoryMetrics SystemMetricsProvider::memory()
{
    MemoryMetrics m;
    long long total = 0, avail = 0;
    if (parse_meminfo(read_file("/proc/meminfo"), total, avail))
    {
        m.total_kb = MetricValue::of(total);
        m.available_kb = MetricValue::of(avail);
    }

    m.vendor = cached_label("ram_vendor", []() {
        std::string out = run_command("dmidecode -t memory");
        if (out.empty())
            out = run_command("sudo -n dmidecode -t memory");
        std::string vendor = clean_ram_vendor(key_value(out, "Manufacturer"));
        if (vendor.empty())
            vendor = clean_ram_vendor(key_value(run_command("lshw -class memory"), "vendor"));
        return vendor;
    });
    return m;
}

DiskMetrics SystemMetricsProvider::disk()
{
    DiskMetrics m;
    struct statvfs st{};
    if (::statvfs("/", &st) == 0)
    {
        m.total_bytes = MetricValue::of(static_cast<long long>(st.f_frsize) *
                                        static_cast<long long>(st.f_blocks));
        m.available_bytes = MetricValue::of(static_cast<long long>(st.f_frsize) *
                                            static_cast<long long>(st.f_bavail));
    }

    long long c = 0;
    if (first_hwmon_temp(hwmons_named({"nvme", "drivetemp"}), c))
        m.temp_c = MetricValue::of(c);

    m.label = cached_label("disk_model", []() {
        for (const auto &n : glob_paths("/sys/class/nvme/nvme*"))
        {
            std::string model = read_line(n + "/model");
            if (!model.empty())
                return model;
        }

        // root device's model from lsblk
        std::string src = trim(run_command("findmnt -nro SOURCE /"));
        std::string root_dev = std::regex_replace(src, std::regex(R"(^/dev/|p?\d+$)"), "");
        std::istringstream in(run_command("lsblk -dno NAME,MODEL,VENDOR"));
        std::string line, pick;
        bool picked = false;
        while (std::getline(in, line))
        {
            std::istringstream ls(line);
            std::string name;
            if (!(ls >> name))
                continue;
            std::string rest;
            std::getline(ls, rest);
            if (!root_dev.empty() && name == root_dev)
            {
                pick = rest;
                picked = true;
                break;
            }
            if (!picked && root_dev.empty())
            {
                pick = rest;
                picked = true;
            }
        }
        return trim(std::regex_replace(pick, std::regex(R"(\s+)"), " "));
    });
    return m;
}

DateMetrics SystemMetricsProvider::date()
{
    DateMetrics m;
    std::time_t now = std::time(nullptr);
    std::tm t{};
    ::localtime_r(&now, &t);
    m.year = t.tm_year + 1900;
    m.month = t.tm_mon + 1;
    m.day = t.tm_mday;
    m.hour = t.tm_hour;
    m.minute = t.tm_min;
    m.second = t.tm_sec;
    m.weekday = t.tm_wday;
    m.weekday_origin = WeekdayOrigin::SundayZero;
    return m;
}

FanRawReadings SystemMetricsProvider::fan_raw()
{
    FanRawReadings raw;
    for (const auto &fan : glob_paths("/sys/class/hwmon/hwmon*/fan*_input"))
    {
        long long v = 0;
        if (parse_int(read_line(fan), v))
        {
            raw.hwmon_present = true;
            raw.hwmon_rpm = std::max(raw.hwmon_rpm, v);
        }
    }

    // nvidia-smi is slow; only ask when it can matter
    if (opts_.fan_prefer == FanPreference::Nvidia || raw.hwmon_rpm <= 0)
    {
        std::string line = first_line(
            run_command("nvidia-smi --query-gpu=fan.speed --format=csv,noheader,nounits"));
        char *end = nullptr;
        double pct = std::strtod(line.c_str(), &end);
        if (!line.empty() && end != line.c_str())
        {
            raw.nvidia_present = true;
            raw.nvidia_percent = pct;
        }
    }
    return raw;
}

NetworkMetrics SystemMetricsProvider::network()
{
    NetworkMetrics m;
    m.rates_present = net_.rates(m.rx_bytes_per_s, m.tx_bytes_per_s);
    m.iface = net_.iface();
    m.fan_raw = fan_raw();
    return m;
}

VolumeMetrics SystemMetricsProvider::volume()
{
    VolumeMetrics m;
    long long pct = 0;
    if (parse_volume_percent(run_command("pactl get-sink-volume @DEFAULT_SINK@"), pct))
        m.percent = MetricValue::of(pct);
    return m;
}

BatteryMetrics SystemMetricsProvider::battery()
{
    BatteryMetrics m;
    for (const auto &bat : glob_paths("/sys/class/power_supply/BAT*"))
    {
        m.battery_present = true;
        long long pct = 0;
        if (parse_int(read_line(bat + "/capacity"), pct))
        {
            m.percent = MetricValue::of(pct);
            break;
        }
    }
    return m;
}

MetricsSnapshot SystemMetricsProvider::collect(TileId tile)
{
    MetricsSnapshot s;
    s.tile = tile;
    switch (tile)
    {
    case TileId::Cpu:     s.cpu = cpu();         break;
    case TileId::Gpu:     s.gpu = gpu();         break;
    case TileId::Memory:  s.memory = memory();   break;
    case TileId::Disk:    s.disk = disk();       break;
    case TileId::Date:    s.date = date();       break;
    case TileId::Network: s.network = network(); break;
    case TileId::Volume:  s.volume = volume();   break;
    case TileId::Battery: s.battery = battery(); break;
    }
    return s;
}

#include "metrics.h"
#include "sys_util.h"
#include <unistd.h>
#include <cstring>
#include <sstream>
#include <string>

uint64_t parse_statm_rss_kb(const std::string &statm, long page_size) {
    std::istringstream in(statm);
    unsigned long long pages_total = 0, pages_resident = 0;
    if (!(in >> pages_total >> pages_resident) || page_size <= 0) return 0;
    return pages_resident * static_cast<uint64_t>(page_size) / 1024ULL;
}

uint64_t parse_stat_cpu_ticks(const std::string &stat) {
    // comm may hold spaces or parens; fields resume after the last ')'
    auto close = stat.rfind(')');
    if (close == std::string::npos) return 0;
    std::istringstream in(stat.substr(close + 1));
    std::string skip;
    // skip state .. cmajflt (fields 3..13); utime and stime follow
    for (int field = 3; field <= 13; ++field) {
        if (!(in >> skip)) return 0;
    }
    unsigned long long utime = 0, stime = 0;
    if (!(in >> utime >> stime)) return 0;
    return utime + stime;
}

void record_write_latency(AgentMetrics &m, uint64_t us) {
    m.last_write_us.store(us, std::memory_order_relaxed);
    uint64_t prev_max = m.max_write_us.load(std::memory_order_relaxed);
    while (us > prev_max &&
           !m.max_write_us.compare_exchange_weak(prev_max, us,
                                                 std::memory_order_relaxed)) {
    }
}

std::vector<uint8_t> build_metrics_blob(const AgentMetrics &m) {
    uint64_t fields[10];
    fields[0] = m.frames_sent.load(std::memory_order_relaxed);
    fields[1] = m.bytes_sent.load(std::memory_order_relaxed);
    fields[2] = m.bytes_recv.load(std::memory_order_relaxed);
    fields[3] = m.polls_seen.load(std::memory_order_relaxed);
    fields[4] = m.malformed.load(std::memory_order_relaxed);
    fields[5] = m.unlock_attempts.load(std::memory_order_relaxed);
    fields[6] = m.last_write_us.load(std::memory_order_relaxed);
    fields[7] = m.max_write_us.load(std::memory_order_relaxed);
    fields[8] = parse_statm_rss_kb(read_file("/proc/self/statm"), sysconf(_SC_PAGESIZE));
    fields[9] = parse_stat_cpu_ticks(read_file("/proc/self/stat"));

    std::vector<uint8_t> out(sizeof(fields));
    std::memcpy(out.data(), fields, sizeof(fields));
    return out;
}

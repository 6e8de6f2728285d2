#pragma once
#include <cstdint>
#include <atomic>
#include <string>
#include <vector>

// Agent counters, serialized as binary 10 * uint64_t

struct AgentMetrics {
    std::atomic<uint64_t> frames_sent{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> bytes_recv{0};
    std::atomic<uint64_t> polls_seen{0};
    std::atomic<uint64_t> malformed{0};
    std::atomic<uint64_t> unlock_attempts{0};
    std::atomic<uint64_t> last_write_us{0};
    std::atomic<uint64_t> max_write_us{0};
};

void record_write_latency(AgentMetrics &m, uint64_t us);

// Resident set in kB from /proc/<pid>/statm text; 0 when unreadable.
uint64_t parse_statm_rss_kb(const std::string &statm, long page_size);

// utime + stime clock ticks from /proc/<pid>/stat text; 0 when unreadable.
uint64_t parse_stat_cpu_ticks(const std::string &stat);

// Returns binary blob:
// [0] frames_sent
// [1] bytes_sent
// [2] bytes_recv
// [3] polls_seen
// [4] malformed
// [5] unlock_attempts
// [6] last_write_us
// [7] max_write_us
// [8] rss_kb
// [9] cpu_ticks
std::vector<uint8_t> build_metrics_blob(const AgentMetrics &m);

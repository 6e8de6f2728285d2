#include "metrics.h"
#include "redis_connector.h"

#include <gtest/gtest.h>

#include <cstring>

TEST(AgentMetricsTest, WriteLatencyKeepsMaximum) {
    AgentMetrics m;
    record_write_latency(m, 120);
    record_write_latency(m, 80);
    EXPECT_EQ(m.last_write_us.load(), 80u);
    EXPECT_EQ(m.max_write_us.load(), 120u);
    record_write_latency(m, 300);
    EXPECT_EQ(m.max_write_us.load(), 300u);
}

TEST(AgentMetricsTest, BlobLayout) {
    AgentMetrics m;
    m.frames_sent = 8;
    m.bytes_sent = 400;
    m.polls_seen = 2;
    m.unlock_attempts = 3;

    auto blob = build_metrics_blob(m);
    ASSERT_EQ(blob.size(), 10 * sizeof(uint64_t));

    uint64_t fields[10];
    std::memcpy(fields, blob.data(), blob.size());
    EXPECT_EQ(fields[0], 8u);
    EXPECT_EQ(fields[1], 400u);
    EXPECT_EQ(fields[3], 2u);
    EXPECT_EQ(fields[5], 3u);
}

TEST(AgentMetricsTest, ParsesProcessStatm) {
    EXPECT_EQ(parse_statm_rss_kb("5210 1536 800 12 0 900 0\n", 4096), 6144u);
    EXPECT_EQ(parse_statm_rss_kb("", 4096), 0u);
    EXPECT_EQ(parse_statm_rss_kb("5210 1536", 0), 0u);
}

TEST(AgentMetricsTest, ParsesProcessStatWithAwkwardName) {
    std::string stat =
        "4242 (atomman (v2) x) S 1 4242 4242 0 -1 4194560 900 0 3 0 "
        "37 12 0 0 20 0 3 0 1234 10000000 1536";
    EXPECT_EQ(parse_stat_cpu_ticks(stat), 49u);
    EXPECT_EQ(parse_stat_cpu_ticks("4242 (short) S 1 2"), 0u);
    EXPECT_EQ(parse_stat_cpu_ticks("garbage"), 0u);
}

TEST(RedisUriTest, HostAndPort) {
    std::string host;
    int port = 0;
    ASSERT_TRUE(parse_redis_uri("redis://10.1.2.3:6380", host, port));
    EXPECT_EQ(host, "10.1.2.3");
    EXPECT_EQ(port, 6380);

    ASSERT_TRUE(parse_redis_uri("localhost", host, port));
    EXPECT_EQ(host, "localhost");
    EXPECT_EQ(port, 6379);

    ASSERT_TRUE(parse_redis_uri("redis://cache.lan/0", host, port));
    EXPECT_EQ(host, "cache.lan");

    EXPECT_FALSE(parse_redis_uri("redis://:6379", host, port));
    EXPECT_FALSE(parse_redis_uri("redis://host:http", host, port));
}

TEST(RedisConnectorTest, UnreachableServerDegradesQuietly) {
    RedisConnector redis("redis://127.0.0.1:1");
    EXPECT_FALSE(redis.connect());
    EXPECT_FALSE(redis.connected());
    redis.hset("atomman:tiles", "cpu", "{CPU:x}"); // no connection, no throw
    EXPECT_FALSE(redis.connected());
}

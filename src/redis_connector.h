#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <hiredis/hiredis.h>

// Redis connector using hiredis (synchronous). A failed command drops the
// connection; later calls reconnect at most once per RECONNECT_INTERVAL so
// a dead server costs nothing on the send path.
class RedisConnector {
public:
    explicit RedisConnector(const std::string &uri);
    ~RedisConnector();

    RedisConnector(const RedisConnector &) = delete;
    RedisConnector &operator=(const RedisConnector &) = delete;

    bool connect();
    bool connected() const { return ctx_ != nullptr; }

    void hset(const std::string &key,
              const std::string &field,
              const std::string &value);

    // HSET with binary field and binary value
    void hset_binary(const std::string &key,
                     const std::vector<uint8_t> &field,
                     const std::vector<uint8_t> &value);

    // XADD with single binary field, stream capped to ~maxlen entries
    void xadd_binary(const std::string &stream,
                     const std::string &field_name,
                     const std::vector<uint8_t> &data,
                     std::size_t maxlen = 1000);

private:
    bool ensure_connected();
    void check_reply(redisReply *reply, const char *what);
    void disconnect();

    std::string uri_;
    redisContext *ctx_{nullptr};
    std::chrono::steady_clock::time_point last_attempt_{};
    static constexpr std::chrono::seconds RECONNECT_INTERVAL{30};
};

// "redis://host:port" -> host, port (6379 when omitted)
bool parse_redis_uri(const std::string &uri, std::string &host, int &port);

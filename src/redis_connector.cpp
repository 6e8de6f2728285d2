#include "redis_connector.h"
#include <iostream>

bool parse_redis_uri(const std::string &uri, std::string &host, int &port) {
    std::string tmp = uri;
    const std::string prefix = "redis://";
    if (tmp.rfind(prefix, 0) == 0) {
        tmp = tmp.substr(prefix.size());
    }
    auto slash = tmp.find('/');
    if (slash != std::string::npos) {
        tmp = tmp.substr(0, slash);
    }
    auto pos = tmp.find(':');
    if (pos == std::string::npos) {
        host = tmp;
        port = 6379;
    } else {
        host = tmp.substr(0, pos);
        try {
            port = std::stoi(tmp.substr(pos + 1));
        } catch (const std::exception &) {
            return false;
        }
    }
    return !host.empty() && port > 0 && port < 65536;
}

RedisConnector::RedisConnector(const std::string &uri)
    : uri_(uri) {}

RedisConnector::~RedisConnector() {
    disconnect();
}

void RedisConnector::disconnect() {
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }
}

bool RedisConnector::connect() {
    last_attempt_ = std::chrono::steady_clock::now();

    std::string host;
    int port = 0;
    if (!parse_redis_uri(uri_, host, port)) {
        std::cerr << "[Redis] Bad URI: " << uri_ << "\n";
        return false;
    }

    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = 200 * 1000;
    ctx_ = redisConnectWithTimeout(host.c_str(), port, tv);
    if (!ctx_ || ctx_->err) {
        if (ctx_) {
            std::cerr << "[Redis] Connection error: " << ctx_->errstr << std::endl;
            disconnect();
        } else {
            std::cerr << "[Redis] Can't allocate redis context\n";
        }
        return false;
    }
    redisSetTimeout(ctx_, tv);
    std::cout << "[Redis] Connected to " << host << ":" << port << std::endl;
    return true;
}

bool RedisConnector::ensure_connected() {
    if (ctx_) return true;
    if (std::chrono::steady_clock::now() - last_attempt_ < RECONNECT_INTERVAL) {
        return false;
    }
    return connect();
}

void RedisConnector::check_reply(redisReply *reply, const char *what) {
    if (!reply) {
        std::cerr << "[Redis] " << what << " failed: "
                  << (ctx_ ? ctx_->errstr : "no context") << ", dropping connection\n";
        disconnect();
        return;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        std::cerr << "[Redis] " << what << " error: " << reply->str << "\n";
    }
    freeReplyObject(reply);
}

void RedisConnector::hset(const std::string &key,
                          const std::string &field,
                          const std::string &value) {
    if (!ensure_connected()) return;
    redisReply *reply = (redisReply*)redisCommand(ctx_, "HSET %s %s %b",
                                                  key.c_str(),
                                                  field.c_str(),
                                                  value.data(), value.size());
    check_reply(reply, "HSET");
}

void RedisConnector::hset_binary(const std::string &key,
                                 const std::vector<uint8_t> &field,
                                 const std::vector<uint8_t> &value) {
    if (!ensure_connected()) return;
    redisReply *reply = (redisReply*)redisCommand(ctx_, "HSET %s %b %b",
                                                  key.c_str(),
                                                  field.data(), field.size(),
                                                  value.data(), value.size());
    check_reply(reply, "HSET");
}

void RedisConnector::xadd_binary(const std::string &stream,
                                 const std::string &field_name,
                                 const std::vector<uint8_t> &data,
                                 std::size_t maxlen) {
    if (!ensure_connected()) return;
    std::string cap = std::to_string(maxlen);
    redisReply *reply = (redisReply*)redisCommand(ctx_, "XADD %s MAXLEN ~ %s * %s %b",
                                                  stream.c_str(),
                                                  cap.c_str(),
                                                  field_name.c_str(),
                                                  data.data(), data.size());
    check_reply(reply, "XADD");
}

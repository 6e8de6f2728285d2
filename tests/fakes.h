#pragma once
#include "clock.h"
#include "transport.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

// Manual clock. Starts one hour past the epoch so "time_point{}" never
// looks like a real reading; sleep_for just advances.
class FakeClock : public Clock {
public:
    FakeClock() : ns_(std::chrono::duration_cast<std::chrono::nanoseconds>(
                          std::chrono::hours(1)).count()) {}

    time_point now() const override {
        return time_point(std::chrono::duration_cast<duration>(
            std::chrono::nanoseconds(ns_.load())));
    }
    void sleep_for(std::chrono::milliseconds d) override { advance(d); }

    void advance(duration d) {
        ns_ += std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
    }
    void set(time_point t) {
        ns_ = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    }

private:
    std::atomic<long long> ns_;
};

// Transport fed from a script of timed byte bursts. A read waits (moves the
// fake clock) until the next burst is due or the timeout runs out.
class FakeTransport : public Transport {
public:
    struct Burst {
        Clock::time_point at;
        std::vector<uint8_t> bytes;
    };
    struct Write {
        Clock::time_point at;
        std::vector<uint8_t> bytes;
    };

    explicit FakeTransport(FakeClock &clock) : clock_(clock) {}

    void push_at(Clock::time_point at, const std::vector<uint8_t> &bytes) {
        Burst b{at, bytes};
        auto pos = std::upper_bound(script_.begin(), script_.end(), b,
                                    [](const Burst &x, const Burst &y) { return x.at < y.at; });
        script_.insert(pos, b);
    }

    std::size_t read_some(uint8_t *buf, std::size_t cap,
                          std::chrono::milliseconds timeout) override {
        auto now = clock_.now();
        if (script_.empty() || script_.front().at > now + timeout) {
            clock_.advance(timeout);
            return 0;
        }
        Burst &b = script_.front();
        if (b.at > now)
            clock_.set(b.at);

        std::size_t n = std::min(cap, b.bytes.size());
        std::copy(b.bytes.begin(), b.bytes.begin() + n, buf);
        b.bytes.erase(b.bytes.begin(), b.bytes.begin() + n);
        if (b.bytes.empty())
            script_.pop_front();
        return n;
    }

    void write_all(const std::vector<uint8_t> &data) override {
        if (fail_writes)
            throw TransportError("write failed: device unplugged");
        writes.push_back(Write{clock_.now(), data});
    }

    void pulse_dtr() override { ++dtr_pulses; }

    std::vector<Write> writes;
    int  dtr_pulses{0};
    bool fail_writes{false};

private:
    FakeClock &clock_;
    std::deque<Burst> script_;
};

inline std::vector<uint8_t> poll_frame(uint8_t seq) {
    return {0xAA, 0x05, seq, 0xCC, 0x33, 0xC3, 0x3C};
}

inline std::string payload_of(const std::vector<uint8_t> &frame) {
    if (frame.size() < 8)
        return std::string();
    return std::string(frame.begin() + 4, frame.end() - 4);
}

#pragma once
#include <chrono>
#include <thread>

// Monotonic time source. Handshake and scheduler deadlines are computed
// from it so tests can drive time without sleeping.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration   = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override {
        return std::chrono::steady_clock::now();
    }
    void sleep_for(std::chrono::milliseconds d) override {
        std::this_thread::sleep_for(d);
    }
};

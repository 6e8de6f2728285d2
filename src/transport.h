#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when the link to the panel is gone (write failure, hangup).
// Not recoverable in-process.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string &what)
        : std::runtime_error(what) {}
};

// Byte link to the panel. One owner, no concurrent readers or writers.
class Transport {
public:
    virtual ~Transport() = default;

    // Waits at most `timeout` for data. Returns bytes read, 0 = no data yet.
    virtual std::size_t read_some(uint8_t *buf, std::size_t cap,
                                  std::chrono::milliseconds timeout) = 0;

    // Writes the whole frame and drains it to the device or throws TransportError.
    virtual void write_all(const std::vector<uint8_t> &data) = 0;

    // Drops DTR briefly to nudge the panel between unlock attempts.
    virtual void pulse_dtr() {}
};

#pragma once
#include "epoll_loop.h"
#include "transport.h"

#include <chrono>
#include <string>

struct SerialOptions {
    std::string device;
    int  baud{115200};
    bool rtscts{false};  // hardware flow control
    bool dsrdtr{true};   // raise DTR on open
    std::chrono::milliseconds write_timeout{1000};
};

bool supported_baud(int baud);

// Exclusive, raw-mode tty. Opened in the constructor (throws
// std::runtime_error), closed in the destructor on every exit path.
class SerialPort : public Transport {
public:
    explicit SerialPort(const SerialOptions &opts);
    ~SerialPort() override;

    SerialPort(const SerialPort &) = delete;
    SerialPort &operator=(const SerialPort &) = delete;

    std::size_t read_some(uint8_t *buf, std::size_t cap,
                          std::chrono::milliseconds timeout) override;
    void write_all(const std::vector<uint8_t> &data) override;
    void pulse_dtr() override;

    const std::string &device() const { return opts_.device; }

private:
    void configure();
    uint32_t wait_ready(uint32_t events, int timeout_ms);
    void drain(std::chrono::steady_clock::time_point deadline);
    void set_dtr(bool on);

    SerialOptions opts_;
    int fd_{-1};
    EpollLoop loop_;
};

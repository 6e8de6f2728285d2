#include "serial_port.h"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

bool baud_to_speed(int baud, speed_t &out)
{
    switch (baud)
    {
    case 9600:    out = B9600;    return true;
    case 19200:   out = B19200;   return true;
    case 38400:   out = B38400;   return true;
    case 57600:   out = B57600;   return true;
    case 115200:  out = B115200;  return true;
    case 230400:  out = B230400;  return true;
    case 460800:  out = B460800;  return true;
    case 921600:  out = B921600;  return true;
    default:      return false;
    }
}

std::string errno_text()
{
    return std::strerror(errno);
}

} // namespace

bool supported_baud(int baud)
{
    speed_t s;
    return baud_to_speed(baud, s);
}

SerialPort::SerialPort(const SerialOptions &opts)
    : opts_(opts)
{
    fd_ = ::open(opts_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0)
    {
        throw std::runtime_error("Failed to open serial port " + opts_.device + ": " + errno_text());
    }

    // one owner per panel
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0)
    {
        std::string why = errno_text();
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Serial port " + opts_.device + " is in use: " + why);
    }

    try
    {
        configure();
    }
    catch (...)
    {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    std::cout << "[Serial] Opened " << opts_.device << " @ " << opts_.baud
              << " (RTSCTS=" << opts_.rtscts << " DSRDTR=" << opts_.dsrdtr << ")\n";
}

SerialPort::~SerialPort()
{
    if (fd_ >= 0)
    {
        loop_.unwatch();
        ::close(fd_);
        std::cout << "[Serial] Closed " << opts_.device << "\n";
    }
}

void SerialPort::configure()
{
    speed_t speed;
    if (!baud_to_speed(opts_.baud, speed))
    {
        throw std::runtime_error("Unsupported baud rate " + std::to_string(opts_.baud));
    }

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0)
    {
        throw std::runtime_error("tcgetattr " + opts_.device + ": " + errno_text());
    }

    ::cfmakeraw(&tio);
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);
    tio.c_cflag |= (CLOCAL | CREAD);
    if (opts_.rtscts)
        tio.c_cflag |= CRTSCTS;
    else
        tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0)
    {
        throw std::runtime_error("tcsetattr " + opts_.device + ": " + errno_text());
    }

    if (opts_.dsrdtr)
        set_dtr(true);

    ::tcflush(fd_, TCIOFLUSH);

    if (!loop_.watch(fd_, EPOLLIN))
    {
        throw std::runtime_error("epoll add " + opts_.device + ": " + errno_text());
    }
}

uint32_t SerialPort::wait_ready(uint32_t events, int timeout_ms)
{
    if (!loop_.watch(fd_, events))
    {
        throw TransportError("epoll modify " + opts_.device + ": " + errno_text());
    }

    int64_t ready = loop_.wait(timeout_ms);
    if (ready < 0)
    {
        throw TransportError("epoll wait " + opts_.device + ": " + errno_text());
    }
    uint32_t got = static_cast<uint32_t>(ready);
    if (got & (EPOLLHUP | EPOLLERR))
    {
        throw TransportError("Serial device " + opts_.device + " hung up");
    }
    return got;
}

std::size_t SerialPort::read_some(uint8_t *buf, std::size_t cap,
                                  std::chrono::milliseconds timeout)
{
    if ((wait_ready(EPOLLIN, static_cast<int>(timeout.count())) & EPOLLIN) == 0)
    {
        return 0;
    }

    ssize_t n = ::read(fd_, buf, cap);
    if (n < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;
        throw TransportError("Read from " + opts_.device + " failed: " + errno_text());
    }
    return static_cast<std::size_t>(n);
}

void SerialPort::write_all(const std::vector<uint8_t> &data)
{
    auto deadline = std::chrono::steady_clock::now() + opts_.write_timeout;
    std::size_t off = 0;

    while (off < data.size())
    {
        ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
        if (n > 0)
        {
            off += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
        {
            throw TransportError("Write to " + opts_.device + " failed: " + errno_text());
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
        {
            throw TransportError("Write to " + opts_.device + " timed out");
        }
        wait_ready(EPOLLOUT, static_cast<int>(left.count()));
    }

    drain(deadline);
}

// Waits for the driver's output queue to empty, bounded by the write deadline.
void SerialPort::drain(std::chrono::steady_clock::time_point deadline)
{
    for (;;)
    {
        int queued = 0;
        if (::ioctl(fd_, TIOCOUTQ, &queued) != 0)
        {
            // Not every tty driver reports its queue.
            if (errno == ENOTTY || errno == EINVAL)
                return;
            throw TransportError("Drain " + opts_.device + " failed: " + errno_text());
        }
        if (queued <= 0)
            return;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
        {
            throw TransportError("Drain " + opts_.device + " timed out with " +
                                 std::to_string(queued) + " bytes queued");
        }
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(5)));
    }
}

void SerialPort::set_dtr(bool on)
{
    int bits = TIOCM_DTR;
    if (::ioctl(fd_, on ? TIOCMBIS : TIOCMBIC, &bits) != 0)
    {
        std::cerr << "[Serial] DTR " << (on ? "set" : "clear") << " failed: " << errno_text() << "\n";
    }
}

void SerialPort::pulse_dtr()
{
    set_dtr(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    set_dtr(true);
}

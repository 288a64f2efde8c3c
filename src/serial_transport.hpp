#pragma once
#include "status.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace btprint
{
// Framing is fixed at 8N1; only the clock and the timeouts vary.
struct SerialSettings
{
    int baudRate = 9600;
    // Goes into VTIME for readers that clear O_NONBLOCK; the transport itself
    // keeps the fd non-blocking and has no read path.
    int readTimeoutMs = 3000;
    int writeTimeoutMs = 3000;
};

class SerialConnection
{
public:
    virtual ~SerialConnection() = default;

    virtual Status open(const std::string &devicePath, const SerialSettings &settings) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    // Accepts all of len bytes or fails; Status::bytes reports what the driver took.
    virtual Status write(const void *data, std::size_t len) = 0;
    // Blocks until the driver has transmitted everything written so far.
    virtual Status flush() = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<SerialConnection>()>;

// POSIX termios transport (USB serial or Bluetooth RFCOMM).
// Open with a device path like /dev/rfcomm0 or /dev/ttyUSB0.
class SerialTransport : public SerialConnection
{
public:
    SerialTransport();
    ~SerialTransport() override;

    SerialTransport(const SerialTransport &) = delete;
    SerialTransport &operator=(const SerialTransport &) = delete;

    Status open(const std::string &devicePath, const SerialSettings &settings) override;
    void close() override;
    bool isOpen() const override;
    Status write(const void *data, std::size_t len) override;
    Status flush() override;

private:
    int fd;
    int writeTimeoutMs;

    Status configurePort(const SerialSettings &settings);
};

ConnectionFactory serialTransportFactory();
} // namespace btprint

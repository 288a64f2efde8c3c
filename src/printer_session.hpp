#pragma once
#include "port_discovery.hpp"
#include "printer_log.hpp"
#include "serial_transport.hpp"
#include "status.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace btprint
{
// Linux counterpart of the RFCOMM port the printer is usually bound to.
constexpr const char *kDefaultPreferredPort = "/dev/rfcomm0";

struct PrinterOptions
{
    std::optional<std::string> port; // explicit port wins over discovery
    int baudRate = 9600;
    bool autoDiscover = true;
    std::string preferredPort = kDefaultPreferredPort;
    int readTimeoutMs = 3000;
    int writeTimeoutMs = 3000;
};

// One serial connection to a Bluetooth thermal printer.
// connect() -> writeText()/writeLine()/feed() -> disconnect().
// Failures come back as Status; nothing here throws for a missing or busy device.
class PrinterSession
{
public:
    explicit PrinterSession(const PrinterOptions &options = PrinterOptions());
    PrinterSession(const PrinterOptions &options, const PortEnumerator &enumerator,
                   ConnectionFactory factory, LogSink log);
    ~PrinterSession();

    PrinterSession(const PrinterSession &) = delete;
    PrinterSession &operator=(const PrinterSession &) = delete;

    Status connect();
    void disconnect();

    Status writeText(const std::string &text);
    Status writeText(const std::vector<std::uint8_t> &bytes);
    Status writeLine(const std::string &text = "");
    Status feed(int blankLines = 3);

    bool isConnected() const { return connected; }
    const std::optional<std::string> &port() const { return portId; }
    const std::optional<std::string> &bluetoothAddress() const { return btAddress; }
    int baudRate() const { return settings.baudRate; }

private:
    std::optional<std::string> portId;
    std::optional<std::string> btAddress;
    SerialSettings settings;
    ConnectionFactory factory;
    LogSink log;
    std::unique_ptr<SerialConnection> connection;
    bool connected;

    void resolvePort(const PrinterOptions &options, const PortEnumerator &enumerator);
    Status writeBytes(const void *data, std::size_t len);
};

// Connects on construction, disconnects on every exit from the scope.
// Check isConnected() (or result()) before printing.
class ScopedConnection
{
public:
    explicit ScopedConnection(PrinterSession &session);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection &) = delete;
    ScopedConnection &operator=(const ScopedConnection &) = delete;

    PrinterSession &session() { return printer; }
    PrinterSession *operator->() { return &printer; }
    const Status &result() const { return connectResult; }
    bool isConnected() const { return printer.isConnected(); }

private:
    PrinterSession &printer;
    Status connectResult;
};
} // namespace btprint

#include "printer_session.hpp"
#include <utility>

namespace btprint
{
PrinterSession::PrinterSession(const PrinterOptions &options)
    : PrinterSession(options, SysfsPortEnumerator(), serialTransportFactory(), consoleSink())
{
}

PrinterSession::PrinterSession(const PrinterOptions &options, const PortEnumerator &enumerator,
                               ConnectionFactory factory, LogSink log)
    : factory(factory ? std::move(factory) : serialTransportFactory()), log(log ? std::move(log) : nullSink()),
      connected(false)
{
    settings.baudRate = options.baudRate;
    settings.readTimeoutMs = options.readTimeoutMs;
    settings.writeTimeoutMs = options.writeTimeoutMs;
    resolvePort(options, enumerator);
}

PrinterSession::~PrinterSession()
{
    disconnect();
}

void PrinterSession::resolvePort(const PrinterOptions &options, const PortEnumerator &enumerator)
{
    if (options.port)
    {
        portId = options.port;
        return;
    }
    if (!options.autoDiscover)
    {
        log(LogLevel::Info, "Auto-discovery disabled. Please specify port manually.");
        return;
    }

    std::vector<DiscoveredPort> printers = discoverPrinters(enumerator);
    if (printers.empty())
    {
        log(LogLevel::Info, "No Bluetooth printers found. Please specify port manually.");
        return;
    }

    const DiscoveredPort *chosen = &printers.front();
    bool preferred = false;
    for (const auto &p : printers)
    {
        if (p.portId == options.preferredPort)
        {
            chosen = &p;
            preferred = true;
            break;
        }
    }

    portId = chosen->portId;
    btAddress = chosen->bluetoothAddress;
    log(LogLevel::Info, "Auto-discovered printer on " + *portId + (preferred ? " (preferred)" : ""));
    if (btAddress)
        log(LogLevel::Info, "Bluetooth address: " + *btAddress);
}

Status PrinterSession::connect()
{
    if (!portId)
    {
        log(LogLevel::Warn, "No printer port specified. Enable auto-discovery or provide port manually.");
        return Status::failure(ErrorKind::NoPort, "no printer port specified");
    }
    if (connected && connection && connection->isOpen())
        return Status::success();

    connection = factory();
    Status st = connection ? connection->open(*portId, settings)
                           : Status::failure(ErrorKind::ConnectionFailed, "no serial connection available");
    if (!st.ok())
    {
        connection.reset();
        connected = false;
        log(LogLevel::Error, "Connection failed: " + st.message);
        switch (st.kind)
        {
        case ErrorKind::PortBusy:
            log(LogLevel::Info, "The port is in use by another process.");
            break;
        case ErrorKind::PortNotFound:
            log(LogLevel::Info, "The device node does not exist. Bind it first, e.g. `rfcomm bind 0 <address>`.");
            break;
        case ErrorKind::AccessDenied:
            log(LogLevel::Info, "Permission denied. Add your user to the dialout group.");
            break;
        default:
            break;
        }
        log(LogLevel::Info, "Make sure the printer is:");
        log(LogLevel::Info, "  - Powered on");
        log(LogLevel::Info, "  - Bluetooth paired and connected");
        log(LogLevel::Info, "  - Not being used by another application");
        return st;
    }

    connected = true;
    log(LogLevel::Success, "Connected to printer on " + *portId + " @" + std::to_string(settings.baudRate));
    return st;
}

void PrinterSession::disconnect()
{
    if (connection && connection->isOpen())
    {
        connection->close();
        log(LogLevel::Info, "Disconnected from printer");
    }
    connection.reset();
    connected = false;
}

Status PrinterSession::writeBytes(const void *data, std::size_t len)
{
    if (!connected || !connection)
    {
        log(LogLevel::Warn, "Not connected to printer");
        return Status::failure(ErrorKind::NotConnected, "not connected to printer");
    }

    Status st = connection->write(data, len);
    if (st.ok())
    {
        std::size_t sent = st.bytes;
        st = connection->flush();
        st.bytes = sent;
    }
    if (!st.ok())
    {
        log(LogLevel::Error, "Print failed: " + st.message);
        return st;
    }
    log(LogLevel::Info, "Sent " + std::to_string(st.bytes) + " bytes to printer");
    return st;
}

Status PrinterSession::writeText(const std::string &text)
{
    return writeBytes(text.data(), text.size());
}

Status PrinterSession::writeText(const std::vector<std::uint8_t> &bytes)
{
    return writeBytes(bytes.data(), bytes.size());
}

Status PrinterSession::writeLine(const std::string &text)
{
    return writeText(text + "\n");
}

Status PrinterSession::feed(int blankLines)
{
    return writeText(std::string(blankLines > 0 ? static_cast<std::size_t>(blankLines) : 0, '\n'));
}

ScopedConnection::ScopedConnection(PrinterSession &session)
    : printer(session), connectResult(session.connect())
{
}

ScopedConnection::~ScopedConnection()
{
    printer.disconnect();
}
} // namespace btprint

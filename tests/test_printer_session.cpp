#include "printer_session.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace btprint;

namespace
{
class FakeEnumerator : public PortEnumerator
{
public:
    explicit FakeEnumerator(std::vector<PortInfo> ports = {}) : ports(std::move(ports)) {}

    std::vector<PortInfo> listPorts() const override
    {
        ++calls;
        return ports;
    }

    std::vector<PortInfo> ports;
    mutable int calls = 0;
};

// State shared between the test and every connection the factory hands out.
struct FakeDevice
{
    int created = 0;
    int closes = 0;
    int flushes = 0;
    std::string openedPath;
    SerialSettings openedWith;
    std::string written;
    ErrorKind openError = ErrorKind::None;
    ErrorKind writeError = ErrorKind::None;
    ErrorKind flushError = ErrorKind::None;
};

class FakeConnection : public SerialConnection
{
public:
    explicit FakeConnection(std::shared_ptr<FakeDevice> dev) : dev(std::move(dev)) {}

    Status open(const std::string &devicePath, const SerialSettings &settings) override
    {
        dev->openedPath = devicePath;
        dev->openedWith = settings;
        if (dev->openError != ErrorKind::None)
            return Status::failure(dev->openError, "open(" + devicePath + ") failed");
        opened = true;
        return Status::success();
    }

    void close() override
    {
        if (opened)
            ++dev->closes;
        opened = false;
    }

    bool isOpen() const override { return opened; }

    Status write(const void *data, std::size_t len) override
    {
        if (dev->writeError != ErrorKind::None)
            return Status::failure(dev->writeError, "write failed: Input/output error");
        dev->written.append(static_cast<const char *>(data), len);
        return Status::success(len);
    }

    Status flush() override
    {
        ++dev->flushes;
        if (dev->flushError != ErrorKind::None)
            return Status::failure(dev->flushError, "tcdrain failed: Input/output error");
        return Status::success();
    }

private:
    std::shared_ptr<FakeDevice> dev;
    bool opened = false;
};

class PrinterSessionTest : public ::testing::Test
{
protected:
    std::shared_ptr<FakeDevice> device = std::make_shared<FakeDevice>();
    std::vector<std::string> lines;

    ConnectionFactory factory()
    {
        std::shared_ptr<FakeDevice> dev = device;
        return [dev]()
        {
            ++dev->created;
            return std::unique_ptr<SerialConnection>(std::make_unique<FakeConnection>(dev));
        };
    }

    LogSink sink()
    {
        return [this](LogLevel, const std::string &line) { lines.push_back(line); };
    }

    bool logged(const std::string &needle) const
    {
        return std::any_of(lines.begin(), lines.end(),
                           [&](const std::string &l) { return l.find(needle) != std::string::npos; });
    }

    static PortInfo btPort(const std::string &dev, const std::string &hwid = "BTHENUM")
    {
        return {dev, "Bluetooth RFCOMM", hwid};
    }

    static PrinterOptions explicitPort(const std::string &port)
    {
        PrinterOptions o;
        o.port = port;
        return o;
    }
};
} // namespace

TEST_F(PrinterSessionTest, PrefersConfiguredPortWherever)
{
    FakeEnumerator e({btPort("/dev/rfcomm1"), btPort("/dev/rfcomm2"),
                      btPort("/dev/rfcomm0", "BTHENUM ADDR=6622FA2B78F1")});
    PrinterSession s(PrinterOptions(), e, factory(), sink());

    ASSERT_TRUE(s.port().has_value());
    EXPECT_EQ(*s.port(), "/dev/rfcomm0");
    ASSERT_TRUE(s.bluetoothAddress().has_value());
    EXPECT_EQ(*s.bluetoothAddress(), "66:22:FA:2B:78:F1");
    EXPECT_TRUE(logged("Auto-discovered printer on /dev/rfcomm0 (preferred)"));
    EXPECT_TRUE(logged("Bluetooth address: 66:22:FA:2B:78:F1"));
}

TEST_F(PrinterSessionTest, PreferredPortIsInjectable)
{
    FakeEnumerator e({btPort("/dev/rfcomm0"), btPort("/dev/rfcomm3")});
    PrinterOptions o;
    o.preferredPort = "/dev/rfcomm3";
    PrinterSession s(o, e, factory(), sink());
    ASSERT_TRUE(s.port().has_value());
    EXPECT_EQ(*s.port(), "/dev/rfcomm3");
}

TEST_F(PrinterSessionTest, FallsBackToFirstDiscoveredPort)
{
    FakeEnumerator e({{"/dev/ttyUSB0", "CP2102", "USB VID:PID=10C4:EA60"},
                      btPort("/dev/rfcomm4"), btPort("/dev/rfcomm7")});
    PrinterSession s(PrinterOptions(), e, factory(), sink());
    ASSERT_TRUE(s.port().has_value());
    EXPECT_EQ(*s.port(), "/dev/rfcomm4");
    EXPECT_FALSE(s.bluetoothAddress().has_value());
    EXPECT_FALSE(logged("(preferred)"));
}

TEST_F(PrinterSessionTest, NothingDiscoveredLeavesPortUnset)
{
    FakeEnumerator e;
    PrinterSession s(PrinterOptions(), e, factory(), sink());
    EXPECT_FALSE(s.port().has_value());
    EXPECT_TRUE(logged("specify port manually"));

    Status st = s.connect();
    EXPECT_FALSE(st.ok());
    EXPECT_EQ(st.kind, ErrorKind::NoPort);
    EXPECT_EQ(device->created, 0);
    EXPECT_FALSE(s.isConnected());
}

TEST_F(PrinterSessionTest, ExplicitPortSkipsDiscovery)
{
    FakeEnumerator e({btPort("/dev/rfcomm0")});
    PrinterOptions o = explicitPort("/dev/ttyUSB3");
    o.autoDiscover = false;
    PrinterSession s(o, e, factory(), sink());
    EXPECT_EQ(e.calls, 0);
    ASSERT_TRUE(s.port().has_value());
    EXPECT_EQ(*s.port(), "/dev/ttyUSB3");
}

TEST_F(PrinterSessionTest, DiscoveryDisabledLeavesPortUnset)
{
    FakeEnumerator e({btPort("/dev/rfcomm0")});
    PrinterOptions o;
    o.autoDiscover = false;
    PrinterSession s(o, e, factory(), sink());
    EXPECT_EQ(e.calls, 0);
    EXPECT_FALSE(s.port().has_value());
    EXPECT_EQ(s.connect().kind, ErrorKind::NoPort);
}

TEST_F(PrinterSessionTest, ConnectOpensWithSessionSettings)
{
    FakeEnumerator e;
    PrinterOptions o = explicitPort("/dev/rfcomm0");
    o.baudRate = 19200;
    PrinterSession s(o, e, factory(), sink());

    EXPECT_TRUE(s.connect().ok());
    EXPECT_TRUE(s.isConnected());
    EXPECT_EQ(device->openedPath, "/dev/rfcomm0");
    EXPECT_EQ(device->openedWith.baudRate, 19200);
    EXPECT_EQ(device->openedWith.readTimeoutMs, 3000);
    EXPECT_EQ(device->openedWith.writeTimeoutMs, 3000);
    EXPECT_TRUE(logged("Connected to printer on /dev/rfcomm0"));

    // second connect keeps the open handle
    EXPECT_TRUE(s.connect().ok());
    EXPECT_EQ(device->created, 1);
}

TEST_F(PrinterSessionTest, ConnectFailureIsReportedNotThrown)
{
    device->openError = ErrorKind::PortBusy;
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());

    Status st;
    EXPECT_NO_THROW(st = s.connect());
    EXPECT_FALSE(st.ok());
    EXPECT_EQ(st.kind, ErrorKind::PortBusy);
    EXPECT_FALSE(s.isConnected());
    EXPECT_TRUE(logged("Connection failed"));
    EXPECT_TRUE(logged("in use by another process"));
    EXPECT_TRUE(logged("Powered on"));
    EXPECT_TRUE(logged("Bluetooth paired and connected"));
    EXPECT_TRUE(logged("Not being used by another application"));
}

TEST_F(PrinterSessionTest, WriteLineSendsTextAndNewlineThenFlushes)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());
    ASSERT_TRUE(s.connect().ok());

    Status st = s.writeLine("Hello");
    EXPECT_TRUE(st.ok());
    EXPECT_EQ(st.bytes, 6u);
    EXPECT_EQ(device->written, "Hello\n");
    EXPECT_EQ(device->flushes, 1);
    EXPECT_TRUE(logged("Sent 6 bytes to printer"));
}

TEST_F(PrinterSessionTest, FeedWritesBlankLines)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());
    ASSERT_TRUE(s.connect().ok());

    EXPECT_TRUE(s.feed(2).ok());
    EXPECT_EQ(device->written, "\n\n");
    EXPECT_TRUE(s.feed().ok());
    EXPECT_EQ(device->written, "\n\n\n\n\n");
    EXPECT_TRUE(s.feed(0).ok());
    EXPECT_TRUE(s.feed(-4).ok());
    EXPECT_EQ(device->written, "\n\n\n\n\n");
}

TEST_F(PrinterSessionTest, WriteTextPassesUtf8AndRawBytesThrough)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());
    ASSERT_TRUE(s.connect().ok());

    EXPECT_TRUE(s.writeText("Caf\xC3\xA9").ok());
    std::vector<std::uint8_t> raw = {0x1B, 0x40, 0x00, 0xFF};
    Status st = s.writeText(raw);
    EXPECT_TRUE(st.ok());
    EXPECT_EQ(st.bytes, 4u);
    EXPECT_EQ(device->written, std::string("Caf\xC3\xA9") + std::string("\x1B\x40\x00\xFF", 4));
}

TEST_F(PrinterSessionTest, WriteWithoutConnectionIsRejected)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());

    Status st = s.writeLine("Hello");
    EXPECT_FALSE(st.ok());
    EXPECT_EQ(st.kind, ErrorKind::NotConnected);
    EXPECT_EQ(device->created, 0);
    EXPECT_TRUE(device->written.empty());
    EXPECT_TRUE(logged("Not connected to printer"));
}

TEST_F(PrinterSessionTest, WriteErrorIsReportedNotThrown)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());
    ASSERT_TRUE(s.connect().ok());
    device->writeError = ErrorKind::WriteFailed;

    Status st;
    EXPECT_NO_THROW(st = s.writeLine("Hello"));
    EXPECT_EQ(st.kind, ErrorKind::WriteFailed);
    EXPECT_EQ(device->flushes, 0);
    EXPECT_TRUE(logged("Print failed"));
}

TEST_F(PrinterSessionTest, FlushErrorKeepsAcceptedByteCount)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());
    ASSERT_TRUE(s.connect().ok());
    device->flushError = ErrorKind::WriteFailed;

    Status st = s.writeLine("Hello");
    EXPECT_EQ(st.kind, ErrorKind::WriteFailed);
    EXPECT_EQ(st.bytes, 6u);
    EXPECT_EQ(device->written, "Hello\n");
    EXPECT_EQ(device->flushes, 1);
    EXPECT_TRUE(logged("Print failed: tcdrain failed"));
    EXPECT_FALSE(logged("Sent 6 bytes"));
}

TEST_F(PrinterSessionTest, EmptyFactoryFallsBackToSerialTransport)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/btprint-no-such-device"), e, ConnectionFactory(), sink());

    Status st;
    EXPECT_NO_THROW(st = s.connect());
    EXPECT_EQ(st.kind, ErrorKind::PortNotFound);
    EXPECT_FALSE(s.isConnected());
}

TEST_F(PrinterSessionTest, FactoryReturningNothingFailsConnect)
{
    FakeEnumerator e;
    ConnectionFactory none = []() { return std::unique_ptr<SerialConnection>(); };
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, none, sink());

    Status st;
    EXPECT_NO_THROW(st = s.connect());
    EXPECT_EQ(st.kind, ErrorKind::ConnectionFailed);
    EXPECT_FALSE(s.isConnected());
}

TEST_F(PrinterSessionTest, DisconnectIsIdempotent)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());
    EXPECT_NO_THROW(s.disconnect());

    ASSERT_TRUE(s.connect().ok());
    s.disconnect();
    EXPECT_FALSE(s.isConnected());
    EXPECT_NO_THROW(s.disconnect());
    EXPECT_FALSE(s.isConnected());
    EXPECT_EQ(device->closes, 1);
    EXPECT_EQ(std::count(lines.begin(), lines.end(), "Disconnected from printer"), 1);
}

TEST_F(PrinterSessionTest, ScopedConnectionClosesOnException)
{
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm0"), e, factory(), sink());

    try
    {
        ScopedConnection scope(s);
        ASSERT_TRUE(scope.isConnected());
        scope->writeLine("partial receipt");
        throw std::runtime_error("render failed");
    }
    catch (const std::runtime_error &)
    {
    }

    EXPECT_FALSE(s.isConnected());
    EXPECT_EQ(device->closes, 1);
    EXPECT_EQ(device->written, "partial receipt\n");
}

TEST_F(PrinterSessionTest, ScopedConnectionKeepsFailedConnectResult)
{
    device->openError = ErrorKind::PortNotFound;
    FakeEnumerator e;
    PrinterSession s(explicitPort("/dev/rfcomm9"), e, factory(), sink());
    {
        ScopedConnection scope(s);
        EXPECT_FALSE(scope.isConnected());
        EXPECT_EQ(scope.result().kind, ErrorKind::PortNotFound);
        EXPECT_EQ(scope->writeLine("x").kind, ErrorKind::NotConnected);
    }
    EXPECT_EQ(device->closes, 0);
}

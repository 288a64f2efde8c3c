#include "serial_transport.hpp"
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>
#include <string.h>

namespace btprint
{
namespace
{
bool baudToFlag(int baud, speed_t &out)
{
    switch (baud)
    {
    case 1200: out = B1200; return true;
    case 2400: out = B2400; return true;
    case 4800: out = B4800; return true;
    case 9600: out = B9600; return true;
    case 19200: out = B19200; return true;
    case 38400: out = B38400; return true;
    case 57600: out = B57600; return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default: return false;
    }
}

ErrorKind classifyOpenError(int err)
{
    switch (err)
    {
    case EBUSY:
    case EWOULDBLOCK:
        return ErrorKind::PortBusy;
    case ENOENT:
    case ENODEV:
    case ENXIO:
        return ErrorKind::PortNotFound;
    case EACCES:
    case EPERM:
        return ErrorKind::AccessDenied;
    default:
        return ErrorKind::ConnectionFailed;
    }
}
} // namespace

SerialTransport::SerialTransport() : fd(-1), writeTimeoutMs(3000) {}
SerialTransport::~SerialTransport() { close(); }

Status SerialTransport::configurePort(const SerialSettings &settings)
{
    speed_t sp;
    if (!baudToFlag(settings.baudRate, sp))
        return Status::failure(ErrorKind::ConnectionFailed,
                               "unsupported baud rate " + std::to_string(settings.baudRate));

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0)
        return Status::failure(ErrorKind::ConnectionFailed, std::string("tcgetattr failed: ") + strerror(errno));

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= CS8;
    tio.c_cflag &= ~PARENB;
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS; // no HW flow
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;

    // VTIME counts deciseconds and tops out at 255. It only applies to blocking
    // reads; writes below poll against writeTimeoutMs instead.
    int deci = settings.readTimeoutMs / 100;
    if (deci < 0) deci = 0;
    if (deci > 255) deci = 255;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = static_cast<cc_t>(deci);

    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    if (tcsetattr(fd, TCSANOW, &tio) != 0)
        return Status::failure(ErrorKind::ConnectionFailed, std::string("tcsetattr failed: ") + strerror(errno));

    tcflush(fd, TCIFLUSH);
    return Status::success();
}

Status SerialTransport::open(const std::string &devicePath, const SerialSettings &settings)
{
    close();
    fd = ::open(devicePath.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0)
    {
        int err = errno;
        return Status::failure(classifyOpenError(err),
                               "open(" + devicePath + ") failed: " + strerror(err));
    }

    // Advisory lock: a second btprint (or any flock-aware tool) sees the port as busy.
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        int err = errno;
        close();
        return Status::failure(classifyOpenError(err),
                               "could not lock " + devicePath + ": " + strerror(err));
    }

    Status st = configurePort(settings);
    if (!st.ok())
    {
        close();
        return st;
    }
    writeTimeoutMs = settings.writeTimeoutMs;
    return Status::success();
}

void SerialTransport::close()
{
    if (fd >= 0)
    {
        ::flock(fd, LOCK_UN);
        ::close(fd);
        fd = -1;
    }
}

bool SerialTransport::isOpen() const
{
    return fd >= 0;
}

Status SerialTransport::write(const void *data, std::size_t len)
{
    if (fd < 0) return Status::failure(ErrorKind::NotConnected, "port not open");
    if (len == 0) return Status::success();
    if (data == nullptr) return Status::failure(ErrorKind::WriteFailed, "null buffer");

    const unsigned char *bytes = static_cast<const unsigned char *>(data);
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(writeTimeoutMs);
    std::size_t total = 0;

    while (total < len)
    {
        ssize_t n = ::write(fd, bytes + total, len - total);
        if (n > 0)
        {
            total += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
            return Status::failure(ErrorKind::WriteFailed, std::string("write failed: ") + strerror(errno), total);

        // Output buffer full: wait for room until the write timeout runs out.
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0)
            return Status::failure(ErrorKind::Timeout, "write timed out after " + std::to_string(total) + " of " +
                                                           std::to_string(len) + " bytes", total);
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int r = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (r < 0 && errno != EINTR)
            return Status::failure(ErrorKind::WriteFailed, std::string("poll failed: ") + strerror(errno), total);
        if (r > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)))
            return Status::failure(ErrorKind::WriteFailed, "device hung up", total);
    }
    return Status::success(total);
}

Status SerialTransport::flush()
{
    if (fd < 0) return Status::failure(ErrorKind::NotConnected, "port not open");
    if (tcdrain(fd) != 0)
        return Status::failure(ErrorKind::WriteFailed, std::string("tcdrain failed: ") + strerror(errno));
    return Status::success();
}

ConnectionFactory serialTransportFactory()
{
    return []() -> std::unique_ptr<SerialConnection> { return std::make_unique<SerialTransport>(); };
}
} // namespace btprint

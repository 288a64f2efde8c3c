// Result type shared by the serial transport and the printer session.
// Expected failures (no device, busy port, write error) are reported through
// Status instead of exceptions; callers check ok().
#pragma once
#include <cstddef>
#include <string>

namespace btprint
{
enum class ErrorKind
{
    None = 0,
    NoPort,           // no port resolved for the session
    PortBusy,         // device locked by another application
    PortNotFound,     // device path absent
    AccessDenied,     // missing permissions (dialout group)
    ConnectionFailed, // any other open/configure error
    NotConnected,     // write attempted without an open connection
    WriteFailed,      // write or flush reported an I/O error
    Timeout           // write timeout expired before all bytes were accepted
};

const char *errorKindName(ErrorKind kind);

struct Status
{
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::size_t bytes = 0; // bytes accepted by the driver

    bool ok() const { return kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    static Status success(std::size_t bytesWritten = 0)
    {
        Status s;
        s.bytes = bytesWritten;
        return s;
    }

    static Status failure(ErrorKind kind, const std::string &message, std::size_t bytesWritten = 0)
    {
        Status s;
        s.kind = kind;
        s.message = message;
        s.bytes = bytesWritten;
        return s;
    }
};
} // namespace btprint

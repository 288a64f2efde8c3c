#include "status.hpp"

namespace btprint
{
const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None: return "ok";
    case ErrorKind::NoPort: return "no port";
    case ErrorKind::PortBusy: return "port busy";
    case ErrorKind::PortNotFound: return "port not found";
    case ErrorKind::AccessDenied: return "access denied";
    case ErrorKind::ConnectionFailed: return "connection failed";
    case ErrorKind::NotConnected: return "not connected";
    case ErrorKind::WriteFailed: return "write failed";
    case ErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}
} // namespace btprint

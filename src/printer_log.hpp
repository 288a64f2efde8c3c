#pragma once
#include <functional>
#include <string>

namespace btprint
{
enum class LogLevel
{
    Info,
    Success,
    Warn,
    Error
};

// Receives every human-readable notice (port chosen, connected, bytes sent,
// troubleshooting hints). Inject a capturing sink in tests.
using LogSink = std::function<void(LogLevel, const std::string &)>;

// Info/Success lines go to std::cout, Warn/Error lines to std::cerr.
LogSink consoleSink();

// Discards everything.
LogSink nullSink();
} // namespace btprint

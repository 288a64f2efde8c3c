#include "printer_log.hpp"
#include <iostream>

namespace btprint
{
LogSink consoleSink()
{
    return [](LogLevel level, const std::string &line)
    {
        switch (level)
        {
        case LogLevel::Info:
            std::cout << line << "\n";
            break;
        case LogLevel::Success:
            std::cout << "✓ " << line << "\n";
            break;
        case LogLevel::Warn:
            std::cerr << "WARN: " << line << "\n";
            break;
        case LogLevel::Error:
            std::cerr << "ERROR: " << line << "\n";
            break;
        }
    };
}

LogSink nullSink()
{
    return [](LogLevel, const std::string &) {};
}
} // namespace btprint

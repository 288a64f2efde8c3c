#include "btprint_cli.hpp"
#include "port_discovery.hpp"
#include "printer_config.hpp"
#include "printer_log.hpp"
#include "printer_session.hpp"
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace btprint
{
namespace
{

std::string nowString()
{
    time_t now = time(0);
    struct tm tstruct;
    char buf[64];
    tstruct = *localtime(&now);
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tstruct);
    return std::string(buf);
}

void printUsage(const char *prog)
{
    std::cout << "Usage: " << prog << " [list|test|print TEXT...|feed [N]] [options]\n"
              << "  --config PATH    printer YAML config (default config/printer_config.yaml)\n"
              << "  --port DEV       serial device, e.g. /dev/rfcomm0 (skips discovery)\n"
              << "  --baud N         baud rate (default 9600)\n"
              << "  --no-discover    do not search Bluetooth ports\n";
}

std::vector<DiscoveredPort> listAvailablePrinters()
{
    std::cout << "=== Available Bluetooth Printers ===\n";
    std::vector<DiscoveredPort> printers = discoverPrinters();

    if (printers.empty())
    {
        std::cout << "No Bluetooth printers found.\n";
        std::cout << "\nTroubleshooting:\n";
        std::cout << "1. Make sure your printer is powered on\n";
        std::cout << "2. Pair the printer (bluetoothctl pair <address>)\n";
        std::cout << "3. Bind it to a serial port (rfcomm bind 0 <address>)\n";
        return printers;
    }

    int i = 1;
    for (const auto &p : printers)
    {
        std::cout << i++ << ". Port: " << p.portId << "\n";
        std::cout << "   Description: " << p.description << "\n";
        if (p.bluetoothAddress)
            std::cout << "   Bluetooth Address: " << *p.bluetoothAddress << "\n";
        std::cout << "\n";
    }
    return printers;
}

bool testConnection(const PrinterOptions &options, int feedLines)
{
    std::cout << "=== Printer Connection Test ===\n";
    listAvailablePrinters();

    PrinterSession printer(options);
    ScopedConnection scope(printer);
    if (!scope.isConnected())
    {
        std::cout << "Failed to connect to printer\n";
        return false;
    }

    bool ok = printer.writeLine("=== Connection Test ===").ok() &&
              printer.writeLine("Timestamp: " + nowString()).ok() &&
              printer.writeLine("Printer: Bluetooth thermal").ok() &&
              printer.writeLine("Status: Connected successfully!").ok() &&
              printer.feed(feedLines).ok();
    if (ok)
        std::cout << "Test print sent successfully\n";
    return ok;
}

bool printLines(const PrinterOptions &options, const std::vector<std::string> &lines, int feedLines)
{
    PrinterSession printer(options);
    ScopedConnection scope(printer);
    if (!scope.isConnected())
        return false;
    for (const auto &line : lines)
    {
        if (!printer.writeLine(line))
            return false;
    }
    return printer.feed(feedLines).ok();
}

bool feedOnly(const PrinterOptions &options, int count)
{
    PrinterSession printer(options);
    ScopedConnection scope(printer);
    if (!scope.isConnected())
        return false;
    return printer.feed(count).ok();
}

bool parseInt(const std::string &s, int &out)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size())
            return false;
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

} // namespace

int realMain(int argc, char *argv[])
{
    std::string command = "test";
    std::vector<std::string> args;
    std::vector<std::string> configPaths = defaultConfigPaths();
    std::string portOverride;
    int baudOverride = 0;
    bool noDiscover = false;
    bool haveCommand = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (a == "--config" || a == "--port" || a == "--baud")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "ERROR: " << a << " needs a value\n";
                return 2;
            }
            std::string v = argv[++i];
            if (a == "--config")
                configPaths = {v};
            else if (a == "--port")
                portOverride = v;
            else if (!parseInt(v, baudOverride) || baudOverride <= 0)
            {
                std::cerr << "ERROR: invalid baud rate '" << v << "'\n";
                return 2;
            }
        }
        else if (a == "--no-discover")
        {
            noDiscover = true;
        }
        else if (!haveCommand)
        {
            command = a;
            haveCommand = true;
        }
        else
        {
            args.push_back(a);
        }
    }

    LogSink log = consoleSink();
    PrinterConfig cfg = loadPrinterConfig(configPaths, log);
    if (!cfg.sourcePath.empty())
        std::cout << "Config: " << cfg.sourcePath << "\n";
    if (!portOverride.empty())
        cfg.options.port = portOverride;
    if (baudOverride > 0)
        cfg.options.baudRate = baudOverride;
    if (noDiscover)
        cfg.options.autoDiscover = false;

    try
    {
        if (command == "list")
        {
            listAvailablePrinters();
            return 0;
        }
        if (command == "test")
            return testConnection(cfg.options, cfg.feedLines) ? 0 : 1;
        if (command == "print")
        {
            if (args.empty())
            {
                std::cerr << "ERROR: print needs at least one line of text\n";
                return 2;
            }
            return printLines(cfg.options, args, cfg.feedLines) ? 0 : 1;
        }
        if (command == "feed")
        {
            int count = cfg.feedLines;
            if (!args.empty() && !parseInt(args[0], count))
            {
                std::cerr << "ERROR: invalid line count '" << args[0] << "'\n";
                return 2;
            }
            return feedOnly(cfg.options, count) ? 0 : 1;
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        std::cerr << "ERROR: cannot enumerate serial ports: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "ERROR: unknown command '" << command << "'\n";
    printUsage(argv[0]);
    return 2;
}
} // namespace btprint

#pragma once
#include "printer_log.hpp"
#include "printer_session.hpp"
#include <string>
#include <vector>

namespace btprint
{
struct PrinterConfig
{
    PrinterOptions options;
    int feedLines = 3;
    std::string sourcePath; // file the values came from, empty when defaults
};

// Reads the `printer:` map of the first existing YAML file in candidatePaths.
// Missing keys keep their defaults. An unreadable or malformed file is logged
// and skipped.
PrinterConfig loadPrinterConfig(const std::vector<std::string> &candidatePaths, const LogSink &log);

std::vector<std::string> defaultConfigPaths();
} // namespace btprint

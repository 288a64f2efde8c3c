#include "printer_config.hpp"
#include <opencv2/core.hpp>
#include <fstream>

namespace btprint
{
namespace
{
void readInt(const cv::FileNode &node, const char *key, int &out)
{
    cv::FileNode n = node[key];
    if (n.isInt())
        out = static_cast<int>(n);
    else if (n.isReal())
        out = static_cast<int>(static_cast<double>(n));
}

void readString(const cv::FileNode &node, const char *key, std::string &out)
{
    cv::FileNode n = node[key];
    if (n.isString())
        out = n.string();
}

// OpenCV's YAML reader has no boolean type: accept 0/1 and true/false.
void readBool(const cv::FileNode &node, const char *key, bool &out)
{
    cv::FileNode n = node[key];
    if (n.isInt())
    {
        out = static_cast<int>(n) != 0;
    }
    else if (n.isString())
    {
        std::string v = n.string();
        if (v == "true" || v == "yes" || v == "on")
            out = true;
        else if (v == "false" || v == "no" || v == "off")
            out = false;
    }
}

void applyNode(const cv::FileNode &node, PrinterConfig &cfg)
{
    std::string port;
    readString(node, "port", port);
    if (!port.empty())
        cfg.options.port = port;
    readInt(node, "baud", cfg.options.baudRate);
    readBool(node, "auto_discover", cfg.options.autoDiscover);
    readString(node, "preferred_port", cfg.options.preferredPort);
    readInt(node, "read_timeout_ms", cfg.options.readTimeoutMs);
    readInt(node, "write_timeout_ms", cfg.options.writeTimeoutMs);
    readInt(node, "feed_lines", cfg.feedLines);
}
} // namespace

PrinterConfig loadPrinterConfig(const std::vector<std::string> &candidatePaths, const LogSink &log)
{
    PrinterConfig cfg;
    for (const auto &path : candidatePaths)
    {
        std::ifstream probe(path);
        if (!probe.is_open())
            continue;
        probe.close();

        try
        {
            cv::FileStorage fs(path, cv::FileStorage::READ);
            if (!fs.isOpened())
            {
                if (log)
                    log(LogLevel::Warn, "Cannot parse config " + path + ", using defaults.");
                break;
            }
            cv::FileNode printer = fs["printer"];
            if (printer.isMap())
                applyNode(printer, cfg);
            else if (log)
                log(LogLevel::Warn, "Config " + path + " has no `printer` section.");
            cfg.sourcePath = path;
        }
        catch (const cv::Exception &e)
        {
            cfg = PrinterConfig();
            if (log)
                log(LogLevel::Warn, "Cannot parse config " + path + ": " + e.what());
        }
        break; // stop at the first file found
    }
    return cfg;
}

std::vector<std::string> defaultConfigPaths()
{
    return {"config/printer_config.yaml", "../config/printer_config.yaml"};
}
} // namespace btprint

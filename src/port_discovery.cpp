#include "port_discovery.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace btprint
{
namespace
{
const char *const kSerialPrefixes[] = {"ttyS", "ttyUSB", "ttyACM", "ttyAMA", "rfcomm", "ttyAP", "ttyGS"};

std::string toUpper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Single-line sysfs attribute, trailing whitespace stripped. Empty if unreadable.
std::string readAttr(const fs::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
        return "";
    std::string line;
    std::getline(in, line);
    size_t e = line.find_last_not_of(" \t\r\n");
    if (e == std::string::npos)
        return "";
    return line.substr(0, e + 1);
}

std::string subsystemOf(const fs::path &devicePath)
{
    std::error_code ec;
    fs::path link = fs::canonical(devicePath / "subsystem", ec);
    if (ec)
        return "";
    return link.filename().string();
}
} // namespace

SysfsPortEnumerator::SysfsPortEnumerator() : devRoot("/dev"), sysTtyRoot("/sys/class/tty") {}

SysfsPortEnumerator::SysfsPortEnumerator(const std::string &devRoot, const std::string &sysTtyRoot)
    : devRoot(devRoot), sysTtyRoot(sysTtyRoot) {}

bool SysfsPortEnumerator::isSerialName(const std::string &name)
{
    for (const char *prefix : kSerialPrefixes)
    {
        std::string p(prefix);
        if (name.size() > p.size() && name.compare(0, p.size(), p) == 0)
            return true;
    }
    return false;
}

bool SysfsPortEnumerator::describe(const std::string &name, PortInfo &info) const
{
    info.description = "n/a";
    info.hwid = "n/a";
    fs::path sysNode = fs::path(sysTtyRoot) / name;
    std::error_code ec;

    if (name.compare(0, 6, "rfcomm") == 0)
    {
        // RFCOMM TTYs have no parent device, only address/channel attributes.
        std::string addr = readAttr(sysNode / "address");
        addr.erase(std::remove(addr.begin(), addr.end(), ':'), addr.end());
        info.description = "Bluetooth RFCOMM (" + name + ")";
        info.hwid = "BTHENUM";
        if (!addr.empty())
            info.hwid += " ADDR=" + toUpper(addr);
        std::string channel = readAttr(sysNode / "channel");
        if (!channel.empty())
            info.hwid += " CHANNEL=" + channel;
        return true;
    }

    fs::path devicePath = fs::canonical(sysNode / "device", ec);
    if (ec)
    {
        // No backing device: virtual console style nodes. ttyS* stubs are skipped.
        return name.compare(0, 4, "ttyS") != 0;
    }

    std::string subsystem = subsystemOf(devicePath);
    if (subsystem == "platform" && name.compare(0, 4, "ttyS") == 0)
        return false;

    fs::path usbInterface;
    if (subsystem == "usb-serial")
        usbInterface = devicePath.parent_path();
    else if (subsystem == "usb")
        usbInterface = devicePath;

    if (!usbInterface.empty())
    {
        fs::path usbDevice = usbInterface.parent_path();
        std::string vid = readAttr(usbDevice / "idVendor");
        std::string pid = readAttr(usbDevice / "idProduct");
        std::string serial = readAttr(usbDevice / "serial");
        std::string product = readAttr(usbDevice / "product");
        std::string interfaceName = readAttr(usbInterface / "interface");

        if (!interfaceName.empty())
            info.description = interfaceName;
        else if (!product.empty())
            info.description = product;
        else
            info.description = name;

        info.hwid = "USB VID:PID=" + toUpper(vid) + ":" + toUpper(pid);
        if (!serial.empty())
            info.hwid += " SER=" + serial;
        return true;
    }

    if (!subsystem.empty())
        info.hwid = subsystem;
    return true;
}

std::vector<PortInfo> SysfsPortEnumerator::listPorts() const
{
    std::vector<std::string> names;
    for (const auto &entry : fs::directory_iterator(devRoot))
    {
        std::string name = entry.path().filename().string();
        if (isSerialName(name))
            names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::vector<PortInfo> ports;
    for (const auto &name : names)
    {
        PortInfo info;
        info.device = (fs::path(devRoot) / name).string();
        if (describe(name, info))
            ports.push_back(info);
    }
    return ports;
}

std::optional<std::string> extractBluetoothAddress(const std::string &hwid)
{
    std::string u = toUpper(hwid);
    size_t run = 0;
    for (size_t i = 0; i < u.size(); ++i)
    {
        if (!std::isxdigit(static_cast<unsigned char>(u[i])))
        {
            run = 0;
            continue;
        }
        if (++run == 12)
        {
            std::string digits = u.substr(i - 11, 12);
            std::string addr;
            for (size_t k = 0; k < 12; k += 2)
            {
                if (!addr.empty())
                    addr += ':';
                addr += digits.substr(k, 2);
            }
            return addr;
        }
    }
    return std::nullopt;
}

std::vector<DiscoveredPort> filterBluetoothPorts(const std::vector<PortInfo> &ports)
{
    std::vector<DiscoveredPort> out;
    for (const auto &p : ports)
    {
        if (toLower(p.description).find("bluetooth") == std::string::npos)
            continue;
        DiscoveredPort d;
        d.portId = p.device;
        d.description = p.description;
        if (!p.hwid.empty())
            d.bluetoothAddress = extractBluetoothAddress(p.hwid);
        out.push_back(d);
    }
    return out;
}

std::vector<DiscoveredPort> discoverPrinters(const PortEnumerator &enumerator)
{
    return filterBluetoothPorts(enumerator.listPorts());
}

std::vector<DiscoveredPort> discoverPrinters()
{
    SysfsPortEnumerator enumerator;
    return discoverPrinters(enumerator);
}
} // namespace btprint

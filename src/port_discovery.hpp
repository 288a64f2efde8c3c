// Serial port enumeration and Bluetooth printer discovery.
// On Linux an SPP pairing bound with `rfcomm bind` shows up as /dev/rfcommN;
// its sysfs node carries the remote address, which ends up in the hwid.
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace btprint
{
// One port as the OS reports it.
struct PortInfo
{
    std::string device;      // e.g. /dev/rfcomm0
    std::string description; // e.g. "Bluetooth RFCOMM (rfcomm0)"
    std::string hwid;        // e.g. "BTHENUM ADDR=6622FA2B78F1 CHANNEL=1", or "n/a"
};

struct DiscoveredPort
{
    std::string portId;
    std::string description;
    std::optional<std::string> bluetoothAddress; // XX:XX:XX:XX:XX:XX, uppercase
};

class PortEnumerator
{
public:
    virtual ~PortEnumerator() = default;
    virtual std::vector<PortInfo> listPorts() const = 0;
};

// Reads /dev and /sys/class/tty. Both roots can be redirected for tests.
class SysfsPortEnumerator : public PortEnumerator
{
public:
    SysfsPortEnumerator();
    SysfsPortEnumerator(const std::string &devRoot, const std::string &sysTtyRoot);

    // Throws std::filesystem::filesystem_error when devRoot cannot be read.
    std::vector<PortInfo> listPorts() const override;

private:
    std::string devRoot;
    std::string sysTtyRoot;

    static bool isSerialName(const std::string &name);
    bool describe(const std::string &name, PortInfo &info) const;
};

// First run of 12 hex digits in hwid (case-insensitive), regrouped as
// XX:XX:XX:XX:XX:XX. Empty when no such run exists.
std::optional<std::string> extractBluetoothAddress(const std::string &hwid);

// Keeps ports whose description contains "bluetooth" in any case, in input order.
std::vector<DiscoveredPort> filterBluetoothPorts(const std::vector<PortInfo> &ports);

std::vector<DiscoveredPort> discoverPrinters(const PortEnumerator &enumerator);
std::vector<DiscoveredPort> discoverPrinters();
} // namespace btprint

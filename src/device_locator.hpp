#pragma once
#include <string>
#include <vector>

struct DeviceIdentity
{
    int vendorId = 0;
    int productId = 0;
    std::string path;   // e.g. /dev/ttyUSB0
};

// One tty found under sysfs, with the USB ids of its parent device
// (-1 when the tty is not USB-backed).
struct SerialDescriptor
{
    std::string name;   // ttyUSB0
    std::string path;   // /dev/ttyUSB0
    int vendorId = -1;
    int productId = -1;
};

// Lists ttys under sysfsRoot (normally /sys/class/tty) that have a backing
// device, sorted by name. Virtual consoles are skipped.
std::vector<SerialDescriptor> scanSerialDevices(const std::string &sysfsRoot, const std::string &devRoot);

// Exactly one descriptor must match; throws DeviceNotFound or AmbiguousDevice.
DeviceIdentity selectDevice(const std::vector<SerialDescriptor> &devices, int vendorId, int productId);

// explicitPort non-empty: trust it and skip enumeration.
DeviceIdentity locateDevice(int vendorId, int productId, const std::string &explicitPort,
                            const std::string &sysfsRoot, const std::string &devRoot);

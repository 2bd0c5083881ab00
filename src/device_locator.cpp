#include "device_locator.hpp"
#include "flash_errors.hpp"
#include "repl_protocol.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

static int readHexFile(const fs::path &p)
{
    std::ifstream in(p);
    if (!in.is_open())
        return -1;
    std::string text;
    std::getline(in, text);
    text = replcmd::trim(text);
    if (text.empty())
        return -1;
    try
    {
        return std::stoi(text, nullptr, 16);
    }
    catch (const std::logic_error &)
    {
        return -1;
    }
}

static std::string hexId(int id)
{
    std::ostringstream oss;
    oss << std::hex << std::setw(4) << std::setfill('0') << id;
    return oss.str();
}

// The tty's device link points at the usb-serial port or the interface;
// idVendor/idProduct live a few levels up on the USB device node.
static void readUsbIds(const fs::path &deviceLink, int &vid, int &pid)
{
    vid = -1;
    pid = -1;
    std::error_code ec;
    fs::path dir = fs::canonical(deviceLink, ec);
    if (ec)
        return;
    for (int depth = 0; depth < 6 && !dir.empty() && dir != dir.root_path(); ++depth)
    {
        if (fs::exists(dir / "idVendor", ec) && fs::exists(dir / "idProduct", ec))
        {
            vid = readHexFile(dir / "idVendor");
            pid = readHexFile(dir / "idProduct");
            return;
        }
        dir = dir.parent_path();
    }
}

std::vector<SerialDescriptor> scanSerialDevices(const std::string &sysfsRoot, const std::string &devRoot)
{
    std::vector<SerialDescriptor> out;
    std::error_code ec;
    fs::directory_iterator it(sysfsRoot, ec);
    if (ec)
    {
        CV_LOG_WARNING(NULL, "cannot list " << sysfsRoot << ": " << ec.message());
        return out;
    }
    for (const auto &entry : it)
    {
        fs::path deviceLink = entry.path() / "device";
        if (!fs::exists(deviceLink, ec))
            continue; // tty0..tty63, ptmx and friends
        SerialDescriptor d;
        d.name = entry.path().filename().string();
        d.path = (fs::path(devRoot) / d.name).string();
        readUsbIds(deviceLink, d.vendorId, d.productId);
        CV_LOG_DEBUG(NULL, "tty " << d.name << " vid=" << d.vendorId << " pid=" << d.productId);
        out.push_back(d);
    }
    std::sort(out.begin(), out.end(), [](const SerialDescriptor &a, const SerialDescriptor &b){ return a.name < b.name; });
    return out;
}

DeviceIdentity selectDevice(const std::vector<SerialDescriptor> &devices, int vendorId, int productId)
{
    std::vector<const SerialDescriptor*> matches;
    for (const auto &d : devices)
    {
        if (d.vendorId == vendorId && d.productId == productId)
            matches.push_back(&d);
    }
    std::string idText = hexId(vendorId) + ":" + hexId(productId);
    if (matches.empty())
        throw DeviceNotFound("no serial device with USB id " + idText + " (scanned " +
                             std::to_string(devices.size()) + " tty devices). Is the badge plugged in?");
    if (matches.size() > 1)
    {
        std::vector<std::string> paths;
        std::string msg = std::to_string(matches.size()) + " devices match " + idText + ":";
        for (const auto *m : matches)
        {
            paths.push_back(m->path);
            msg += " " + m->path;
        }
        msg += ". Pick one with --port.";
        throw AmbiguousDevice(msg, paths);
    }
    DeviceIdentity id;
    id.vendorId = vendorId;
    id.productId = productId;
    id.path = matches.front()->path;
    return id;
}

DeviceIdentity locateDevice(int vendorId, int productId, const std::string &explicitPort,
                            const std::string &sysfsRoot, const std::string &devRoot)
{
    if (!explicitPort.empty())
    {
        DeviceIdentity id;
        id.vendorId = vendorId;
        id.productId = productId;
        id.path = explicitPort;
        return id;
    }
    return selectDevice(scanSerialDevices(sysfsRoot, devRoot), vendorId, productId);
}

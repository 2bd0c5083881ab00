#include "flasher_config.hpp"
#include "repl_protocol.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using replcmd::trim;

// ========== Simple config loader (key: value, dotted keys supported) ==========
ConfigMap loadConfig(const std::vector<std::string> &candidatePaths, std::string *usedPath)
{
    ConfigMap cfg;
    if (usedPath) usedPath->clear();
    for (const auto &path : candidatePaths)
    {
        std::ifstream in(path);
        if (!in.is_open())
            continue;
        std::string line;
        while (std::getline(in, line))
        {
            line = trim(line);
            if (line.empty())
                continue;
            if (line[0] == '#')
                continue;
            auto pos = line.find(':');
            if (pos == std::string::npos)
                continue;
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // remove surrounding quotes if any
            if (!value.empty() && (value.front() == '"' || value.front() == '\''))
                value.erase(0, 1);
            if (!value.empty() && (value.back() == '"' || value.back() == '\''))
                value.pop_back();
            if (!key.empty())
                cfg[key] = value;
        }
        if (usedPath) *usedPath = path;
        break; // stop at the first file found
    }
    return cfg;
}

std::string cfgStr(const ConfigMap &cfg, const std::string &key, const std::string &defVal)
{
    auto it = cfg.find(key);
    return it == cfg.end() ? defVal : it->second;
}

int cfgInt(const ConfigMap &cfg, const std::string &key, int defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    try
    {
        // base 0: accepts 0x1a86 as well as 115200
        return std::stoi(it->second, nullptr, 0);
    }
    catch (const std::logic_error &)
    {
        CV_LOG_WARNING(NULL, "config " << key << "='" << it->second << "' is not a number, using " << defVal);
        return defVal;
    }
}

bool cfgBool(const ConfigMap &cfg, const std::string &key, bool defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return std::tolower(c); });
    if (v == "true" || v == "yes" || v == "1") return true;
    if (v == "false" || v == "no" || v == "0") return false;
    return defVal;
}

FlasherConfig flasherConfigFrom(const ConfigMap &cfg)
{
    FlasherConfig c;
    c.vendorId = cfgInt(cfg, "device.vid", c.vendorId);
    c.productId = cfgInt(cfg, "device.pid", c.productId);
    c.port = cfgStr(cfg, "device.port", c.port);
    c.sysfsRoot = cfgStr(cfg, "device.sysfs_root", c.sysfsRoot);
    c.devRoot = cfgStr(cfg, "device.dev_root", c.devRoot);
    c.baud = cfgInt(cfg, "serial.baud", c.baud);

    c.destPath = cfgStr(cfg, "transfer.dest", c.destPath);
    c.chunkBytes = cfgInt(cfg, "transfer.chunk_bytes", c.chunkBytes);
    c.maxLineBytes = cfgInt(cfg, "transfer.max_line", c.maxLineBytes);
    c.atomicWrite = cfgBool(cfg, "transfer.atomic", c.atomicWrite);

    ReplTiming &t = c.timing;
    t.interruptCount = cfgInt(cfg, "repl.interrupt_count", t.interruptCount);
    t.interruptGapMs = cfgInt(cfg, "repl.interrupt_gap_ms", t.interruptGapMs);
    t.settleMs = cfgInt(cfg, "repl.settle_ms", t.settleMs);
    t.bannerTimeoutMs = cfgInt(cfg, "repl.banner_timeout_ms", t.bannerTimeoutMs);
    t.execTimeoutMs = cfgInt(cfg, "repl.exec_timeout_ms", t.execTimeoutMs);
    t.writeSlice = cfgInt(cfg, "repl.write_slice", t.writeSlice);
    t.writeGapMs = cfgInt(cfg, "repl.write_gap_ms", t.writeGapMs);
    t.rebootPauseMs = cfgInt(cfg, "repl.reboot_pause_ms", t.rebootPauseMs);
    c.bootWaitMs = cfgInt(cfg, "session.boot_wait_ms", c.bootWaitMs);

    c.payloadPath = cfgStr(cfg, "payload.path", c.payloadPath);
    c.verifySpecPath = cfgStr(cfg, "verify.spec", c.verifySpecPath);
    c.storeModule = cfgStr(cfg, "verify.store_module", c.storeModule);
    c.patchLogPath = cfgStr(cfg, "verify.log_path", c.patchLogPath);
    c.logLevel = cfgStr(cfg, "log.level", c.logLevel);
    return c;
}

std::string resolveDataPath(const std::string &path)
{
    namespace fs = std::filesystem;
    if (path.empty() || fs::path(path).is_absolute())
        return path;
    std::error_code ec;
    if (fs::exists(path, ec))
        return path;
    std::string up = "../" + path;
    if (fs::exists(up, ec))
        return up;
    return path;
}

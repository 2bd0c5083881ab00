#pragma once
#include <map>
#include <string>
#include <vector>

// Raw REPL pacing and timeouts, all in milliseconds.
struct ReplTiming
{
    int interruptCount = 5;     // Ctrl-C bursts; the badge app swallows single ones
    int interruptGapMs = 100;
    int settleMs = 500;         // after the burst, before draining input
    int bannerTimeoutMs = 3000;
    int execTimeoutMs = 10000;
    int writeSlice = 128;       // statement bytes per write
    int writeGapMs = 20;
    int rebootPauseMs = 200;    // between Ctrl-B and the soft-reset Ctrl-D
};

struct FlasherConfig
{
    int vendorId = 0x1A86;      // CH340
    int productId = 0x7523;
    std::string port;           // explicit device path, skips enumeration
    std::string sysfsRoot = "/sys/class/tty";
    std::string devRoot = "/dev";
    int baud = 115200;

    std::string destPath = "/main.py";
    int chunkBytes = 192;       // payload bytes per write statement
    int maxLineBytes = 1024;    // device input-line limit
    bool atomicWrite = true;

    ReplTiming timing;
    int bootWaitMs = 12000;     // payload needs this long to patch the store

    std::string payloadPath = "payload/main.py";
    std::string verifySpecPath = "config/verify.yml";
    std::string storeModule = "cactuscon.prefs";
    std::string patchLogPath = "/patch.log";
    std::string logLevel = "warning";
};

typedef std::map<std::string, std::string> ConfigMap;

// key: value per line, dotted keys, '#' comments. The first existing
// candidate wins; usedPath receives it (empty when none was found).
ConfigMap loadConfig(const std::vector<std::string> &candidatePaths, std::string *usedPath = nullptr);

std::string cfgStr(const ConfigMap &cfg, const std::string &key, const std::string &defVal);
int cfgInt(const ConfigMap &cfg, const std::string &key, int defVal);
bool cfgBool(const ConfigMap &cfg, const std::string &key, bool defVal);

FlasherConfig flasherConfigFrom(const ConfigMap &cfg);

// Relative data files (payload, verification spec) are looked up like the
// config file: in the working directory, then one level up (running from build/).
std::string resolveDataPath(const std::string &path);

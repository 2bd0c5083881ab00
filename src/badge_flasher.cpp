#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "flash_errors.hpp"
#include "flash_session.hpp"
#include "flasher_config.hpp"
#include "payload_builder.hpp"

static const char *const KEYS =
    "{help h usage ? |     | print this message }"
    "{config c       |     | flasher config (default: config/flasher_config.yaml) }"
    "{port p         |     | serial device, skips auto-detect }"
    "{payload        |     | payload file pushed to the badge }"
    "{verify         |     | verification spec (FileStorage YAML) }"
    "{dest           |     | destination path on the badge }"
    "{enable         |     | comma-separated payload variants to switch on }"
    "{rainbow        |     | enable rainbow LEDs on boot }"
    "{auto-battle    |     | enable auto-battle on boot }"
    "{max-stats      |     | max all combat stats (breaks PvP consensus) }"
    "{yes y          |     | do not ask for confirmation }"
    "{verbose v      |     | log serial traffic }";

static cv::utils::logging::LogLevel parseLogLevel(const std::string &name)
{
    using namespace cv::utils::logging;
    if (name == "silent") return LOG_LEVEL_SILENT;
    if (name == "error") return LOG_LEVEL_ERROR;
    if (name == "info") return LOG_LEVEL_INFO;
    if (name == "debug") return LOG_LEVEL_DEBUG;
    if (name == "verbose") return LOG_LEVEL_VERBOSE;
    return LOG_LEVEL_WARNING;
}

static std::vector<std::string> splitList(const std::string &text)
{
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

static bool confirm(const std::string &question)
{
    std::cout << question << " [y/N] ";
    std::string answer;
    if (!std::getline(std::cin, answer))
        return false;
    return answer == "y" || answer == "Y";
}

int main(int argc, char *argv[])
{
    cv::CommandLineParser parser(argc, argv, KEYS);
    parser.about("Flash a CactusCon badge over its MicroPython raw REPL and verify the result.");
    if (parser.has("help"))
    {
        parser.printMessage();
        return 0;
    }

    std::string cfgPathUsed;
    ConfigMap cfgMap;
    if (parser.has("config"))
    {
        std::string path = parser.get<std::string>("config");
        cfgMap = loadConfig({path}, &cfgPathUsed);
        if (cfgPathUsed.empty())
        {
            std::cerr << "ERROR: cannot read config " << path << "\n";
            return 2;
        }
    }
    else
    {
        cfgMap = loadConfig({"../config/flasher_config.yaml", "config/flasher_config.yaml"}, &cfgPathUsed);
    }
    FlasherConfig cfg = flasherConfigFrom(cfgMap);

    if (parser.has("port")) cfg.port = parser.get<std::string>("port");
    if (parser.has("payload")) cfg.payloadPath = parser.get<std::string>("payload");
    if (parser.has("verify")) cfg.verifySpecPath = parser.get<std::string>("verify");
    if (parser.has("dest")) cfg.destPath = parser.get<std::string>("dest");
    cfg.payloadPath = resolveDataPath(cfg.payloadPath);
    cfg.verifySpecPath = resolveDataPath(cfg.verifySpecPath);
    bool verbose = parser.has("verbose");
    bool assumeYes = parser.has("yes");

    std::vector<std::string> variants;
    if (parser.has("enable")) variants = splitList(parser.get<std::string>("enable"));
    if (parser.has("rainbow")) variants.push_back("rainbow");
    if (parser.has("auto-battle")) variants.push_back("auto-battle");
    bool maxStats = parser.has("max-stats");
    if (!parser.check())
    {
        parser.printErrors();
        return 2;
    }

    cv::utils::logging::setLogLevel(verbose ? cv::utils::logging::LOG_LEVEL_DEBUG : parseLogLevel(cfg.logLevel));

    std::cout << "========================================\n";
    std::cout << "BADGE FLASHER (raw REPL)\n";
    std::cout << "========================================\n\n";
    if (!cfgPathUsed.empty())
        std::cout << "Config: " << cfgPathUsed << "\n";
    else
        std::cout << "Config: built-in defaults\n";

    if (maxStats)
    {
        std::cout << "WARNING: --max-stats sets all combat stats to 99. This WILL break PvP\n";
        std::cout << "battles (consensus hash mismatch -> battle voided). Only useful for\n";
        std::cout << "auto-battle grinding or showing off on the character screen.\n";
        if (!assumeYes && !confirm("Continue?"))
        {
            std::cout << "Aborted.\n";
            return 0;
        }
        variants.push_back("max-stats");
    }

    TransferPlan plan;
    VerificationSpec spec;
    try
    {
        PayloadBuilder payload = PayloadBuilder::fromFile(cfg.payloadPath);
        std::cout << "✓ Payload " << cfg.payloadPath << "\n";
        for (const auto &v : variants)
        {
            if (payload.enable(v))
                std::cout << "✓ Variant " << PayloadBuilder::variantName(v) << " enabled\n";
            else
                CV_LOG_WARNING(NULL, "payload has no ENABLE_" << PayloadBuilder::variantName(v) << " toggle, ignored");
        }
        plan.destPath = cfg.destPath;
        plan.payload = payload.bytes();
        plan.chunkBytes = cfg.chunkBytes;
        plan.maxLineBytes = cfg.maxLineBytes;
        plan.atomic = cfg.atomicWrite;
        plan.validate();

        spec = loadVerificationSpec(cfg.verifySpecPath);
        std::cout << "✓ " << spec.checks.size() << " verification checks loaded from " << cfg.verifySpecPath << "\n\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }

    FlashSession session(cfg, plan, spec);
    try
    {
        session.run();
    }
    catch (const VerificationFailed &e)
    {
        std::cerr << "\n✗ Some checks failed. Inspect badge manually.\n";
        for (const auto &m : e.mismatches())
            std::cerr << "  " << m.ns << "/" << m.key << ": expected " << m.expected << ", got " << m.actual << "\n";
        return 1;
    }
    catch (const FlashError &e)
    {
        std::cerr << "\n✗ " << e.kind() << ": " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n✗ " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nAll checks passed. Badge is rebooting into normal operation.\n";
    return 0;
}

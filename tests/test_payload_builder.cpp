/*
 * Payload variants: ENABLE_<NAME> toggles flipped in the payload source.
 */
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include "../src/flasher_config.hpp"
#include "../src/payload_builder.hpp"
#include "../src/repl_protocol.hpp"
#include "../src/verifier.hpp"
#include "test_harness.hpp"

namespace fs = std::filesystem;

static const std::string ROOT = BADGEFLASH_SOURCE_DIR;

static FlasherConfig shippedConfig()
{
    std::string used;
    ConfigMap cfg = loadConfig({ROOT + "/config/flasher_config.yaml"}, &used);
    if (used.empty())
        throw std::runtime_error("config/flasher_config.yaml missing");
    return flasherConfigFrom(cfg);
}

static const char *const SOURCE =
    "ENABLE_RAINBOW = False\n"
    "ENABLE_AUTO_BATTLE = False\n"
    "ENABLE_MAX_STATS = False\n"
    "if ENABLE_RAINBOW:\n"
    "    pass  # ENABLE_RAINBOW = False stays in comments\n";

TEST(variant_names) {
    ASSERT_EQ(std::string("RAINBOW"), PayloadBuilder::variantName("rainbow"));
    ASSERT_EQ(std::string("AUTO_BATTLE"), PayloadBuilder::variantName("auto-battle"));
    ASSERT_EQ(std::string("MAX_STATS"), PayloadBuilder::variantName("ENABLE_MAX_STATS"));
}

TEST(enable_flips_first_toggle_only) {
    PayloadBuilder p(SOURCE);
    ASSERT_TRUE(p.enable("rainbow"));
    ASSERT_TRUE(p.source().find("ENABLE_RAINBOW = True\n") == 0);
    ASSERT_TRUE(p.source().find("# ENABLE_RAINBOW = False stays") != std::string::npos);
    ASSERT_TRUE(p.source().find("ENABLE_AUTO_BATTLE = False") != std::string::npos);
}

TEST(unknown_variant_leaves_payload_alone) {
    PayloadBuilder p(SOURCE);
    ASSERT_FALSE(p.enable("turbo"));
    ASSERT_EQ(std::string(SOURCE), p.source());
}

TEST(reads_file_bytes_verbatim) {
    fs::path path = fs::temp_directory_path() / ("badgeflash_payload_" + std::to_string(getpid()) + ".py");
    std::string text = std::string("# micropython\r\nx = '\xc3\xa9'\n") + '\0' + "tail";
    {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }
    PayloadBuilder p = PayloadBuilder::fromFile(path.string());
    std::vector<uint8_t> bytes = p.bytes();
    ASSERT_EQ(text.size(), bytes.size());
    ASSERT_TRUE(std::string(bytes.begin(), bytes.end()) == text);
    fs::remove(path);
    ASSERT_THROWS(PayloadBuilder::fromFile(path.string()), std::runtime_error);
}

TEST(shipped_payload_has_every_toggle) {
    FlasherConfig c = shippedConfig();
    PayloadBuilder p = PayloadBuilder::fromFile(ROOT + "/" + c.payloadPath);
    ASSERT_TRUE(p.source().find("# micropython") == 0);
    ASSERT_TRUE(p.enable("rainbow"));
    ASSERT_TRUE(p.enable("auto-battle"));
    ASSERT_TRUE(p.enable("max-stats"));
    ASSERT_TRUE(p.source().find(" = False") == std::string::npos);
    // the log the verifier reads back
    ASSERT_TRUE(p.source().find(replcmd::pyQuote(c.patchLogPath)) != std::string::npos);
}

TEST(shipped_payload_writes_every_verified_key) {
    FlasherConfig c = shippedConfig();
    std::string src = PayloadBuilder::fromFile(ROOT + "/" + c.payloadPath).source();
    VerificationSpec spec = loadVerificationSpec(ROOT + "/" + c.verifySpecPath);
    ASSERT_TRUE(!spec.checks.empty());
    for (const auto &e : spec.checks)
    {
        std::string k = replcmd::storeKeyExpr(e.key);
        ASSERT_TRUE(src.find(replcmd::pyQuote(e.ns)) != std::string::npos);
        if (e.kind == ValueKind::Integer)
        {
            ASSERT_TRUE(src.find("prefs.set_int32(" + k + ", " + e.expected + ")") != std::string::npos);
        }
        else
        {
            ASSERT_TRUE(src.find("prefs.set_string(" + k + ",") != std::string::npos);
        }
        if (e.kind == ValueKind::Text)
        {
            std::stringstream items(e.expected);
            std::string item;
            while (std::getline(items, item, ','))
                ASSERT_TRUE(src.find(replcmd::pyQuote(item)) != std::string::npos);
        }
    }
}

TEST(shipped_payload_lists_fourteen_achievements) {
    FlasherConfig c = shippedConfig();
    std::string src = PayloadBuilder::fromFile(ROOT + "/" + c.payloadPath).source();
    size_t start = src.find("ACHIEVEMENTS = (");
    ASSERT_TRUE(start != std::string::npos);
    size_t end = src.find(')', start);
    std::string body = src.substr(start, end - start);
    ASSERT_EQ(28, static_cast<int>(std::count(body.begin(), body.end(), '\'')));
}

int main() {
    std::cout << "=== Payload Builder Tests ===" << std::endl;
    RUN_TEST(variant_names);
    RUN_TEST(enable_flips_first_toggle_only);
    RUN_TEST(unknown_variant_leaves_payload_alone);
    RUN_TEST(reads_file_bytes_verbatim);
    RUN_TEST(shipped_payload_has_every_toggle);
    RUN_TEST(shipped_payload_writes_every_verified_key);
    RUN_TEST(shipped_payload_lists_fourteen_achievements);
    TEST_SUMMARY();
}

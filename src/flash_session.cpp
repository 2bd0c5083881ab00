#include "flash_session.hpp"
#include "flash_errors.hpp"
#include "serial_transport.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <chrono>
#include <iostream>
#include <thread>

const char* sessionStageName(SessionStage s)
{
    switch (s)
    {
    case SessionStage::Idle: return "Idle";
    case SessionStage::Located: return "Located";
    case SessionStage::Interrupted: return "Interrupted";
    case SessionStage::RawMode: return "RawMode";
    case SessionStage::Transferring: return "Transferring";
    case SessionStage::Rebooting: return "Rebooting";
    case SessionStage::Verifying: return "Verifying";
    case SessionStage::RebootingToNormal: return "RebootingToNormal";
    case SessionStage::Done: return "Done";
    case SessionStage::Failed: return "Failed";
    }
    return "?";
}

std::unique_ptr<ByteChannel> openSerialLink(const DeviceIdentity &device, int baud)
{
    std::unique_ptr<SerialTransport> serial(new SerialTransport());
    if (!serial->open(device.path, baud))
        throw LinkError("cannot open " + device.path + " @" + std::to_string(baud) +
                        " (is your user in the dialout group?)");
    return std::unique_ptr<ByteChannel>(serial.release());
}

FlashSession::FlashSession(const FlasherConfig &config, const TransferPlan &plan, const VerificationSpec &spec,
                           LinkOpener opener)
    : config_(config), plan_(plan), spec_(spec), opener_(opener),
      stage_(SessionStage::Idle), failedAt_(SessionStage::Idle) {}

void FlashSession::enter(SessionStage s)
{
    stage_ = s;
    CV_LOG_INFO(NULL, "session stage " << sessionStageName(s));
}

void FlashSession::fail()
{
    failedAt_ = stage_;
    stage_ = SessionStage::Failed;
}

void FlashSession::waitForBoot() const
{
    if (config_.bootWaitMs > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.bootWaitMs));
}

SessionResult FlashSession::run()
{
    SessionResult result;
    stage_ = SessionStage::Idle;
    failedAt_ = SessionStage::Idle;

    std::unique_ptr<ByteChannel> link;
    try
    {
        std::cout << "[STEP 1] Locating badge...\n";
        plan_.validate();
        result.device = locateDevice(config_.vendorId, config_.productId, config_.port,
                                     config_.sysfsRoot, config_.devRoot);
        link = opener_(result.device, config_.baud);
        if (!link)
            throw LinkError("no link for " + result.device.path);
        enter(SessionStage::Located);
        std::cout << "✓ Found badge on " << result.device.path << "\n";
    }
    catch (const std::exception &)
    {
        fail();
        throw;
    }

    RawReplController repl(*link, config_.timing);
    try
    {
        std::cout << "[STEP 2] Interrupting badge app...\n";
        repl.interrupt();
        enter(SessionStage::Interrupted);

        std::cout << "[STEP 3] Entering raw REPL...\n";
        repl.enterRawMode();
        enter(SessionStage::RawMode);

        enter(SessionStage::Transferring);
        std::cout << "[STEP 4] Pushing " << plan_.payload.size() << " bytes -> " << plan_.destPath
                  << " (" << plan_.chunkCount() << " chunks of " << plan_.chunkBytes << ")\n";
        ChunkedTransfer transfer(repl, plan_);
        size_t lastDecile = 0;
        transfer.setProgress([&lastDecile](size_t done, size_t total) {
            size_t decile = done * 10 / total;
            if (decile != lastDecile || done == total)
            {
                lastDecile = decile;
                std::cout << "  chunk " << done << "/" << total << "\n";
            }
        });
        result.transfer = transfer.run();
        std::cout << "✓ Transfer OK (" << result.transfer.statements << " statements, "
                  << result.transfer.seconds << " s)\n";

        enter(SessionStage::Rebooting);
        std::cout << "[STEP 5] Rebooting badge, waiting " << config_.bootWaitMs / 1000.0
                  << " s for the payload to run...\n";
        repl.softReboot();
        waitForBoot();

        enter(SessionStage::Verifying);
        std::cout << "[STEP 6] Verifying " << spec_.checks.size() << " stored values...\n";
        VerificationDriver verifier(repl, config_.storeModule, config_.patchLogPath);
        result.verification = verifier.verify(spec_);
        if (!result.verification.patchLog.empty())
            std::cout << "  " << config_.patchLogPath << ":\n" << result.verification.patchLog << "\n";
        std::cout << "✓ " << result.verification.checked << " values match\n";

        enter(SessionStage::RebootingToNormal);
        std::cout << "[STEP 7] Rebooting into normal operation...\n";
        repl.softReboot();
        enter(SessionStage::Done);
    }
    catch (const std::exception &)
    {
        fail();
        recover(repl);
        throw;
    }
    return result;
}

// Leave the device bootable whatever went wrong. Never throws.
void FlashSession::recover(RawReplController &repl)
{
    std::cerr << "Failed during " << sessionStageName(failedAt_) << ", rebooting badge...\n";
    try
    {
        // a statement still running only listens for Ctrl-C
        if (repl.state() == ReplState::Executing)
            repl.interrupt();
        repl.softReboot();
    }
    catch (const std::exception &e)
    {
        CV_LOG_WARNING(NULL, "recovery reboot failed: " << e.what());
    }
}

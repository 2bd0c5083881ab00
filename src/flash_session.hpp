#pragma once
#include <functional>
#include <memory>
#include <string>
#include "byte_channel.hpp"
#include "device_locator.hpp"
#include "file_transfer.hpp"
#include "flasher_config.hpp"
#include "verifier.hpp"

enum class SessionStage
{
    Idle,
    Located,
    Interrupted,
    RawMode,
    Transferring,
    Rebooting,
    Verifying,
    RebootingToNormal,
    Done,
    Failed
};

const char* sessionStageName(SessionStage s);

// Opens the link to a located device. Must return an open channel or throw.
typedef std::function<std::unique_ptr<ByteChannel>(const DeviceIdentity &, int baud)> LinkOpener;

// Default opener: SerialTransport on the device path. Throws LinkError.
std::unique_ptr<ByteChannel> openSerialLink(const DeviceIdentity &device, int baud);

struct SessionResult
{
    DeviceIdentity device;
    TransferReport transfer;
    VerificationReport verification;
};

// locate -> interrupt -> raw mode -> transfer -> reboot -> verify -> reboot.
// Any failure aborts the run; once the link is open the device is rebooted
// best-effort before the error propagates. The link lives only inside run().
class FlashSession
{
public:
    FlashSession(const FlasherConfig &config, const TransferPlan &plan, const VerificationSpec &spec,
                 LinkOpener opener = openSerialLink);

    SessionResult run();

    SessionStage stage() const { return stage_; }
    // Stage that was running when the session failed.
    SessionStage failedAt() const { return failedAt_; }

private:
    FlasherConfig config_;
    const TransferPlan &plan_;
    const VerificationSpec &spec_;
    LinkOpener opener_;
    SessionStage stage_;
    SessionStage failedAt_;

    void enter(SessionStage s);
    void fail();
    void recover(RawReplController &repl);
    void waitForBoot() const;
};

#include "raw_repl.hpp"
#include "flash_errors.hpp"
#include "repl_protocol.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

using namespace replcmd;

static void sleepMs(int ms)
{
    if (ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// Control bytes rendered readable for the debug log.
static std::string printable(const std::string &s)
{
    std::string out;
    for (unsigned char c : s)
    {
        if (c == '\r') out += "\\r";
        else if (c == '\n') out += "\\n";
        else if (c < 0x20 || c >= 0x7F)
        {
            static const char hex[] = "0123456789abcdef";
            out += "\\x";
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        }
        else out.push_back(static_cast<char>(c));
    }
    return out;
}

const char* replStateName(ReplState s)
{
    switch (s)
    {
    case ReplState::Running: return "Running";
    case ReplState::Interrupted: return "Interrupted";
    case ReplState::RawMode: return "RawMode";
    case ReplState::Executing: return "Executing";
    case ReplState::Rebooting: return "Rebooting";
    }
    return "?";
}

RawReplController::RawReplController(ByteChannel &link, const ReplTiming &timing)
    : link_(link), timing_(timing), state_(ReplState::Running), executeCount_(0) {}

void RawReplController::send(const std::string &bytes)
{
    CV_LOG_DEBUG(NULL, "tx " << printable(bytes));
    if (!link_.sendBytes(bytes.data(), bytes.size()))
        throw LinkError("serial write failed (" + std::to_string(bytes.size()) + " bytes)");
}

void RawReplController::interrupt()
{
    for (int i = 0; i < std::max(1, timing_.interruptCount); ++i)
    {
        send(std::string(1, CTRL_INTERRUPT));
        sleepMs(timing_.interruptGapMs);
    }
    sleepMs(timing_.settleMs);
    link_.drainInput();
    rx_.clear();
    state_ = ReplState::Interrupted;
}

void RawReplController::enterRawMode()
{
    send(std::string("\r") + CTRL_ENTER_RAW);
    readUntil(RAW_BANNER, timing_.bannerTimeoutMs, "raw REPL banner", [this]()
    {
        // the app may have been mid-init and eaten the first burst
        interrupt();
        send(std::string("\r") + CTRL_ENTER_RAW);
    });
    rx_.clear();
    state_ = ReplState::RawMode;
}

void RawReplController::sendStatement(const std::string &statement)
{
    size_t slice = timing_.writeSlice > 0 ? static_cast<size_t>(timing_.writeSlice) : statement.size();
    for (size_t i = 0; i < statement.size(); i += slice)
    {
        send(statement.substr(i, slice));
        if (i + slice < statement.size())
            sleepMs(timing_.writeGapMs);
    }
    send(std::string(1, CTRL_EXEC));
}

std::string RawReplController::execute(const std::string &statement)
{
    if (state_ != ReplState::RawMode)
        throw FlashError(std::string("execute() needs raw mode, device is ") + replStateName(state_));

    state_ = ReplState::Executing;
    ++executeCount_;
    sendStatement(statement);

    const std::function<void()> noResend;
    std::string junk = readUntil(EXEC_ACK, timing_.execTimeoutMs, "statement acknowledgement", noResend);
    if (!trim(junk).empty())
        CV_LOG_WARNING(NULL, "unexpected bytes before OK: " << printable(junk));
    std::string output = readUntil(END_OF_OUTPUT, timing_.execTimeoutMs, "end of output", noResend);
    std::string error = readUntil(END_OF_EXCEPTION, timing_.execTimeoutMs, "end of exception output", noResend);
    readUntil(RAW_PROMPT, timing_.execTimeoutMs, "raw prompt", noResend);
    state_ = ReplState::RawMode;

    if (!error.empty())
        throw DeviceExecutionError(error);
    return output;
}

void RawReplController::exitRawMode()
{
    send(std::string("\r") + CTRL_EXIT_RAW);
    rx_.clear();
    state_ = ReplState::Interrupted;
}

void RawReplController::softReboot()
{
    exitRawMode();
    sleepMs(timing_.rebootPauseMs);
    send(std::string(1, CTRL_EXEC));
    state_ = ReplState::Rebooting;
}

bool RawReplController::readWindow(const std::string &marker, int timeoutMs, std::string &before)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    uint8_t buf[256];
    for (;;)
    {
        size_t pos = rx_.find(marker);
        if (pos != std::string::npos)
        {
            before = rx_.substr(0, pos);
            rx_.erase(0, pos + marker.size());
            return true;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        int left = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
        int n = link_.readBytes(buf, sizeof(buf), std::min(left, 50));
        if (n < 0)
            throw LinkError("serial read failed");
        if (n > 0)
        {
            std::string chunk(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
            CV_LOG_DEBUG(NULL, "rx " << printable(chunk));
            rx_ += chunk;
        }
    }
}

std::string RawReplController::readUntil(const std::string &marker, int timeoutMs, const std::string &what,
                                         const std::function<void()> &onRetry)
{
    std::string before;
    if (readWindow(marker, timeoutMs, before))
        return before;

    CV_LOG_WARNING(NULL, "no " << what << " after " << timeoutMs << " ms, retrying once");
    if (onRetry)
        onRetry();
    if (readWindow(marker, timeoutMs, before))
        return before;

    std::string partial = rx_;
    rx_.clear();
    throw ProtocolTimeout("timed out waiting for " + what + " (" + std::to_string(timeoutMs) +
                          " ms, retried once)", partial);
}

#pragma once
#include <functional>
#include <string>
#include "byte_channel.hpp"
#include "flasher_config.hpp"

// Interpreter state as seen from the host.
enum class ReplState
{
    Running,      // device runs its application
    Interrupted,  // halted at the friendly prompt
    RawMode,      // accepting raw statements
    Executing,    // statement submitted, response pending
    Rebooting     // soft reset sent, device unresponsive
};

const char* replStateName(ReplState s);

// Drives the MicroPython raw REPL over a ByteChannel. Does not own the channel.
class RawReplController
{
public:
    RawReplController(ByteChannel &link, const ReplTiming &timing);

    // Ctrl-C burst, then discard pending output.
    void interrupt();
    // Ctrl-A, wait for the raw banner. Throws ProtocolTimeout.
    void enterRawMode();
    // Run one statement; returns its stdout. Throws DeviceExecutionError
    // when the device reports an exception, ProtocolTimeout on silence.
    std::string execute(const std::string &statement);
    // Ctrl-B, no response awaited.
    void exitRawMode();
    // Ctrl-B then Ctrl-D at the friendly prompt: restart and run the entry point.
    void softReboot();

    ReplState state() const { return state_; }
    // Statements submitted since construction.
    int executeCount() const { return executeCount_; }

private:
    ByteChannel &link_;
    ReplTiming timing_;
    ReplState state_;
    int executeCount_;
    std::string rx_; // bytes received past the last sentinel

    void send(const std::string &bytes);
    void sendStatement(const std::string &statement);
    // Read until marker; returns what preceded it. One extra window is
    // granted after calling onRetry (may be empty) before ProtocolTimeout.
    std::string readUntil(const std::string &marker, int timeoutMs, const std::string &what,
                          const std::function<void()> &onRetry);
    bool readWindow(const std::string &marker, int timeoutMs, std::string &before);
};

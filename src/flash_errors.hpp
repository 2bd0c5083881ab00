#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// ==================== Flash session errors ====================
// Every stage failure is one of these. main() prints kind() + what().

class FlashError : public std::runtime_error
{
public:
    explicit FlashError(const std::string &msg) : std::runtime_error(msg) {}
    virtual const char* kind() const { return "FlashError"; }
};

class DeviceNotFound : public FlashError
{
public:
    explicit DeviceNotFound(const std::string &msg) : FlashError(msg) {}
    const char* kind() const override { return "DeviceNotFound"; }
};

class AmbiguousDevice : public FlashError
{
public:
    AmbiguousDevice(const std::string &msg, const std::vector<std::string> &candidates)
        : FlashError(msg), candidates_(candidates) {}
    const char* kind() const override { return "AmbiguousDevice"; }
    const std::vector<std::string> &candidates() const { return candidates_; }

private:
    std::vector<std::string> candidates_;
};

// Serial open/write failure.
class LinkError : public FlashError
{
public:
    explicit LinkError(const std::string &msg) : FlashError(msg) {}
    const char* kind() const override { return "LinkError"; }
};

// No sentinel within the read window (after the single retry).
class ProtocolTimeout : public FlashError
{
public:
    ProtocolTimeout(const std::string &msg, const std::string &partial)
        : FlashError(msg), partial_(partial) {}
    const char* kind() const override { return "ProtocolTimeout"; }
    // Bytes received before giving up.
    const std::string &partial() const { return partial_; }

private:
    std::string partial_;
};

// The device raised while running a submitted statement.
class DeviceExecutionError : public FlashError
{
public:
    explicit DeviceExecutionError(const std::string &deviceText)
        : FlashError("device raised:\n" + deviceText), text_(deviceText) {}
    const char* kind() const override { return "DeviceExecutionError"; }
    const std::string &text() const { return text_; }

private:
    std::string text_;
};

struct Mismatch
{
    std::string ns;
    std::string key;
    std::string expected;
    std::string actual;
};

class VerificationFailed : public FlashError
{
public:
    explicit VerificationFailed(const std::vector<Mismatch> &mismatches)
        : FlashError(describe(mismatches)), mismatches_(mismatches) {}
    const char* kind() const override { return "VerificationFailed"; }
    const std::vector<Mismatch> &mismatches() const { return mismatches_; }

private:
    std::vector<Mismatch> mismatches_;

    static std::string describe(const std::vector<Mismatch> &mismatches)
    {
        std::string s = std::to_string(mismatches.size()) + " value(s) differ:";
        for (const auto &m : mismatches)
            s += "\n  " + m.ns + "/" + m.key + ": expected " + m.expected + ", got " + m.actual;
        return s;
    }
};

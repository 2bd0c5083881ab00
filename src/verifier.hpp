#pragma once
#include <string>
#include <vector>
#include "flash_errors.hpp"
#include "raw_repl.hpp"

enum class ValueKind
{
    Integer,  // get_int32, numeric equality
    Text,     // get_string, exact equality
    Count     // get_string, number of comma-separated entries
};

struct Expectation
{
    std::string ns;        // store namespace
    std::string key;       // "ws" or composite "pl:lvl"
    ValueKind kind = ValueKind::Integer;
    std::string expected;
};

struct VerificationSpec
{
    std::vector<Expectation> checks;
};

// Reads a FileStorage document:
//   checks:
//     - { namespace: "write", key: "pl:lvl", expected: 99 }
//     - { namespace: "write", key: "ach", type: "count", expected: 14 }
// type defaults to int for numeric expectations and str otherwise.
// Throws std::runtime_error on a missing or malformed file.
VerificationSpec loadVerificationSpec(const std::string &path);

bool valuesMatch(const Expectation &e, const std::string &actual);

struct VerificationReport
{
    size_t checked = 0;
    std::string patchLog;
};

// Post-reboot read-back of the device key/value store.
class VerificationDriver
{
public:
    // patchLogPath empty: skip the payload log check.
    VerificationDriver(RawReplController &repl, const std::string &storeModule,
                       const std::string &patchLogPath);

    // Interrupts the rebooted app, enters raw mode, checks every entry.
    // Throws VerificationFailed listing all mismatches; on success leaves
    // raw mode so the app resumes.
    VerificationReport verify(const VerificationSpec &spec);

private:
    RawReplController &repl_;
    std::string storeModule_;
    std::string patchLogPath_;

    void checkPatchLog(VerificationReport &report, std::vector<Mismatch> &mismatches);
};

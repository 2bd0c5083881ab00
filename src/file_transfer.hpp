#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "raw_repl.hpp"

// What to write where. Built before the session, immutable afterwards.
struct TransferPlan
{
    std::string destPath;
    std::vector<uint8_t> payload;
    int chunkBytes = 192;       // raw payload bytes per write statement
    int maxLineBytes = 1024;    // device input-line limit
    bool atomic = true;         // stage in destPath + ".tmp", rename on commit

    std::string stagedPath() const { return atomic ? destPath + ".tmp" : destPath; }
    size_t chunkCount() const;
    // Length of a write statement carrying one full chunk.
    size_t writeStatementLength() const;
    // Throws std::invalid_argument if the plan cannot be sent safely.
    void validate() const;
};

struct TransferReport
{
    size_t bytes = 0;
    size_t chunks = 0;
    int statements = 0;
    double seconds = 0.0;
};

// Streams a payload into a device file through raw REPL statements:
// one open, one write per chunk, one close/commit. Strictly sequential.
class ChunkedTransfer
{
public:
    typedef std::function<void(size_t chunksDone, size_t chunksTotal)> Progress;

    ChunkedTransfer(RawReplController &repl, const TransferPlan &plan);

    void setProgress(const Progress &cb) { progress_ = cb; }

    // Device must be in raw mode. On failure the half-written file is
    // closed (and the staged copy removed) best-effort, then the error
    // is rethrown.
    TransferReport run();

    static const char* const HANDLE;

private:
    RawReplController &repl_;
    const TransferPlan &plan_;
    Progress progress_;

    void abortWrite();
};

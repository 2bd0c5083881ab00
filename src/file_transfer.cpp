#include "file_transfer.hpp"
#include "base64.hpp"
#include "flash_errors.hpp"
#include "repl_protocol.hpp"
#include <opencv2/core/utility.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <stdexcept>

const char* const ChunkedTransfer::HANDLE = "_bf";

size_t TransferPlan::chunkCount() const
{
    if (chunkBytes <= 0)
        return 0;
    size_t n = static_cast<size_t>(chunkBytes);
    return (payload.size() + n - 1) / n;
}

size_t TransferPlan::writeStatementLength() const
{
    size_t chunk = static_cast<size_t>(std::max(chunkBytes, 0));
    return replcmd::buildWriteChunk(ChunkedTransfer::HANDLE, "").size() + codec::base64Length(chunk);
}

void TransferPlan::validate() const
{
    if (destPath.empty() || destPath[0] != '/')
        throw std::invalid_argument("destination must be an absolute device path, got '" + destPath + "'");
    if (chunkBytes <= 0)
        throw std::invalid_argument("chunk size must be positive");
    size_t line = writeStatementLength();
    if (maxLineBytes > 0 && line >= static_cast<size_t>(maxLineBytes))
        throw std::invalid_argument("chunk of " + std::to_string(chunkBytes) + " bytes encodes to a " +
                                    std::to_string(line) + "-byte statement, device limit is " +
                                    std::to_string(maxLineBytes));
}

ChunkedTransfer::ChunkedTransfer(RawReplController &repl, const TransferPlan &plan)
    : repl_(repl), plan_(plan) {}

TransferReport ChunkedTransfer::run()
{
    plan_.validate();

    TransferReport report;
    report.bytes = plan_.payload.size();
    const size_t total = plan_.chunkCount();
    const size_t step = static_cast<size_t>(plan_.chunkBytes);
    const std::string staged = plan_.stagedPath();
    const int before = repl_.executeCount();

    cv::TickMeter tm;
    tm.start();

    repl_.execute(replcmd::buildOpenForWrite(HANDLE, staged));
    try
    {
        for (size_t i = 0; i < total; ++i)
        {
            size_t off = i * step;
            size_t len = std::min(step, plan_.payload.size() - off);
            std::string b64 = codec::base64Encode(plan_.payload.data() + off, len);
            repl_.execute(replcmd::buildWriteChunk(HANDLE, b64));
            report.chunks = i + 1;
            if (progress_)
                progress_(report.chunks, total);
        }
        repl_.execute(replcmd::buildCloseAndCommit(HANDLE, staged, plan_.destPath));
    }
    catch (const FlashError &e)
    {
        CV_LOG_WARNING(NULL, "transfer aborted after " << report.chunks << "/" << total << " chunks: " << e.what());
        abortWrite();
        throw;
    }

    tm.stop();
    report.seconds = tm.getTimeSec();
    report.statements = repl_.executeCount() - before;
    return report;
}

void ChunkedTransfer::abortWrite()
{
    // a timed-out device is not in raw mode any more; nothing to clean up
    if (repl_.state() != ReplState::RawMode)
        return;
    std::string staged = plan_.atomic ? plan_.stagedPath() : std::string();
    try
    {
        repl_.execute(replcmd::buildAbortWrite(HANDLE, staged));
    }
    catch (const FlashError &e)
    {
        CV_LOG_WARNING(NULL, "cleanup after failed transfer also failed: " << e.what());
    }
    if (!plan_.atomic)
        CV_LOG_WARNING(NULL, plan_.destPath << " is partially written and must not be booted");
}

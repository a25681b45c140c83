#include <algorithm>

#include <relay/common/logging.h>
#include <relay/transfer/percentage.h>
#include <relay/transfer/progress_logger.h>

namespace relay
{
namespace transfer
{

ProgressLogger::ProgressLogger(const std::string& transferID,
                               common::Logger& logger,
                               std::uint32_t percentStep,
                               std::uint64_t byteStep)
  : mByteStep(std::max<std::uint64_t>(byteStep, 1))
  , mLogged(0)
  , mLogger(logger)
  , mNext(0)
  , mPercentStep(std::max<std::uint32_t>(percentStep, 1))
  , mTransferID(transferID)
{
}

std::uint64_t ProgressLogger::logged() const
{
    return mLogged;
}

void ProgressLogger::progress(std::uint64_t bytesTransferred,
                              std::uint64_t totalBytes)
{
    auto bytes = static_cast<unsigned long long>(bytesTransferred);

    if (!totalBytes)
    {
        if (bytesTransferred < mNext || !bytesTransferred)
            return;

        mNext = (bytesTransferred / mByteStep + 1) * mByteStep;

        ++mLogged;

        LogInfoF(mLogger,
                 "Transfer %s: %llu bytes transferred",
                 mTransferID.c_str(),
                 bytes);

        return;
    }

    auto percent = percentage(bytesTransferred, totalBytes);

    if (percent < mNext || !percent)
        return;

    mNext = (percent / mPercentStep + 1) * mPercentStep;

    ++mLogged;

    LogInfoF(mLogger,
             "Transfer %s: %u%% (%llu of %llu bytes)",
             mTransferID.c_str(),
             percent,
             bytes,
             static_cast<unsigned long long>(totalBytes));
}

} // transfer
} // relay


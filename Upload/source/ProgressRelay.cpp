#include "ProgressRelay.hpp"

#include <spdlog/spdlog.h>

void EmitProgress(ProgressChannel* channel, std::uint64_t bytes_sent, std::uint64_t bytes_total) noexcept
{
    if (!channel)
        return;

    try {
        if (!channel->TrySend(UploadProgress{ bytes_sent, bytes_total }))
            spdlog::trace("progress update dropped: {}/{}", bytes_sent, bytes_total);
    }
    catch (const std::exception& e) {
        spdlog::trace("progress update dropped: {}", e.what());
    }
}

ProgressRelay::ProgressRelay(Observer observer, std::size_t capacity)
    : channel_(capacity)
    , observer_(std::move(observer))
    , consumer_(&ProgressRelay::Consume, this)
{
}

ProgressRelay::~ProgressRelay()
{
    Close();
}

ProgressChannel& ProgressRelay::GetChannel() noexcept
{
    return channel_;
}

void ProgressRelay::Close()
{
    channel_.Close();

    if (consumer_.joinable())
        consumer_.join();
}

void ProgressRelay::Consume()
{
    while (auto progress = channel_.Receive()) {
        if (!observer_)
            continue;

        try {
            observer_(*progress);
        }
        catch (const std::exception& e) {
            spdlog::warn("progress observer failed: {}", e.what());
        }
    }
}

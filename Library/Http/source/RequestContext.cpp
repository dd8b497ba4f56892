#include "RequestContext.hpp"

void RequestContext::SetDeadline(Clock::time_point deadline) noexcept
{
    deadline_ = deadline;
}

void RequestContext::SetTimeout(std::chrono::milliseconds timeout) noexcept
{
    SetDeadline(Clock::now() + timeout);
}

std::optional<std::chrono::milliseconds> RequestContext::Remaining() const noexcept
{
    if (!deadline_)
        return std::nullopt;

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    if (left.count() < 0)
        return std::chrono::milliseconds(0);

    return left;
}

bool RequestContext::IsExpired() const noexcept
{
    return deadline_ && Clock::now() >= *deadline_;
}

void RequestContext::TryCancel() noexcept
{
    cancelled_.store(true, std::memory_order_relaxed);
}

bool RequestContext::IsCancelled() const noexcept
{
    return cancelled_.load(std::memory_order_relaxed);
}

bool RequestContext::ShouldAbort() const noexcept
{
    return IsCancelled() || IsExpired();
}

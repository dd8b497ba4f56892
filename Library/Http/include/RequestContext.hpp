#pragma once

#include <atomic>
#include <chrono>
#include <optional>

// Per-operation call settings shared by every request of one upload.
//
// TryCancel() may be called from any thread (including a signal handler);
// requests in flight notice it from their progress callback.
class RequestContext
{
public:
	using Clock = std::chrono::steady_clock;

public:
	RequestContext() = default;

	RequestContext(const RequestContext&) = delete;
	RequestContext& operator=(const RequestContext&) = delete;

public:
	void SetDeadline(Clock::time_point deadline) noexcept;
	void SetTimeout(std::chrono::milliseconds timeout) noexcept;

	// Time left before the deadline, or nullopt if there is none.
	std::optional<std::chrono::milliseconds> Remaining() const noexcept;
	bool IsExpired() const noexcept;

	void TryCancel() noexcept;
	bool IsCancelled() const noexcept;

	bool ShouldAbort() const noexcept;

private:
	std::optional<Clock::time_point> deadline_;
	std::atomic<bool> cancelled_{false};
};

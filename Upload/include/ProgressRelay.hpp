#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>

#include "BoundedChannel.hpp"
#include "UploadTypes.hpp"

using ProgressChannel = BoundedChannel<UploadProgress>;

// Best-effort progress emission; a full channel drops the update.
void EmitProgress(ProgressChannel* channel, std::uint64_t bytes_sent, std::uint64_t bytes_total) noexcept;

// Owns a progress channel and the thread that drains it into an observer.
class ProgressRelay final
{
public:
	using Observer = std::function<void(const UploadProgress&)>;

public:
	explicit ProgressRelay(Observer observer, std::size_t capacity = UploadPolicy{}.progress_capacity);
	~ProgressRelay();

	ProgressRelay(const ProgressRelay&) = delete;
	ProgressRelay& operator=(const ProgressRelay&) = delete;

public:
	ProgressChannel& GetChannel() noexcept;

	// Closes the channel and waits until every queued update was observed.
	void Close();

private:
	void Consume();

private:
	ProgressChannel channel_;
	Observer observer_;
	std::thread consumer_;
};

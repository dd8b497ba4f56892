#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Fixed-capacity queue between one producer and one consumer.
//
// The producer side never blocks: TrySend() drops the value when the queue is
// full or closed. Receive() blocks until a value arrives or the channel is
// closed and drained.
template <typename T>
class BoundedChannel
{
public:
	explicit BoundedChannel(std::size_t capacity)
		: capacity_(capacity == 0 ? 1 : capacity) { }

	BoundedChannel(const BoundedChannel&) = delete;
	BoundedChannel& operator=(const BoundedChannel&) = delete;

public:
	bool TrySend(T value)
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (closed_ || queue_.size() >= capacity_)
				return false;

			queue_.push_back(std::move(value));
		}

		cv_.notify_one();
		return true;
	}

	std::optional<T> Receive()
	{
		std::unique_lock<std::mutex> lock(mutex_);
		cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });

		if (queue_.empty())
			return std::nullopt;

		T value = std::move(queue_.front());
		queue_.pop_front();

		return value;
	}

	void Close()
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			closed_ = true;
		}

		cv_.notify_all();
	}

	bool IsClosed() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return closed_;
	}

	std::size_t Size() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return queue_.size();
	}

	std::size_t Capacity() const noexcept
	{
		return capacity_;
	}

private:
	const std::size_t capacity_;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<T> queue_;
	bool closed_ = false;
};

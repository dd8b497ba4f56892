#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <tuple>

#include "stream.pb.h"

#include "AccountApi.hpp"
#include "RequestContext.hpp"
#include "UploadError.hpp"

// Re-reads a video until it can be streamed.
//
// Stops on readyToStream, on the "error" state (reported as a failure), on
// cancellation, or when the attempt budget runs out; the last record read is
// returned in every case.
class StatusPoller
{
public:
	using Observer = std::function<void(const Video&)>;
	using Sleeper = std::function<void(std::chrono::milliseconds)>;

	struct Options {
		int max_attempts = 60;
		std::chrono::milliseconds interval = std::chrono::seconds(5);
	};

public:
	explicit StatusPoller(AccountApi& api);
	StatusPoller(AccountApi& api, Options options, Sleeper sleeper);

public:
	std::tuple<bool, Video, UploadError> WaitUntilReady(const std::string& resource_id,
							    const RequestContext& context,
							    const Observer& observer = Observer{});

private:
	AccountApi& api_;
	const Options options_;
	Sleeper sleeper_;
};

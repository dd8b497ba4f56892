#include "StatusPoller.hpp"

#include <thread>

#include <spdlog/spdlog.h>

#include "VideoRecord.hpp"

StatusPoller::StatusPoller(AccountApi& api)
    : StatusPoller(api, Options{}, [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
{
}

StatusPoller::StatusPoller(AccountApi& api, Options options, Sleeper sleeper)
    : api_(api)
    , options_(options)
    , sleeper_(std::move(sleeper))
{
}

std::tuple<bool, Video, UploadError>
StatusPoller::WaitUntilReady(const std::string& resource_id, const RequestContext& context, const Observer& observer)
{
    Video last;

    for (int attempt = 0; attempt < options_.max_attempts; attempt++) {
        if (attempt > 0 && sleeper_)
            sleeper_(options_.interval);

        if (context.IsCancelled())
            return { false, last, MakeTransportFailure(-1, "status polling cancelled") };

        auto [ok, video, err] = api_.GetResource(resource_id, context);
        if (!ok)
            return { false, last, err };

        last = std::move(video);
        if (observer)
            observer(last);

        if (last.ready_to_stream())
            return { true, last, UploadError{} };

        if (last.status().state() == "error")
            return { false, last, MakeTransportFailure(-1, "video processing failed: " + VideoStatusDetails(last)) };

        spdlog::debug("video {} not ready yet (attempt {}/{})", resource_id, attempt + 1, options_.max_attempts);
    }

    spdlog::info("video {} is still processing after {} checks", resource_id, options_.max_attempts);

    return { true, last, UploadError{} };
}

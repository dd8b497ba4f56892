#include "UploadOrchestrator.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "fmt/core.h"

#include "ChunkReader.hpp"
#include "ResumableUploader.hpp"
#include "SingleShotUploader.hpp"

namespace fs = std::filesystem;

UploadOrchestrator::UploadOrchestrator(AccountApi& api, HttpTransport& transport, UploadPolicy policy)
    : api_(api)
    , transport_(transport)
    , policy_(std::move(policy))
{
}

std::tuple<bool, Video, UploadError>
UploadOrchestrator::Upload(const fs::path& path, const UploadOptions& options,
                           ProgressChannel* progress, const RequestContext& context)
{
    auto [opened, source, serr] = OpenSource(path);
    if (!opened)
        return { false, Video{}, serr };

    const TransportStrategy strategy = SelectTransportStrategy(source.size, policy_);
    spdlog::info("uploading {} ({} bytes) using {}", source.path.string(), source.size,
                 TransportStrategyToString(strategy));

    std::tuple<bool, std::string, UploadError> result;
    switch (strategy) {
    case TransportStrategy::SingleShotMultipart:
        result = UploadSingleShot(source, options, progress, context);
        break;
    case TransportStrategy::ResumableSession:
        result = UploadResumable(source, options, progress, context);
        break;
    }

    auto& [uploaded, resource_id, uerr] = result;
    if (!uploaded)
        return { false, Video{}, uerr };

    spdlog::info("upload finished, fetching video {}", resource_id);

    auto [fetched, video, ferr] = api_.GetResource(resource_id, context);
    if (!fetched)
        return { false, Video{}, ferr };

    return { true, std::move(video), UploadError{} };
}

std::tuple<bool, UploadSource, UploadError> UploadOrchestrator::OpenSource(const fs::path& path) const
{
    if (path.empty())
        return { false, UploadSource{}, MakeInvalidInput("file path cannot be empty") };

    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        return { false, UploadSource{}, MakeInvalidInput("file not found: " + path.string()) };

    if (!fs::is_regular_file(status))
        return { false, UploadSource{}, MakeInvalidInput("not a regular file: " + path.string()) };

    FileStream file(path);
    if (auto err = file.Open(std::ios::binary | std::ios::in))
        return { false, UploadSource{}, MakeInvalidInput("failed to open file: " + err->message) };

    auto [ok, size, err] = file.Size();
    if (auto cerr = file.Close())
        spdlog::warn("failed to close {}: {}", path.string(), cerr->message);

    if (!ok)
        return { false, UploadSource{}, MakeInvalidInput("failed to get file info: " + err.message) };

    if (size == 0)
        return { false, UploadSource{}, MakeInvalidInput("file is empty: " + path.string()) };

    return { true, UploadSource{ path, size }, UploadError{} };
}

std::tuple<bool, std::string, UploadError>
UploadOrchestrator::UploadSingleShot(const UploadSource& source, const UploadOptions& options,
                                     ProgressChannel* progress, const RequestContext& context)
{
    DirectUploadOptions direct;
    direct.max_duration_seconds = policy_.max_duration_seconds;
    direct.require_signed_urls = options.require_signed_urls;
    direct.name = options.name;
    direct.metadata = options.metadata;

    auto [ok, target, derr] = api_.GetDirectUploadURL(direct, context);
    if (!ok)
        return { false, std::string{}, derr };

    spdlog::debug("direct upload URL created for video {}", target.resource_id);

    ChunkReader reader(source.path, policy_.stream_buffer_size);
    if (auto err = reader.Open())
        return { false, std::string{}, MakeInvalidInput("failed to open file: " + err->message) };

    SingleShotUploader uploader(transport_);
    auto uerr = uploader.Upload(target.upload_url, reader, source, progress, context);

    if (auto cerr = reader.Close())
        spdlog::warn("failed to close {}: {}", source.path.string(), cerr->message);

    if (uerr)
        return { false, std::string{}, *uerr };

    return { true, target.resource_id, UploadError{} };
}

std::tuple<bool, std::string, UploadError>
UploadOrchestrator::UploadResumable(const UploadSource& source, const UploadOptions& options,
                                    ProgressChannel* progress, const RequestContext& context)
{
    ChunkReader reader(source.path, policy_.chunk_size);
    if (auto err = reader.Open())
        return { false, std::string{}, MakeInvalidInput("failed to open file: " + err->message) };

    ResumableUploader uploader(api_);
    auto result = uploader.Upload(reader, source, options, progress, context);

    if (auto cerr = reader.Close())
        spdlog::warn("failed to close {}: {}", source.path.string(), cerr->message);

    if (!std::get<0>(result) && uploader.GetSession())
        spdlog::warn("upload session {} stopped at offset {} of {} bytes ({})",
                     uploader.GetSession()->upload_url, uploader.GetOffset(), source.size,
                     ResumableStateToString(uploader.GetState()));

    return result;
}

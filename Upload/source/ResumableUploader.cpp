#include "ResumableUploader.hpp"

#include <spdlog/spdlog.h>

#include "fmt/core.h"

ResumableUploader::ResumableUploader(AccountApi& api)
    : api_(api)
{
}

ResumableUploader::State ResumableUploader::GetState() const noexcept
{
    return state_;
}

const std::optional<Session>& ResumableUploader::GetSession() const noexcept
{
    return session_;
}

std::uint64_t ResumableUploader::GetOffset() const noexcept
{
    return offset_;
}

std::tuple<bool, std::string, UploadError>
ResumableUploader::Upload(ChunkReader& reader, const UploadSource& source, const UploadOptions& options,
                          ProgressChannel* progress, const RequestContext& context)
{
    if (state_ != State::Unopened)
        return { false, std::string{}, MakeInvalidInput("uploader was already used for a session") };

    if (reader.GetOffset() != 0)
        return { false, std::string{}, MakeInvalidInput("a new session must start at offset 0") };

    auto [ok, session, err] = api_.OpenUploadSession(source.size, options, context);
    if (!ok)
        return { false, std::string{}, err };

    if (session.resource_id.empty() || session.upload_url.empty())
        return { false, std::string{}, MakeProtocolViolation("session has no resource id or upload URL") };

    spdlog::info("upload session opened: id={} url={}", session.resource_id, session.upload_url);

    session_ = std::move(session);
    offset_ = 0;
    state_ = State::Opened;

    if (auto cerr = SendChunks(reader, source, progress, context))
        return { false, std::string{}, *cerr };

    return { true, session_->resource_id, UploadError{} };
}

std::tuple<bool, std::string, UploadError>
ResumableUploader::Resume(const Session& session, std::uint64_t offset, ChunkReader& reader,
                          const UploadSource& source, ProgressChannel* progress, const RequestContext& context)
{
    if (state_ == State::Complete)
        return { false, std::string{}, MakeInvalidInput("upload already complete") };

    if (session.resource_id.empty() || session.upload_url.empty())
        return { false, std::string{}, MakeInvalidInput("session has no resource id or upload URL") };

    if (offset > source.size)
        return { false, std::string{}, MakeInvalidInput(fmt::format("offset {} is beyond the file size {}", offset, source.size)) };

    if (reader.GetOffset() != offset)
        return { false, std::string{}, MakeInvalidInput(fmt::format("reader starts at {} but the session continues at {}",
                                                                    reader.GetOffset(), offset)) };

    spdlog::info("resuming upload session {} at offset {}", session.resource_id, offset);

    session_ = session;
    offset_ = offset;
    state_ = State::Opened;

    if (auto cerr = SendChunks(reader, source, progress, context))
        return { false, std::string{}, *cerr };

    return { true, session_->resource_id, UploadError{} };
}

std::optional<UploadError> ResumableUploader::SendChunks(ChunkReader& reader, const UploadSource& source,
                                                         ProgressChannel* progress, const RequestContext& context)
{
    while (true) {
        auto [ok, chunk, rerr] = reader.Next();
        if (!ok)
            return MakeTransportFailure(rerr.code, fmt::format("failed to read {}: {}", reader.GetPath().string(), rerr.message));

        if (chunk.empty())
            break;

        if (offset_ + chunk.size() > source.size)
            return MakeInvalidInput(fmt::format("file grew during upload beyond {} bytes", source.size));

        if (auto err = api_.SendChunk(*session_, offset_, chunk, context)) {
            spdlog::debug("chunk at offset {} ({} bytes) rejected", offset_, chunk.size());
            return err;
        }

        offset_ += chunk.size();
        spdlog::debug("chunk acknowledged: {}/{} bytes", offset_, source.size);

        EmitProgress(progress, offset_, source.size);
    }

    if (offset_ != source.size)
        return MakeInvalidInput(fmt::format("file size changed during upload: expected {} bytes, sent {}",
                                            source.size, offset_));

    state_ = State::Complete;

    return std::nullopt;
}

const char* ResumableStateToString(ResumableUploader::State state) noexcept
{
    switch (state) {
    case ResumableUploader::State::Unopened: return "unopened";
    case ResumableUploader::State::Opened:   return "opened";
    case ResumableUploader::State::Complete: return "complete";
    }

    return "unknown";
}

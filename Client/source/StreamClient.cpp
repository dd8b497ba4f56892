#include "StreamClient.hpp"

#include <chrono>

#include <google/protobuf/util/time_util.h>
#include <google/protobuf/struct.pb.h>
#include <spdlog/spdlog.h>

#include "fmt/core.h"

#include "Codec.hpp"
#include "JsonCodec.hpp"
#include "SessionLocation.hpp"

namespace {
	// tus metadata keys can't contain spaces or commas
	bool IsValidMetadataKey(std::string_view key)
	{
		if (key.empty())
			return false;

		for (char c : key)
			if (c == ' ' || c == ',' || c == '\t' || c == '\r' || c == '\n')
				return false;

		return true;
	}

	template <typename Envelope>
	std::optional<UploadError> DecodeEnvelope(std::string_view what, const HttpResponse& response, Envelope* envelope)
	{
		if (auto err = JsonToMessage(response.body, envelope))
			return MakeProtocolViolation(fmt::format("{}: failed to parse response: {}", what, *err));

		if (!envelope->success()) {
			if (envelope->errors_size() > 0)
				return MakeTransportFailure(envelope->errors(0).code(),
							    fmt::format("{}: API error: {}", what, envelope->errors(0).message()));

			return MakeTransportFailure(static_cast<int>(response.status), fmt::format("{}: API request failed", what));
		}

		return std::nullopt;
	}

	void FillMeta(google::protobuf::Struct* meta, const std::string& name,
		      const std::map<std::string, std::string>& metadata)
	{
		auto& fields = *meta->mutable_fields();
		for (const auto& [key, value] : metadata)
			fields[key].set_string_value(value);

		if (!name.empty())
			fields["name"].set_string_value(name);
	}
}

StreamClient::StreamClient(HttpTransport& transport, std::string account_id, std::string api_token,
                           std::string base_url)
    : transport_(transport)
    , account_id_(std::move(account_id))
    , api_token_(std::move(api_token))
    , base_url_(std::move(base_url))
{
}

bool StreamClient::IsValid() const noexcept
{
    return !account_id_.empty() && !api_token_.empty() && !base_url_.empty();
}

std::string StreamClient::StreamUrl() const
{
    std::string base = base_url_;
    while (!base.empty() && base.back() == '/')
        base.pop_back();

    return fmt::format("{}/accounts/{}/stream", base, account_id_);
}

HttpRequest StreamClient::MakeRequest(std::string method, std::string url) const
{
    HttpRequest request;
    request.method = std::move(method);
    request.url = std::move(url);
    request.AddHeader("Authorization", "Bearer " + api_token_);

    return request;
}

std::tuple<bool, Session, UploadError>
StreamClient::OpenUploadSession(std::uint64_t total_bytes, const UploadOptions& options, const RequestContext& context)
{
    if (total_bytes == 0)
        return { false, Session{}, MakeInvalidInput("upload length must be positive") };

    HttpRequest request = MakeRequest("POST", StreamUrl());
    request.AddHeader("Tus-Resumable", kTusVersion);
    request.AddHeader("Upload-Length", std::to_string(total_bytes));

    const std::string metadata = BuildUploadMetadata(options);
    if (!metadata.empty())
        request.AddHeader("Upload-Metadata", metadata);

    auto [ok, response, err] = transport_.Perform(request, context);
    if (!ok)
        return { false, Session{}, MakeTransportFailure("failed to initiate upload session", err) };

    if (response.status != 201)
        return { false, Session{}, MakeStatusError("upload session initiation", response) };

    const auto location = response.GetHeader("Location");
    if (!location)
        return { false, Session{}, MakeProtocolViolation("upload session location not returned") };

    return ParseSessionLocation(*location, request.url);
}

std::optional<UploadError>
StreamClient::SendChunk(const Session& session, std::uint64_t offset, std::string_view bytes,
                        const RequestContext& context)
{
    if (session.upload_url.empty())
        return MakeInvalidInput("session has no upload URL");

    HttpRequest request = MakeRequest("PATCH", session.upload_url);
    request.AddHeader("Tus-Resumable", kTusVersion);
    request.AddHeader("Upload-Offset", std::to_string(offset));
    request.AddHeader("Content-Type", "application/offset+octet-stream");
    request.AddHeader("Content-Length", std::to_string(bytes.size()));

    MemoryBody body(bytes);
    request.source = &body;

    auto [ok, response, err] = transport_.Perform(request, context);
    if (!ok)
        return MakeTransportFailure(fmt::format("chunk upload at offset {} failed", offset), err);

    if (response.status != 204)
        return MakeStatusError(fmt::format("chunk upload at offset {}", offset), response);

    return std::nullopt;
}

std::tuple<bool, DirectUpload, UploadError>
StreamClient::GetDirectUploadURL(const DirectUploadOptions& options, const RequestContext& context)
{
    using google::protobuf::util::TimeUtil;

    DirectUploadRequest body;
    if (options.max_duration_seconds > 0)
        body.set_max_duration_seconds(options.max_duration_seconds);
    body.set_require_signed_urls(options.require_signed_urls);

    if (!options.name.empty() || !options.metadata.empty())
        FillMeta(body.mutable_meta(), options.name, options.metadata);

    if (options.expiry) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(options.expiry->time_since_epoch());
        *body.mutable_expiry() = TimeUtil::SecondsToTimestamp(seconds.count());
    }

    auto [encoded, json, jerr] = MessageToJson(body);
    if (!encoded)
        return { false, DirectUpload{}, MakeInvalidInput("failed to encode request body: " + jerr) };

    HttpRequest request = MakeRequest("POST", StreamUrl() + "/direct_upload");
    request.AddHeader("Content-Type", "application/json");
    request.body = std::move(json);

    auto [ok, response, err] = transport_.Perform(request, context);
    if (!ok)
        return { false, DirectUpload{}, MakeTransportFailure("failed to create direct upload URL", err) };

    if (response.status != 200)
        return { false, DirectUpload{}, MakeStatusError("direct upload", response) };

    DirectUploadEnvelope envelope;
    if (auto derr = DecodeEnvelope("direct upload", response, &envelope))
        return { false, DirectUpload{}, *derr };

    const DirectUploadResult& result = envelope.result();
    if (result.uid().empty() || result.upload_url().empty())
        return { false, DirectUpload{}, MakeProtocolViolation("direct upload response has no uid or uploadURL") };

    DirectUpload upload{ result.uid(), result.upload_url(), std::nullopt };
    if (result.has_expiry())
        upload.expiry = std::chrono::system_clock::time_point(
            std::chrono::seconds(TimeUtil::TimestampToSeconds(result.expiry())));
    else if (options.expiry)
        upload.expiry = options.expiry;

    return { true, std::move(upload), UploadError{} };
}

std::tuple<bool, Video, UploadError>
StreamClient::GetResource(const std::string& resource_id, const RequestContext& context)
{
    if (resource_id.empty())
        return { false, Video{}, MakeInvalidInput("video ID cannot be empty") };

    HttpRequest request = MakeRequest("GET", StreamUrl() + "/" + resource_id);

    auto [ok, response, err] = transport_.Perform(request, context);
    if (!ok)
        return { false, Video{}, MakeTransportFailure("failed to get video details", err) };

    if (response.status != 200)
        return { false, Video{}, MakeStatusError("get video", response) };

    VideoEnvelope envelope;
    if (auto derr = DecodeEnvelope("get video", response, &envelope))
        return { false, Video{}, *derr };

    if (envelope.result().uid().empty())
        return { false, Video{}, MakeProtocolViolation("video response has no uid") };

    spdlog::debug("video {}: state={} ready={}", envelope.result().uid(),
                  envelope.result().status().state(), envelope.result().ready_to_stream());

    return { true, envelope.result(), UploadError{} };
}

std::string BuildUploadMetadata(const UploadOptions& options)
{
    std::string out;
    auto append = [&out](std::string_view key, std::string_view value) {
        if (!out.empty())
            out += ",";
        out += key;
        if (!value.empty()) {
            out += " ";
            out += Codec::Base64Encode(value);
        }
    };

    if (!options.name.empty())
        append("name", options.name);

    for (const auto& [key, value] : options.metadata) {
        if (key == "name" && !options.name.empty())
            continue;

        if (!IsValidMetadataKey(key)) {
            spdlog::warn("skipping upload metadata key '{}': not a valid tus key", key);
            continue;
        }

        append(key, value);
    }

    if (options.require_signed_urls)
        append("requiresignedurls", "");

    return out;
}

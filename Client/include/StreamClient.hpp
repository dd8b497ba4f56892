#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "stream.pb.h"

#include "AccountApi.hpp"
#include "HttpTransport.hpp"

// Account API of a Cloudflare Stream style service over HTTP.
//
// Resumable sessions follow tus 1.0.0; everything else uses the JSON API at
// {base_url}/accounts/{account_id}/stream.
class StreamClient final : public AccountApi
{
public:
	static constexpr const char* kDefaultBaseUrl = "https://api.cloudflare.com/client/v4";
	static constexpr const char* kTusVersion = "1.0.0";

public:
	StreamClient(HttpTransport& transport, std::string account_id, std::string api_token,
		     std::string base_url = kDefaultBaseUrl);

public:
	bool IsValid() const noexcept;

	std::tuple<bool, Session, UploadError> OpenUploadSession(std::uint64_t total_bytes,
								 const UploadOptions& options,
								 const RequestContext& context) override;

	std::optional<UploadError> SendChunk(const Session& session, std::uint64_t offset,
					     std::string_view bytes, const RequestContext& context) override;

	std::tuple<bool, DirectUpload, UploadError> GetDirectUploadURL(const DirectUploadOptions& options,
								       const RequestContext& context) override;

	std::tuple<bool, Video, UploadError> GetResource(const std::string& resource_id,
							 const RequestContext& context) override;

private:
	std::string StreamUrl() const;
	HttpRequest MakeRequest(std::string method, std::string url) const;

private:
	HttpTransport& transport_;

	const std::string account_id_;
	const std::string api_token_;
	const std::string base_url_;
};

// tus Upload-Metadata header value: comma-separated "key base64(value)" pairs.
std::string BuildUploadMetadata(const UploadOptions& options);

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "stream.pb.h"

#include "RequestContext.hpp"
#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Remote account operations the upload engine depends on.
class AccountApi
{
public:
	virtual ~AccountApi() = default;

public:
	// Creates a resumable session declaring the full length up front.
	virtual std::tuple<bool, Session, UploadError> OpenUploadSession(std::uint64_t total_bytes,
									 const UploadOptions& options,
									 const RequestContext& context) = 0;

	// Appends bytes to the session at `offset`.
	virtual std::optional<UploadError> SendChunk(const Session& session, std::uint64_t offset,
						     std::string_view bytes, const RequestContext& context) = 0;

	virtual std::tuple<bool, DirectUpload, UploadError> GetDirectUploadURL(const DirectUploadOptions& options,
									       const RequestContext& context) = 0;

	virtual std::tuple<bool, Video, UploadError> GetResource(const std::string& resource_id,
								 const RequestContext& context) = 0;
};

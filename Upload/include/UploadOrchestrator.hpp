#pragma once

#include <filesystem>
#include <tuple>

#include "stream.pb.h"

#include "AccountApi.hpp"
#include "HttpTransport.hpp"
#include "ProgressRelay.hpp"
#include "RequestContext.hpp"
#include "TransportStrategy.hpp"
#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Entry point of the upload engine.
//
// Picks one transport strategy from the file size, runs it, then re-reads the
// created video so the caller gets the authoritative record. Errors from the
// active uploader are returned unchanged; nothing is retried.
class UploadOrchestrator final
{
public:
	UploadOrchestrator(AccountApi& api, HttpTransport& transport, UploadPolicy policy = UploadPolicy{});

public:
	std::tuple<bool, Video, UploadError> Upload(const std::filesystem::path& path, const UploadOptions& options,
						    ProgressChannel* progress, const RequestContext& context);

private:
	std::tuple<bool, UploadSource, UploadError> OpenSource(const std::filesystem::path& path) const;

	std::tuple<bool, std::string, UploadError> UploadSingleShot(const UploadSource& source, const UploadOptions& options,
								    ProgressChannel* progress, const RequestContext& context);
	std::tuple<bool, std::string, UploadError> UploadResumable(const UploadSource& source, const UploadOptions& options,
								   ProgressChannel* progress, const RequestContext& context);

private:
	AccountApi& api_;
	HttpTransport& transport_;
	const UploadPolicy policy_;
};

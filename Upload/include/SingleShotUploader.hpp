#pragma once

#include <optional>
#include <string>

#include "ChunkReader.hpp"
#include "HttpTransport.hpp"
#include "ProgressRelay.hpp"
#include "RequestContext.hpp"
#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Sends a whole file as one multipart/form-data POST to a direct-upload URL.
class SingleShotUploader final
{
public:
	explicit SingleShotUploader(HttpTransport& transport);

public:
	std::optional<UploadError> Upload(const std::string& upload_url, ChunkReader& reader,
					  const UploadSource& source, ProgressChannel* progress,
					  const RequestContext& context);

private:
	HttpTransport& transport_;
};

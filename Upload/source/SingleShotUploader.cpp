#include "SingleShotUploader.hpp"

#include <spdlog/spdlog.h>

#include "Codec.hpp"
#include "MultipartBody.hpp"

namespace {
	constexpr std::size_t kBoundaryBytes = 16;
}

SingleShotUploader::SingleShotUploader(HttpTransport& transport)
    : transport_(transport)
{
}

std::optional<UploadError> SingleShotUploader::Upload(const std::string& upload_url, ChunkReader& reader,
                                                      const UploadSource& source, ProgressChannel* progress,
                                                      const RequestContext& context)
{
    if (upload_url.empty())
        return MakeInvalidInput("upload URL is empty");

    auto [ok, random, cerr] = Codec::RandomHex(kBoundaryBytes);
    if (!ok)
        return MakeTransportFailure(cerr.code, "failed to create multipart boundary: " + cerr.message);

    MultipartBody body(reader, source.size, "file", source.path.filename().string(),
                       "cfstream-" + random, progress);

    HttpRequest request;
    request.method = "POST";
    request.url = upload_url;
    request.source = &body;
    request.AddHeader("Content-Type", body.GetContentType());

    spdlog::debug("posting {} ({} bytes) as multipart/form-data", source.path.string(), source.size);

    auto [received, response, herr] = transport_.Perform(request, context);
    if (!received)
        return MakeTransportFailure("upload request failed", herr);

    if (response.status != 200 && response.status != 201)
        return MakeStatusError("upload", response);

    spdlog::debug("multipart upload accepted with status {} after {} bytes", response.status, body.GetBytesSent());

    return std::nullopt;
}

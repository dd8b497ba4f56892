#include "UploadError.hpp"

#include "fmt/core.h"

namespace {
	constexpr std::size_t kMaxBodyInMessage = 512;

	const char* DescribeStatus(long status) noexcept
	{
		switch (status) {
		case 400: return "invalid input";
		case 401: return "unauthorized: invalid API token or account ID";
		case 403: return "forbidden: insufficient permissions";
		case 404: return "video not found";
		case 429: return "rate limit exceeded: please wait before retrying";
		default:  return nullptr;
		}
	}
}

const char* UploadErrorKindToString(UploadError::Kind kind) noexcept
{
	switch (kind) {
	case UploadError::Kind::None: return "none";
	case UploadError::Kind::InvalidInput: return "invalid input";
	case UploadError::Kind::TransportFailure: return "transport failure";
	case UploadError::Kind::ProtocolViolation: return "protocol violation";
	}

	return "unknown";
}

std::string UploadErrorToString(const UploadError& error)
{
	if (error.code != 0)
		return fmt::format("{} ({}): {}", UploadErrorKindToString(error.kind), error.code, error.message);

	return fmt::format("{}: {}", UploadErrorKindToString(error.kind), error.message);
}

UploadError MakeInvalidInput(std::string message)
{
	return UploadError{ UploadError::Kind::InvalidInput, 0, std::move(message) };
}

UploadError MakeProtocolViolation(std::string message)
{
	return UploadError{ UploadError::Kind::ProtocolViolation, 0, std::move(message) };
}

UploadError MakeTransportFailure(int code, std::string message)
{
	return UploadError{ UploadError::Kind::TransportFailure, code, std::move(message) };
}

UploadError MakeTransportFailure(std::string_view what, const HttpError& error)
{
	return MakeTransportFailure(error.code, fmt::format("{}: {}", what, error.message));
}

UploadError MakeStatusError(std::string_view what, const HttpResponse& response)
{
	std::string body = response.body.substr(0, kMaxBodyInMessage);
	const int status = static_cast<int>(response.status);

	if (const char* description = DescribeStatus(response.status)) {
		if (body.empty())
			return MakeTransportFailure(status, fmt::format("{}: {}", what, description));

		return MakeTransportFailure(status, fmt::format("{}: {}: {}", what, description, body));
	}

	if (body.empty())
		return MakeTransportFailure(status, fmt::format("{} failed with status {}", what, status));

	return MakeTransportFailure(status, fmt::format("{} failed with status {}: {}", what, status, body));
}

#pragma once

#include <string>
#include <string_view>

#include "HttpTransport.hpp"

struct UploadError {
	enum class Kind {
		None = 0,
		InvalidInput,
		TransportFailure,
		ProtocolViolation
	};

	Kind kind = Kind::None;
	// HTTP status when a response was received, transport code otherwise
	int code = 0;
	std::string message;
};

const char* UploadErrorKindToString(UploadError::Kind kind) noexcept;
std::string UploadErrorToString(const UploadError& error);

UploadError MakeInvalidInput(std::string message);
UploadError MakeProtocolViolation(std::string message);
UploadError MakeTransportFailure(int code, std::string message);

// Transport-level failure (no response at all).
UploadError MakeTransportFailure(std::string_view what, const HttpError& error);

// Unexpected HTTP status; the message names well-known statuses.
UploadError MakeStatusError(std::string_view what, const HttpResponse& response);

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "RequestContext.hpp"

struct HttpError {
	int code = 0;
	std::string message;
};

// Pull-based request body with a size known up front.
class BodySource
{
public:
	virtual ~BodySource() = default;

public:
	virtual std::uint64_t Size() const noexcept = 0;

	// Fills at most `size` bytes; 0 bytes with ok == true means end of body.
	virtual std::tuple<bool, std::size_t, HttpError> Read(char* buffer, std::size_t size) noexcept = 0;
};

// Body over bytes owned by the caller; they must outlive the request.
class MemoryBody final : public BodySource
{
public:
	explicit MemoryBody(std::string_view data) noexcept;

public:
	std::uint64_t Size() const noexcept override;
	std::tuple<bool, std::size_t, HttpError> Read(char* buffer, std::size_t size) noexcept override;

private:
	const std::string_view data_;
	std::size_t position_ = 0;
};

struct HttpRequest {
	std::string method = "GET";
	std::string url;
	std::vector<std::pair<std::string, std::string>> headers;

	// Used when source is null.
	std::string body;
	BodySource* source = nullptr;

	HttpRequest& AddHeader(std::string name, std::string value);
	std::uint64_t BodySize() const noexcept;
};

struct HttpResponse {
	long status = 0;

	// Header names are stored lower-cased.
	std::multimap<std::string, std::string> headers;
	std::string body;

	std::optional<std::string> GetHeader(std::string_view name) const;
};

class HttpTransport
{
public:
	using Error = HttpError;

public:
	virtual ~HttpTransport() = default;

public:
	// ok is true whenever a response was received, whatever its status.
	virtual std::tuple<bool, HttpResponse, Error> Perform(const HttpRequest& request,
							      const RequestContext& context) noexcept = 0;
};

std::string ToLowerAscii(std::string_view text);

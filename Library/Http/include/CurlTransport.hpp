#pragma once

#include <memory>
#include <tuple>

#include <curl/curl.h>

#include "HttpTransport.hpp"

// libcurl-backed transport. One instance owns one easy handle and must not be
// used from several threads at once; curl_global_init() is the caller's job.
class CurlTransport final : public HttpTransport
{
public:
	CurlTransport();
	~CurlTransport() override = default;

	CurlTransport(const CurlTransport&) = delete;
	CurlTransport& operator=(const CurlTransport&) = delete;

public:
	bool IsValid() const noexcept;

	std::tuple<bool, HttpResponse, Error> Perform(const HttpRequest& request,
						      const RequestContext& context) noexcept override;

private:
	std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

#include "CurlTransport.hpp"

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace {
	using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

	struct Transfer {
		HttpResponse* response;
		BodySource* source;
		const RequestContext* context;
		std::optional<HttpError> source_error;
	};

	std::string Trim(std::string_view text)
	{
		const auto first = text.find_first_not_of(" \t\r\n");
		if (first == std::string_view::npos)
			return {};

		const auto last = text.find_last_not_of(" \t\r\n");
		return std::string(text.substr(first, last - first + 1));
	}

	size_t OnHeader(char* buffer, size_t size, size_t nitems, void* userdata)
	{
		auto* transfer = static_cast<Transfer*>(userdata);
		const size_t total = size * nitems;
		const std::string_view line(buffer, total);

		// a new status line starts a new header block (100-continue, proxies)
		if (line.rfind("HTTP/", 0) == 0) {
			transfer->response->headers.clear();
			return total;
		}

		const auto colon = line.find(':');
		if (colon == std::string_view::npos)
			return total;

		transfer->response->headers.emplace(ToLowerAscii(Trim(line.substr(0, colon))),
						    Trim(line.substr(colon + 1)));

		return total;
	}

	size_t OnWrite(char* data, size_t size, size_t nmemb, void* userdata)
	{
		auto* transfer = static_cast<Transfer*>(userdata);
		transfer->response->body.append(data, size * nmemb);

		return size * nmemb;
	}

	size_t OnRead(char* buffer, size_t size, size_t nitems, void* userdata)
	{
		auto* transfer = static_cast<Transfer*>(userdata);

		if (transfer->context->ShouldAbort())
			return CURL_READFUNC_ABORT;

		auto [ok, n, err] = transfer->source->Read(buffer, size * nitems);
		if (!ok) {
			transfer->source_error = std::move(err);
			return CURL_READFUNC_ABORT;
		}

		return n;
	}

	int OnProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
	{
		auto* transfer = static_cast<Transfer*>(userdata);

		return transfer->context->ShouldAbort() ? 1 : 0;
	}

	HttpError MakeAbortError(const RequestContext& context)
	{
		if (context.IsCancelled())
			return HttpError{ CURLE_ABORTED_BY_CALLBACK, "request cancelled" };

		return HttpError{ CURLE_OPERATION_TIMEDOUT, "deadline exceeded" };
	}
}

CurlTransport::CurlTransport()
    : curl_(curl_easy_init(), &curl_easy_cleanup)
{
}

bool CurlTransport::IsValid() const noexcept
{
    return curl_ != nullptr;
}

std::tuple<bool, HttpResponse, CurlTransport::Error>
CurlTransport::Perform(const HttpRequest& request, const RequestContext& context) noexcept
{
    if (!curl_)
        return { false, HttpResponse{}, Error{ -1, "curl handle not initialized" } };

    if (context.ShouldAbort())
        return { false, HttpResponse{}, MakeAbortError(context) };

    CURL* handle = curl_.get();
    curl_easy_reset(handle);

    HttpResponse response;
    Transfer transfer{ &response, request.source, &context, std::nullopt };

    SlistPtr headers(nullptr, &curl_slist_free_all);
    auto append = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next) {
            headers.release();
            headers.reset(next);
        }
        return next != nullptr;
    };

    for (const auto& [name, value] : request.headers)
        if (!append(name + ": " + value))
            return { false, HttpResponse{}, Error{ CURLE_OUT_OF_MEMORY, "failed to build request headers" } };

    // large bodies would otherwise wait on a 100-continue round trip
    if (!append("Expect:"))
        return { false, HttpResponse{}, Error{ CURLE_OUT_OF_MEMORY, "failed to build request headers" } };

    char errbuf[CURL_ERROR_SIZE] = { 0 };

    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);

    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &OnHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &OnWrite);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &transfer);

    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &OnProgress);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &transfer);

    if (const auto remaining = context.Remaining())
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<long long>(remaining->count(), 1)));

    if (request.method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);

        if (request.source) {
            curl_easy_setopt(handle, CURLOPT_READFUNCTION, &OnRead);
            curl_easy_setopt(handle, CURLOPT_READDATA, &transfer);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.source->Size()));
        } else {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }

        if (request.method != "POST")
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    spdlog::trace("http: {} {} ({} bytes)", request.method, request.url, request.BodySize());

    const CURLcode rc = curl_easy_perform(handle);

    if (transfer.source_error)
        return { false, HttpResponse{}, Error{ transfer.source_error->code,
                                               "request body: " + transfer.source_error->message } };

    if (rc == CURLE_ABORTED_BY_CALLBACK || (rc == CURLE_OPERATION_TIMEDOUT && context.ShouldAbort()))
        return { false, HttpResponse{}, MakeAbortError(context) };

    if (rc != CURLE_OK) {
        const std::string detail = std::strlen(errbuf) > 0 ? errbuf : curl_easy_strerror(rc);
        return { false, HttpResponse{}, Error{ static_cast<int>(rc), detail } };
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);

    spdlog::trace("http: {} {} -> {}", request.method, request.url, response.status);

    return { true, std::move(response), Error{} };
}

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "HttpTransport.hpp"

// Scripted HttpTransport: replies with queued responses in order and keeps a
// copy of every request, streamed bodies included.
class FakeTransport : public HttpTransport
{
public:
    struct Exchange {
        std::string method;
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::uint64_t declared_size = 0;
        bool streamed = false;
    };

    using Reply = std::tuple<bool, HttpResponse, Error>;

    // Called after each scripted reply has been picked.
    using Listener = std::function<void(const Exchange&, const Reply&)>;

public:
    FakeTransport& Respond(long status, std::string body = "",
                           std::vector<std::pair<std::string, std::string>> headers = {})
    {
        HttpResponse response;
        response.status = status;
        response.body = std::move(body);
        for (auto& [name, value] : headers)
            response.headers.emplace(ToLowerAscii(name), std::move(value));

        replies_.push_back({ true, std::move(response), Error{} });
        return *this;
    }

    FakeTransport& Fail(int code, std::string message)
    {
        replies_.push_back({ false, HttpResponse{}, Error{ code, std::move(message) } });
        return *this;
    }

    const std::vector<Exchange>& GetExchanges() const noexcept
    {
        return exchanges_;
    }

    std::size_t GetPendingReplies() const noexcept
    {
        return replies_.size();
    }

    Reply Perform(const HttpRequest& request, const RequestContext& context) noexcept override
    {
        Exchange exchange{ request.method, request.url, request.headers, request.body, request.BodySize(),
                           request.source != nullptr };

        if (request.source) {
            exchange.body.clear();

            std::vector<char> buffer(read_size_);
            while (true) {
                auto [ok, n, err] = request.source->Read(buffer.data(), buffer.size());
                if (!ok) {
                    exchanges_.push_back(std::move(exchange));
                    return { false, HttpResponse{}, err };
                }

                if (n == 0)
                    break;

                exchange.body.append(buffer.data(), n);
            }
        }

        exchanges_.push_back(std::move(exchange));

        if (context.IsCancelled())
            return { false, HttpResponse{}, Error{ -1, "request cancelled" } };

        if (replies_.empty())
            return { false, HttpResponse{}, Error{ -1, "no scripted reply" } };

        Reply reply = std::move(replies_.front());
        replies_.pop_front();

        if (listener_)
            listener_(exchanges_.back(), reply);

        return reply;
    }

    void SetListener(Listener listener)
    {
        listener_ = std::move(listener);
    }

    // read size used when draining streamed bodies
    void SetReadSize(std::size_t size) noexcept
    {
        read_size_ = size == 0 ? 1 : size;
    }

private:
    std::deque<Reply> replies_;
    std::vector<Exchange> exchanges_;
    std::size_t read_size_ = 7;
    Listener listener_;
};

inline std::optional<std::string> FindHeader(const FakeTransport::Exchange& exchange, std::string_view name)
{
    const std::string key = ToLowerAscii(name);
    for (const auto& [header, value] : exchange.headers)
        if (ToLowerAscii(header) == key)
            return value;

    return std::nullopt;
}

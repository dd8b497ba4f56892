#include "HttpTransport.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

std::string ToLowerAscii(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

MemoryBody::MemoryBody(std::string_view data) noexcept
    : data_(data)
{
}

std::uint64_t MemoryBody::Size() const noexcept
{
    return data_.size();
}

std::tuple<bool, std::size_t, HttpError> MemoryBody::Read(char* buffer, std::size_t size) noexcept
{
    const std::size_t n = std::min(size, data_.size() - position_);
    if (n == 0)
        return { true, 0, HttpError{} };

    std::memcpy(buffer, data_.data() + position_, n);
    position_ += n;

    return { true, n, HttpError{} };
}

HttpRequest& HttpRequest::AddHeader(std::string name, std::string value)
{
    headers.emplace_back(std::move(name), std::move(value));
    return *this;
}

std::uint64_t HttpRequest::BodySize() const noexcept
{
    if (source)
        return source->Size();

    return body.size();
}

std::optional<std::string> HttpResponse::GetHeader(std::string_view name) const
{
    const auto it = headers.find(ToLowerAscii(name));
    if (it == headers.end())
        return std::nullopt;

    return it->second;
}

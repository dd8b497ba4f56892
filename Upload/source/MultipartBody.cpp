#include "MultipartBody.hpp"

#include <algorithm>
#include <cstring>

#include "fmt/core.h"

namespace {
	// quotes and line breaks would end the header parameter early
	std::string EscapeQuoted(std::string_view text)
	{
		std::string out;
		out.reserve(text.size());
		for (char c : text) {
			switch (c) {
			case '"':  out += "%22"; break;
			case '\r': out += "%0D"; break;
			case '\n': out += "%0A"; break;
			default:   out.push_back(c); break;
			}
		}

		return out;
	}
}

MultipartBody::MultipartBody(ChunkReader& reader, std::uint64_t file_size, std::string field_name,
                             std::string file_name, std::string boundary, ProgressChannel* progress)
    : reader_(reader)
    , progress_(progress)
    , file_size_(file_size)
    , boundary_(std::move(boundary))
    , preamble_(fmt::format("--{}\r\n"
                            "Content-Disposition: form-data; name=\"{}\"; filename=\"{}\"\r\n"
                            "Content-Type: application/octet-stream\r\n"
                            "\r\n",
                            boundary_, EscapeQuoted(field_name), EscapeQuoted(file_name)))
    , epilogue_(fmt::format("\r\n--{}--\r\n", boundary_))
{
    pending_ = preamble_;
}

std::string MultipartBody::GetContentType() const
{
    return "multipart/form-data; boundary=" + boundary_;
}

std::uint64_t MultipartBody::GetBytesSent() const noexcept
{
    return bytes_sent_;
}

std::uint64_t MultipartBody::Size() const noexcept
{
    return preamble_.size() + file_size_ + epilogue_.size();
}

std::size_t MultipartBody::Drain(std::string_view& pending, char* buffer, std::size_t size) noexcept
{
    const std::size_t n = std::min(pending.size(), size);
    std::memcpy(buffer, pending.data(), n);
    pending.remove_prefix(n);

    return n;
}

std::tuple<bool, std::size_t, HttpError> MultipartBody::Read(char* buffer, std::size_t size) noexcept
{
    std::size_t written = 0;

    while (written < size && stage_ != Stage::Done) {
        if (!pending_.empty()) {
            written += Drain(pending_, buffer + written, size - written);

            // a file chunk counts as sent once the transport has taken all of it
            if (pending_.empty() && stage_ == Stage::File && bytes_sent_ != bytes_read_) {
                bytes_sent_ = bytes_read_;
                EmitProgress(progress_, bytes_sent_, file_size_);
            }
            continue;
        }

        switch (stage_) {
        case Stage::Preamble:
            stage_ = Stage::File;
            break;

        case Stage::File: {
            auto [ok, chunk, err] = reader_.Next();
            if (!ok)
                return { false, written, HttpError{ err.code, "failed to read file: " + err.message } };

            if (chunk.empty()) {
                if (bytes_read_ != file_size_)
                    return { false, written, HttpError{ -1, fmt::format("file size changed during upload: expected {} bytes, read {}",
                                                                        file_size_, bytes_read_) } };

                stage_ = Stage::Epilogue;
                pending_ = epilogue_;
                break;
            }

            if (bytes_read_ + chunk.size() > file_size_)
                return { false, written, HttpError{ -1, fmt::format("file grew during upload beyond {} bytes", file_size_) } };

            bytes_read_ += chunk.size();
            pending_ = chunk;
            break;
        }

        case Stage::Epilogue:
            stage_ = Stage::Done;
            break;

        case Stage::Done:
            break;
        }
    }

    return { true, written, HttpError{} };
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

#include "ChunkReader.hpp"
#include "HttpTransport.hpp"
#include "ProgressRelay.hpp"

// multipart/form-data body with a single file part, streamed from a reader.
//
// File bytes are pulled chunk by chunk as the transport asks for them; one
// progress update is emitted once a chunk has been fully handed over.
class MultipartBody final : public BodySource
{
public:
	MultipartBody(ChunkReader& reader, std::uint64_t file_size, std::string field_name,
		      std::string file_name, std::string boundary, ProgressChannel* progress);

public:
	std::string GetContentType() const;
	std::uint64_t GetBytesSent() const noexcept;

	std::uint64_t Size() const noexcept override;
	std::tuple<bool, std::size_t, HttpError> Read(char* buffer, std::size_t size) noexcept override;

private:
	enum class Stage {
		Preamble,
		File,
		Epilogue,
		Done
	};

private:
	std::size_t Drain(std::string_view& pending, char* buffer, std::size_t size) noexcept;

private:
	ChunkReader& reader_;
	ProgressChannel* progress_;

	const std::uint64_t file_size_;
	const std::string boundary_;
	const std::string preamble_;
	const std::string epilogue_;

	Stage stage_ = Stage::Preamble;
	std::string_view pending_;
	std::uint64_t bytes_read_ = 0;
	std::uint64_t bytes_sent_ = 0;
};

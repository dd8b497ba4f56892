#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

constexpr std::uint64_t kMiB = 1024 * 1024;

struct UploadOptions {
	std::string name;
	std::map<std::string, std::string> metadata;
	bool require_signed_urls = false;
};

struct UploadProgress {
	std::uint64_t bytes_sent = 0;
	std::uint64_t bytes_total = 0;
};

inline bool operator==(const UploadProgress& lhs, const UploadProgress& rhs) noexcept
{
	return lhs.bytes_sent == rhs.bytes_sent && lhs.bytes_total == rhs.bytes_total;
}

// A local file that stays unchanged for the duration of one upload.
struct UploadSource {
	std::filesystem::path path;
	std::uint64_t size = 0;
};

// One resumable upload as issued by the server; never persisted.
struct Session {
	std::string resource_id;
	std::string upload_url;
};

struct DirectUploadOptions {
	int max_duration_seconds = 0;
	std::optional<std::chrono::system_clock::time_point> expiry;
	bool require_signed_urls = false;
	std::string name;
	std::map<std::string, std::string> metadata;
};

struct DirectUpload {
	std::string resource_id;
	std::string upload_url;
	std::optional<std::chrono::system_clock::time_point> expiry;
};

struct UploadPolicy {
	// files of at least this size go through a resumable session
	std::uint64_t resumable_threshold = 200 * kMiB;
	// PATCH size of the resumable path
	std::size_t chunk_size = 50 * kMiB;
	// read size while streaming a multipart body
	std::size_t stream_buffer_size = 1 * kMiB;
	// limit requested for direct uploads (6 hours)
	int max_duration_seconds = 21600;
	std::size_t progress_capacity = 10;
};

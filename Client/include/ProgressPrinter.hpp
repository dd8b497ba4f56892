#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

#include "UploadTypes.hpp"

// "1.5 MB" style sizes, 1024-based.
std::string FormatBytes(std::uint64_t bytes);

// Renders upload progress on one terminal line.
class ProgressPrinter
{
public:
	using Clock = std::chrono::steady_clock;

public:
	ProgressPrinter(std::string label, std::FILE* out = stderr,
			std::chrono::milliseconds throttle = std::chrono::milliseconds(65));

public:
	void Update(const UploadProgress& progress);
	void Finish();

	std::chrono::milliseconds Elapsed() const;

private:
	void Render(const UploadProgress& progress);

private:
	const std::string label_;
	std::FILE* out_;
	const std::chrono::milliseconds throttle_;

	const Clock::time_point start_;
	Clock::time_point last_render_;
	UploadProgress last_;
	bool rendered_ = false;
};

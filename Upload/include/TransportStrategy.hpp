#pragma once

#include <cstdint>

#include "UploadTypes.hpp"

enum class TransportStrategy {
	SingleShotMultipart,
	ResumableSession
};

const char* TransportStrategyToString(TransportStrategy strategy) noexcept;

// Sizes at or above the policy threshold use a resumable session.
TransportStrategy SelectTransportStrategy(std::uint64_t file_size, const UploadPolicy& policy = UploadPolicy{}) noexcept;

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <tuple>

#include "UploadTypes.hpp"

struct Config {
	struct Error {
		int code;
		std::string message;
	};

	std::string account_id;
	std::string api_token;
	std::string api_base_url = "https://api.cloudflare.com/client/v4";
	std::string log_level = "info";

	// seconds for a whole command; 0 disables the deadline
	std::int64_t request_timeout = 0;

	UploadPolicy upload;
};

// $XDG_CONFIG_HOME/cfstream/config.yaml, falling back to ~/.config.
std::filesystem::path DefaultConfigPath();

// A missing file yields defaults; CFSTREAM_* environment variables win over
// values from the file.
std::tuple<bool, Config, Config::Error> LoadConfig(const std::optional<std::filesystem::path>& path = std::nullopt);

std::optional<Config::Error> ValidateConfig(const Config& config);

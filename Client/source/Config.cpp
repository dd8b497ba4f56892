#include "Config.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "fmt/core.h"

namespace fs = std::filesystem;

namespace {
	constexpr std::uint64_t kChunkGranularity = 256 * 1024;

	std::optional<std::string> GetEnv(const char* name)
	{
		const char* value = std::getenv(name);
		if (!value || *value == '\0')
			return std::nullopt;

		return std::string(value);
	}

	template <typename T>
	void Assign(const YAML::Node& node, const char* key, T& out)
	{
		if (const YAML::Node value = node[key])
			out = value.as<T>();
	}
}

fs::path DefaultConfigPath()
{
    if (const auto xdg = GetEnv("XDG_CONFIG_HOME"))
        return fs::path(*xdg) / "cfstream" / "config.yaml";

    if (const auto home = GetEnv("HOME"))
        return fs::path(*home) / ".config" / "cfstream" / "config.yaml";

    return fs::path(".config") / "cfstream" / "config.yaml";
}

std::tuple<bool, Config, Config::Error> LoadConfig(const std::optional<fs::path>& path)
{
    Config config;

    const fs::path file = path ? *path : DefaultConfigPath();

    std::error_code ec;
    if (fs::exists(file, ec)) {
        try {
            const YAML::Node root = YAML::LoadFile(file.string());

            Assign(root, "account_id", config.account_id);
            Assign(root, "api_token", config.api_token);
            Assign(root, "api_base_url", config.api_base_url);
            Assign(root, "log_level", config.log_level);
            Assign(root, "request_timeout", config.request_timeout);

            if (const YAML::Node upload = root["upload"]) {
                Assign(upload, "resumable_threshold", config.upload.resumable_threshold);
                Assign(upload, "chunk_size", config.upload.chunk_size);
                Assign(upload, "max_duration_seconds", config.upload.max_duration_seconds);
            }
        }
        catch (const YAML::Exception& e) {
            return { false, Config{}, Config::Error{ -1, fmt::format("failed to read config file {}: {}", file.string(), e.what()) } };
        }

        spdlog::debug("configuration loaded from {}", file.string());
    } else if (path) {
        return { false, Config{}, Config::Error{ ENOENT, "config file not found: " + file.string() } };
    }

    if (const auto value = GetEnv("CFSTREAM_ACCOUNT_ID"))
        config.account_id = *value;
    if (const auto value = GetEnv("CFSTREAM_API_TOKEN"))
        config.api_token = *value;
    if (const auto value = GetEnv("CFSTREAM_API_BASE_URL"))
        config.api_base_url = *value;

    return { true, std::move(config), Config::Error{ 0, "" } };
}

std::optional<Config::Error> ValidateConfig(const Config& config)
{
    if (config.account_id.find_first_not_of(" \t") == std::string::npos)
        return Config::Error{ -1, "account_id is required" };

    if (config.api_token.find_first_not_of(" \t") == std::string::npos)
        return Config::Error{ -1, "api_token is required" };

    if (config.api_base_url.rfind("http://", 0) != 0 && config.api_base_url.rfind("https://", 0) != 0)
        return Config::Error{ -1, "api_base_url must be an http(s) URL (got: " + config.api_base_url + ")" };

    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off")
        return Config::Error{ -1, "log_level must be one of: trace, debug, info, warning, error, critical, off (got: "
                                  + config.log_level + ")" };

    if (config.request_timeout < 0)
        return Config::Error{ -1, "request_timeout can't be negative" };

    if (config.upload.resumable_threshold == 0)
        return Config::Error{ -1, "upload.resumable_threshold must be positive" };

    if (config.upload.chunk_size == 0 || config.upload.chunk_size % kChunkGranularity != 0)
        return Config::Error{ -1, fmt::format("upload.chunk_size must be a positive multiple of {} bytes (got: {})",
                                              kChunkGranularity, config.upload.chunk_size) };

    if (config.upload.max_duration_seconds < 0)
        return Config::Error{ -1, "upload.max_duration_seconds can't be negative" };

    return std::nullopt;
}

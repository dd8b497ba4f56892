#include <chrono>
#include <csignal>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include <getopt.h>

#include <curl/curl.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "Config.hpp"
#include "CurlTransport.hpp"
#include "JsonCodec.hpp"
#include "ProgressPrinter.hpp"
#include "ProgressRelay.hpp"
#include "StatusPoller.hpp"
#include "StreamClient.hpp"
#include "UploadOrchestrator.hpp"
#include "VideoRecord.hpp"

using ArgList = std::map<std::string, std::string>;

namespace {
	const char* kUsage =
		"usage: {} [--config <file>] [--loglevel <level>] [--quiet] [--json] <command> [<args>]\n"
		"\n"
		"commands:\n"
		"  upload <file> [--name <name>] [--meta <key>=<value>]... [--public] [--wait]\n"
		"  direct [--max-duration <seconds>] [--expires <seconds>] [--public]\n"
		"  status <id> [--wait]";

	RequestContext* g_context = nullptr;

	void OnInterrupt(int)
	{
		if (g_context)
			g_context->TryCancel();
	}

	std::pair<bool, std::string> ParseCommandArgument(int argc, char* argv[], ArgList& arglist)
	{
		const std::string command = arglist.at("command");

		const struct option options[] = {
			{ "name",         required_argument, nullptr, 'n' },
			{ "meta",         required_argument, nullptr, 'm' },
			{ "public",       no_argument,       nullptr, 'p' },
			{ "wait",         no_argument,       nullptr, 'w' },
			{ "max-duration", required_argument, nullptr, 'd' },
			{ "expires",      required_argument, nullptr, 'e' },
			{ nullptr, 0, nullptr, 0 }
		};

		optind = 0;
		int optidx;
		for (int opt; (opt = getopt_long(argc, argv, ":n:m:pwd:e:", options, &optidx)) != -1; ) {
			switch (opt) {
			case 'n':
				arglist["name"] = optarg;
				break;
			case 'm': {
				const std::string pair = optarg;
				const auto eq = pair.find('=');
				if (eq == std::string::npos || eq == 0)
					return { false, fmt::format("invalid metadata (expected key=value): {}", pair) };

				arglist["meta." + pair.substr(0, eq)] = pair.substr(eq + 1);
				break;
			}
			case 'p':
				arglist["public"] = "1";
				break;
			case 'w':
				arglist["wait"] = "1";
				break;
			case 'd':
				arglist["max-duration"] = optarg;
				break;
			case 'e':
				arglist["expires"] = optarg;
				break;
			case ':':
				return { false, fmt::format("missing argument: {}", argv[optind - 1]) };
			case '?':
				return { false, fmt::format("invalid argument: {}", argv[optind - 1]) };
			}
		}

		argc -= optind;
		argv += optind;

		if (command == "upload" || command == "status") {
			if (argc < 1)
				return { false, fmt::format("{}: missing {}", command, command == "upload" ? "<file>" : "<id>") };

			arglist["target"] = *argv;
		}

		return { true, "" };
	}
}

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
	ArgList arglist;

	const struct option options[] = {
		{ "config",   required_argument, nullptr, 'c' },
		{ "loglevel", required_argument, nullptr, 'l' },
		{ "quiet",    no_argument,       nullptr, 'q' },
		{ "json",     no_argument,       nullptr, 'j' },
		{ nullptr, 0, nullptr, 0 }
	};

	const char* program = *argv;

	try {
		int optidx;
		for (int opt; (opt = getopt_long(argc, argv, "+:c:l:qj", options, &optidx)) != -1; ) {
			switch (opt) {
			case 'c':
				arglist["config"] = optarg;
				break;
			case 'l':
				arglist["loglevel"] = optarg;
				break;
			case 'q':
				arglist["quiet"] = "1";
				break;
			case 'j':
				arglist["json"] = "1";
				break;
			case ':':
				return { false, fmt::format("missing argument: {}", argv[optind - 1]) };
			case '?':
				return { false, fmt::format("invalid argument: {}", argv[optind - 1]) };
			}
		}

		argc -= optind;
		argv += optind;

		if (argc < 1)
			return { false, fmt::format(fmt::runtime(kUsage), program) };

		arglist["command"] = *argv;
		if (arglist["command"] != "upload" && arglist["command"] != "direct" && arglist["command"] != "status")
			return { false, fmt::format("unknown command: {}\n{}", arglist["command"], fmt::format(fmt::runtime(kUsage), program)) };

		const auto [ok, message] = ParseCommandArgument(argc, argv, arglist);
		if (!ok)
			return { false, message };
	}
	catch (std::exception& e) {
		return { false, fmt::format("invalid argument: {}", e.what()) };
	}

	return { true, arglist };
}

void ShowArgument(const ArgList& arglist)
{
	for (const auto &[name, value]: arglist)
		spdlog::debug("{}: {}", name, value);
}

void PrintVideo(const ArgList& arglist, const Video& video)
{
	if (arglist.count("json")) {
		auto [ok, json, err] = MessageToJson(video);
		if (ok) {
			fmt::print("{}\n", json);
			return;
		}

		spdlog::warn("failed to encode video as JSON: {}", err);
	}

	fmt::print("{}", VideoToString(video));
}

int WaitForVideo(const ArgList& arglist, AccountApi& api, const Video& video, const RequestContext& context)
{
	const bool quiet = arglist.count("quiet") != 0;

	StatusPoller poller(api);
	auto [ok, last, err] = poller.WaitUntilReady(video.uid(), context, [quiet](const Video& v) {
		if (!quiet)
			spdlog::info("status: {} {}", v.status().state(), VideoStatusDetails(v));
	});

	if (!ok) {
		spdlog::error("failed to check video status: {}", UploadErrorToString(err));
		return 1;
	}

	if (last.ready_to_stream())
		spdlog::info("video ready for streaming");
	else
		spdlog::info("video is still processing; run 'status {}' to check again", last.uid());

	PrintVideo(arglist, last);

	return 0;
}

int RunUpload(const ArgList& arglist, const Config& config, AccountApi& api, HttpTransport& transport,
	      const RequestContext& context)
{
	const std::filesystem::path path = arglist.at("target");
	const bool quiet = arglist.count("quiet") != 0;

	UploadOptions options;
	options.name = arglist.count("name") ? arglist.at("name") : path.filename().string();
	options.require_signed_urls = arglist.count("public") == 0;
	for (const auto &[name, value]: arglist)
		if (name.rfind("meta.", 0) == 0)
			options.metadata[name.substr(5)] = value;

	ProgressPrinter printer("Uploading " + path.filename().string(), quiet ? nullptr : stderr);
	ProgressRelay relay([&printer](const UploadProgress& progress) { printer.Update(progress); },
			    config.upload.progress_capacity);

	UploadOrchestrator orchestrator(api, transport, config.upload);
	auto [ok, video, err] = orchestrator.Upload(path, options, &relay.GetChannel(), context);

	relay.Close();
	printer.Finish();

	if (!ok) {
		spdlog::error("upload failed: {}", UploadErrorToString(err));
		return 1;
	}

	spdlog::info("upload complete in {} ms: video {} ({})", printer.Elapsed().count(), video.uid(),
		     video.status().state());

	if (arglist.count("wait") && !video.ready_to_stream())
		return WaitForVideo(arglist, api, video, context);

	PrintVideo(arglist, video);

	return 0;
}

int RunDirect(const ArgList& arglist, const Config& config, AccountApi& api, const RequestContext& context)
{
	DirectUploadOptions options;
	options.require_signed_urls = arglist.count("public") == 0;
	options.max_duration_seconds = config.upload.max_duration_seconds;

	try {
		if (arglist.count("max-duration"))
			options.max_duration_seconds = std::stoi(arglist.at("max-duration"));

		if (arglist.count("expires"))
			options.expiry = std::chrono::system_clock::now() + std::chrono::seconds(std::stoll(arglist.at("expires")));
	}
	catch (std::exception& e) {
		spdlog::error("invalid duration: {}", e.what());
		return 1;
	}

	auto [ok, upload, err] = api.GetDirectUploadURL(options, context);
	if (!ok) {
		spdlog::error("failed to create direct upload URL: {}", UploadErrorToString(err));
		return 1;
	}

	fmt::print("id: {}\n", upload.resource_id);
	fmt::print("upload url: {}\n", upload.upload_url);
	if (upload.expiry)
		fmt::print("expires in: {}s\n", std::chrono::duration_cast<std::chrono::seconds>(
						       *upload.expiry - std::chrono::system_clock::now()).count());

	return 0;
}

int RunStatus(const ArgList& arglist, AccountApi& api, const RequestContext& context)
{
	auto [ok, video, err] = api.GetResource(arglist.at("target"), context);
	if (!ok) {
		spdlog::error("failed to get video: {}", UploadErrorToString(err));
		return 1;
	}

	if (arglist.count("wait") && !video.ready_to_stream())
		return WaitForVideo(arglist, api, video, context);

	PrintVideo(arglist, video);

	return 0;
}

int main(int argc, char* argv[])
{
	spdlog::set_default_logger(spdlog::stderr_color_mt("cfstream"));
	spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

	const auto &[success, result] = ParseArgument(argc, argv);
	if (!success) {
		spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
		return 1;
	}

	const ArgList& arglist = std::get<ArgList>(result);

	std::optional<std::filesystem::path> config_path;
	if (arglist.count("config"))
		config_path = arglist.at("config");

	auto [loaded, config, cerr] = LoadConfig(config_path);
	if (!loaded) {
		spdlog::error("failed to load configuration: {}", cerr.message);
		return 1;
	}

	if (arglist.count("loglevel"))
		config.log_level = arglist.at("loglevel");
	else if (arglist.count("quiet"))
		config.log_level = "warn";

	if (const auto verr = ValidateConfig(config)) {
		spdlog::error("invalid configuration: {}", verr->message);
		return 1;
	}

	spdlog::set_level(spdlog::level::from_str(config.log_level));
	ShowArgument(arglist);

	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		spdlog::error("failed to initialize libcurl");
		return 1;
	}

	int status = 1;
	{
		CurlTransport transport;
		if (!transport.IsValid()) {
			spdlog::error("failed to create HTTP transport");
			curl_global_cleanup();
			return 1;
		}

		StreamClient client(transport, config.account_id, config.api_token, config.api_base_url);

		RequestContext context;
		if (config.request_timeout > 0)
			context.SetTimeout(std::chrono::seconds(config.request_timeout));

		g_context = &context;
		std::signal(SIGINT, &OnInterrupt);

		const std::string& command = arglist.at("command");
		if (command == "upload")
			status = RunUpload(arglist, config, client, transport, context);
		else if (command == "direct")
			status = RunDirect(arglist, config, client, context);
		else
			status = RunStatus(arglist, client, context);

		std::signal(SIGINT, SIG_DFL);
		g_context = nullptr;
	}

	curl_global_cleanup();

	return status;
}

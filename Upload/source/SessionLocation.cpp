#include "SessionLocation.hpp"

#include <cctype>
#include <string>

namespace {
	std::string_view Trim(std::string_view text)
	{
		const auto first = text.find_first_not_of(" \t\r\n");
		if (first == std::string_view::npos)
			return {};

		const auto last = text.find_last_not_of(" \t\r\n");
		return text.substr(first, last - first + 1);
	}

	// true when the text starts with "scheme://", scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
	bool HasScheme(std::string_view text)
	{
		if (text.empty() || !std::isalpha(static_cast<unsigned char>(text.front())))
			return false;

		for (std::size_t i = 1; i < text.size(); i++) {
			const auto c = static_cast<unsigned char>(text[i]);
			if (c == ':')
				return text.substr(i, 3) == "://";

			if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
				return false;
		}

		return false;
	}

	// scheme://authority of an absolute URL, empty if there is none
	std::string_view Origin(std::string_view url)
	{
		if (!HasScheme(url))
			return {};

		const auto scheme = url.find("://");
		const auto path = url.find('/', scheme + 3);
		if (path == std::string_view::npos)
			return url;

		return url.substr(0, path);
	}
}

std::tuple<bool, Session, UploadError> ParseSessionLocation(std::string_view location,
							    std::string_view request_url)
{
	location = Trim(location);
	if (location.empty())
		return { false, Session{}, MakeProtocolViolation("session response has no Location header") };

	std::string url;
	if (HasScheme(location)) {
		url = std::string(location);
	} else if (location.front() == '/') {
		const std::string_view origin = Origin(request_url);
		if (origin.empty())
			return { false, Session{}, MakeProtocolViolation("relative session location without a base URL") };

		url = std::string(origin) + std::string(location);
	} else {
		return { false, Session{}, MakeProtocolViolation("unusable session location: " + std::string(location)) };
	}

	std::string_view path(url);

	const auto scheme = path.find("://");
	path.remove_prefix(scheme + 3);

	const auto slash = path.find('/');
	if (slash == std::string_view::npos)
		return { false, Session{}, MakeProtocolViolation("session location has no path: " + url) };
	path.remove_prefix(slash);

	const auto query = path.find_first_of("?#");
	if (query != std::string_view::npos)
		path = path.substr(0, query);

	while (!path.empty() && path.back() == '/')
		path.remove_suffix(1);

	const auto last = path.find_last_of('/');
	const std::string_view id = (last == std::string_view::npos) ? path : path.substr(last + 1);
	if (id.empty())
		return { false, Session{}, MakeProtocolViolation("session location has no resource id: " + url) };

	return { true, Session{ std::string(id), std::move(url) }, UploadError{} };
}

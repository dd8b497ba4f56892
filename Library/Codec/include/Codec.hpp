#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <tuple>

class Codec
{
public:
	struct Error {
		int code;
		std::string message;
	};

public:
	Codec() = delete;

public:
	// Standard alphabet with padding, no line breaks.
	static std::string Base64Encode(std::string_view data);

	// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
	static std::tuple<bool, std::string, Error> RandomHex(std::size_t bytes) noexcept;
};

#include "Codec.hpp"

#include <cstdio>
#include <vector>

#include "openssl/evp.h"
#include "openssl/rand.h"
#include "openssl/err.h"

namespace {
	Codec::Error GetLastError(const std::string &what) noexcept
	{
		char buffer[BUFSIZ];

		const unsigned long err = ERR_get_error();
		if (err == 0)
			snprintf(buffer, BUFSIZ, "OpenSSL error (no queued error)");
		else
			ERR_error_string_n(err, buffer, BUFSIZ);

		Codec::Error error;
		error.code = static_cast<int>(err);
		error.message = what + ": " + std::string(buffer);

		return error;
	}

	std::string ToHex(const unsigned char* data, std::size_t size)
	{
		static const char* kHex = "0123456789abcdef";

		std::string out;
		out.reserve(size * 2);
		for (std::size_t i = 0; i < size; i++) {
			out.push_back(kHex[(data[i] >> 4) & 0xF]);
			out.push_back(kHex[data[i] & 0xF]);
		}

		return out;
	}
}

std::string Codec::Base64Encode(std::string_view data)
{
	if (data.empty())
		return {};

	const std::vector<unsigned char> in(data.begin(), data.end());

	// EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminating NUL
	std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);

	const int len = EVP_EncodeBlock(out.data(), in.data(), static_cast<int>(in.size()));
	if (len <= 0)
		return {};

	return std::string(out.begin(), out.begin() + len);
}

std::tuple<bool, std::string, Codec::Error> Codec::RandomHex(std::size_t bytes) noexcept
{
	if (bytes == 0)
		return { true, std::string{}, Error{0, ""} };

	std::vector<unsigned char> raw(bytes);
	if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1)
		return { false, std::string{}, GetLastError("RAND_bytes failed") };

	return { true, ToHex(raw.data(), raw.size()), Error{0, ""} };
}

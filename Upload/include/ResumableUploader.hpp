#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

#include "AccountApi.hpp"
#include "ChunkReader.hpp"
#include "ProgressRelay.hpp"
#include "RequestContext.hpp"
#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Chunked upload through a server-side session.
//
// Unopened -> Opened when the session is created, Opened -> Complete when the
// reader is exhausted. A failure leaves the uploader in its current state so
// the session and committed offset can still be inspected.
class ResumableUploader final
{
public:
	enum class State {
		Unopened,
		Opened,
		Complete
	};

public:
	explicit ResumableUploader(AccountApi& api);

public:
	// Opens a session and sends every chunk of `reader`; returns the resource id.
	std::tuple<bool, std::string, UploadError> Upload(ChunkReader& reader, const UploadSource& source,
							  const UploadOptions& options, ProgressChannel* progress,
							  const RequestContext& context);

	// Continues an already opened session; `reader` must start at `offset`.
	std::tuple<bool, std::string, UploadError> Resume(const Session& session, std::uint64_t offset,
							  ChunkReader& reader, const UploadSource& source,
							  ProgressChannel* progress, const RequestContext& context);

public:
	State GetState() const noexcept;
	const std::optional<Session>& GetSession() const noexcept;
	std::uint64_t GetOffset() const noexcept;

private:
	std::optional<UploadError> SendChunks(ChunkReader& reader, const UploadSource& source,
					      ProgressChannel* progress, const RequestContext& context);

private:
	AccountApi& api_;

	State state_ = State::Unopened;
	std::optional<Session> session_;
	std::uint64_t offset_ = 0;
};

const char* ResumableStateToString(ResumableUploader::State state) noexcept;

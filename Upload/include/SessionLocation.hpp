#pragma once

#include <string_view>
#include <tuple>

#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Builds a session from the Location header of a session-open response.
//
// The resource id is the last path segment of the location, ignoring any
// query string, fragment or trailing slash. Relative locations are resolved
// against `request_url`.
std::tuple<bool, Session, UploadError> ParseSessionLocation(std::string_view location,
							    std::string_view request_url);

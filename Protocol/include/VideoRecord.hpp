#pragma once

#include "stream.pb.h"

#include <string>

// meta.name when present, otherwise the uid
std::string VideoDisplayName(const Video& video);

// errorReasonText, else "<pct>% complete", else empty
std::string VideoStatusDetails(const Video& video);

std::string VideoToString(const Video& video);

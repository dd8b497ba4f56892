#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <google/protobuf/message.h>

// Unknown fields are ignored so new API fields never break decoding.
std::optional<std::string> JsonToMessage(std::string_view json, google::protobuf::Message* message);
std::tuple<bool, std::string, std::string> MessageToJson(const google::protobuf::Message& message);

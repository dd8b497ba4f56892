#include "JsonCodec.hpp"

#include <google/protobuf/util/json_util.h>

std::optional<std::string> JsonToMessage(std::string_view json, google::protobuf::Message* message)
{
    using google::protobuf::util::JsonParseOptions;

    if (!message)
        return std::string("null message");

    JsonParseOptions options;
    options.ignore_unknown_fields = true;

    const auto status = google::protobuf::util::JsonStringToMessage(
        google::protobuf::StringPiece(json.data(), json.size()), message, options);
    if (!status.ok())
        return status.ToString();

    return std::nullopt;
}

std::tuple<bool, std::string, std::string> MessageToJson(const google::protobuf::Message& message)
{
    using google::protobuf::util::JsonPrintOptions;

    JsonPrintOptions options;
    options.preserve_proto_field_names = false;

    std::string out;
    const auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
    if (!status.ok())
        return { false, std::string{}, status.ToString() };

    return { true, std::move(out), std::string{} };
}

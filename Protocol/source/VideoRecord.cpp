#include "VideoRecord.hpp"

#include <sstream>
#include <string>

#include <google/protobuf/util/time_util.h>
#include <google/protobuf/struct.pb.h>

namespace {
    std::string ValueToString(const google::protobuf::Value& value)
    {
        using google::protobuf::Value;

        switch (value.kind_case()) {
        case Value::kStringValue:
            return value.string_value();
        case Value::kNumberValue: {
            std::ostringstream oss;
            oss << value.number_value();
            return oss.str();
        }
        case Value::kBoolValue:
            return value.bool_value() ? "true" : "false";
        case Value::kNullValue:
            return "null";
        case Value::kStructValue:
            return "{...}";
        case Value::kListValue:
            return "[...]";
        case Value::KIND_NOT_SET:
        default:
            return "";
        }
    }
}

std::string VideoDisplayName(const Video& video)
{
    const auto& fields = video.meta().fields();

    const auto it = fields.find("name");
    if (it != fields.end()
        && it->second.kind_case() == google::protobuf::Value::kStringValue
        && !it->second.string_value().empty())
        return it->second.string_value();

    return video.uid();
}

std::string VideoStatusDetails(const Video& video)
{
    if (!video.status().error_reason_text().empty())
        return video.status().error_reason_text();

    if (!video.status().pct_complete().empty())
        return video.status().pct_complete() + "% complete";

    return "";
}

std::string VideoToString(const Video& video)
{
    using google::protobuf::util::TimeUtil;

    std::stringstream ss;

    ss << "id: " << video.uid() << std::endl;
    ss << "name: " << VideoDisplayName(video) << std::endl;
    ss << "status: " << video.status().state();

    const std::string details = VideoStatusDetails(video);
    if (!details.empty())
        ss << " (" << details << ")";
    ss << std::endl;

    ss << "ready: " << (video.ready_to_stream() ? "yes" : "no") << std::endl;
    ss << "signed urls: " << (video.require_signed_urls() ? "required" : "not required") << std::endl;

    if (video.duration() > 0)
        ss << "duration: " << video.duration() << "s" << std::endl;
    if (video.size() > 0)
        ss << "size: " << video.size() << std::endl;
    if (!video.preview().empty())
        ss << "preview: " << video.preview() << std::endl;
    if (video.has_created())
        ss << "created: " << TimeUtil::ToString(video.created()) << std::endl;
    if (video.has_modified())
        ss << "modified: " << TimeUtil::ToString(video.modified()) << std::endl;

    for (const auto& [key, value] : video.meta().fields())
        ss << "meta." << key << ": " << ValueToString(value) << std::endl;

    return ss.str();
}

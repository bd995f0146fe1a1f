#include "DescriptorFormat.hpp"

#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>

#include "pairchat.pb.h"

using namespace pairchat::signaling;

std::string_view pairchat::signaling::toString(DescriptorError error) {
    switch (error) {
        case DescriptorError::Malformed:   return "descriptor is not a valid record";
        case DescriptorError::MissingType: return "descriptor has no type";
        case DescriptorError::UnknownType: return "descriptor type is neither offer nor answer";
        case DescriptorError::MissingSdp:  return "descriptor has no sdp";
        case DescriptorError::EncodingFailed: return "descriptor could not be rendered as text";
    }
    return "unknown descriptor error";
}

auto pairchat::signaling::serializeDescriptor(const SessionDescriptor& desc) -> std::expected<std::string, DescriptorError> {
    wire::DescriptorRecord record;
    record.set_type(std::string(toString(desc.type)));
    record.set_sdp(desc.sdp);

    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string text;
    auto status = google::protobuf::util::MessageToJsonString(record, &text, options);
    if (!status.ok()) {
        spdlog::error("Failed to print session descriptor: {}", status.ToString());
        return std::unexpected(DescriptorError::EncodingFailed);
    }
    return text;
}

auto pairchat::signaling::parseDescriptor(std::string_view text) -> std::expected<SessionDescriptor, DescriptorError> {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    wire::DescriptorRecord record;
    auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &record, options);
    if (!status.ok())
        return std::unexpected(DescriptorError::Malformed);

    SessionDescriptor desc;
    if (record.type().empty())
        return std::unexpected(DescriptorError::MissingType);
    if (record.type() == toString(DescriptionType::Offer))
        desc.type = DescriptionType::Offer;
    else if (record.type() == toString(DescriptionType::Answer))
        desc.type = DescriptionType::Answer;
    else
        return std::unexpected(DescriptorError::UnknownType);

    if (record.sdp().empty())
        return std::unexpected(DescriptorError::MissingSdp);
    desc.sdp = record.sdp();
    return desc;
}

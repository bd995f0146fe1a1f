#pragma once
#include <expected>
#include <string>
#include <string_view>
#include "SignalingTypes.hpp"

namespace pairchat::signaling {

enum class DescriptorError {
    Malformed,
    MissingType,
    UnknownType,
    MissingSdp,
    EncodingFailed
};

std::string_view toString(DescriptorError error);

// {"type":"offer","sdp":"v=0..."}
auto serializeDescriptor(const SessionDescriptor& desc) -> std::expected<std::string, DescriptorError>;
auto parseDescriptor(std::string_view text) -> std::expected<SessionDescriptor, DescriptorError>;

}

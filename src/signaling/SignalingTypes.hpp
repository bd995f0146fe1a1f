#pragma once
#include <string>
#include <string_view>

namespace pairchat::signaling {

enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

enum class DescriptionType {
    Offer,
    Answer
};

struct SessionDescriptor {
    DescriptionType type;
    std::string sdp;
};

constexpr std::string_view toString(DescriptionType type) {
    switch (type) {
        case DescriptionType::Offer:  return "offer";
        case DescriptionType::Answer: return "answer";
    }
    return "unknown";
}

constexpr std::string_view toString(TransportState state) {
    switch (state) {
        case TransportState::New:          return "new";
        case TransportState::Connecting:   return "connecting";
        case TransportState::Connected:    return "connected";
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Failed:       return "failed";
        case TransportState::Closed:       return "closed";
    }
    return "unknown";
}

}

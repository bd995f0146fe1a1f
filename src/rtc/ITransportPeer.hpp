#pragma once
#include <cstddef>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include "../signaling/SignalingTypes.hpp"

namespace pairchat::rtc {

using Payload = std::vector<std::byte>;

enum class PeerErrorCode {
    InvalidDescription,
    DescriptionTypeMismatch,
    NegotiationFailed,
    GatheringTimeout,
    Cancelled,
    ChannelNotOpen,
    SendFailed,
    EngineFailure,
    Closed
};

struct PeerError {
    PeerErrorCode code;
    std::string message;
};

constexpr std::string_view toString(PeerErrorCode code) {
    switch (code) {
        case PeerErrorCode::InvalidDescription:      return "invalid session description";
        case PeerErrorCode::DescriptionTypeMismatch: return "session description has the wrong type";
        case PeerErrorCode::NegotiationFailed:       return "negotiation failed";
        case PeerErrorCode::GatheringTimeout:        return "candidate gathering timed out";
        case PeerErrorCode::Cancelled:               return "operation cancelled";
        case PeerErrorCode::ChannelNotOpen:          return "data channel is not open";
        case PeerErrorCode::SendFailed:              return "send failed";
        case PeerErrorCode::EngineFailure:           return "transport engine failure";
        case PeerErrorCode::Closed:                  return "peer is closed";
    }
    return "unknown peer error";
}

// The only seam between the chat session and the real-time transport engine.
// createOffer/createAnswer block until candidate gathering is complete; the
// stop token and close() both abort the wait.
class ITransportPeer {
public:
    using MessageHandler = std::function<void(const Payload&)>;
    using StateHandler = std::function<void(signaling::TransportState)>;

    virtual ~ITransportPeer() = default;

    virtual auto createOffer(std::stop_token stop) -> std::expected<signaling::SessionDescriptor, PeerError> = 0;
    virtual auto createAnswer(const signaling::SessionDescriptor& remote, std::stop_token stop)
        -> std::expected<signaling::SessionDescriptor, PeerError> = 0;
    virtual auto setRemoteAnswer(const signaling::SessionDescriptor& remote) -> std::expected<void, PeerError> = 0;
    virtual auto setRemoteOffer(const signaling::SessionDescriptor& remote) -> std::expected<void, PeerError> = 0;
    virtual auto send(const Payload& data) -> std::expected<void, PeerError> = 0;

    // Single slot: registering replaces the previous handler.
    virtual void onMessage(MessageHandler handler) = 0;
    virtual void onStateChange(StateHandler handler) = 0;

    virtual auto close() -> std::expected<void, PeerError> = 0;
};

}

#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <variant>
#include "../protocol/ChatMessage.hpp"
#include "../rtc/ITransportPeer.hpp"
#include "../signaling/DescriptorFormat.hpp"
#include "../signaling/TokenCodec.hpp"

namespace pairchat::session {

enum class ConnectionState {
    Idle,
    OfferCreated,
    AwaitingAnswer,
    AnswerAccepted,
    Connected,
    Disconnected,
    Closed
};

enum class SessionErrorCode {
    UsernameEmpty,
    AlreadyConnected,
    HandshakeInProgress,
    InvalidState,
    EmptyRoomCode,
    InvalidRoomCode,
    EmptyAnswerCode,
    InvalidAnswerCode,
    NotConnected,
    EmptyText,
    MessageTooLong,
    EncodingFailed,
    TransportFailure,
    InvalidMessage,
    SessionClosed
};

using ErrorCause = std::variant<
    std::monostate,
    signaling::CodecError,
    signaling::DescriptorError,
    protocol::WireError,
    rtc::PeerError>;

struct SessionError {
    SessionErrorCode code;
    std::string detail;
    ErrorCause cause;
};

struct SessionConfig {
    // Lets the data channel settle before the join announcement goes out.
    std::chrono::milliseconds joinGraceDelay{100};
};

std::string_view toString(ConnectionState state);
std::string_view toString(SessionErrorCode code);

// "<code>: <detail> (<cause>)"
std::string describe(const SessionError& error);

}

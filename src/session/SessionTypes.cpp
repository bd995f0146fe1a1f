#include "SessionTypes.hpp"

#include <type_traits>

using namespace pairchat::session;

std::string_view pairchat::session::toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:           return "idle";
        case ConnectionState::OfferCreated:   return "offer-created";
        case ConnectionState::AwaitingAnswer: return "awaiting-answer";
        case ConnectionState::AnswerAccepted: return "answer-accepted";
        case ConnectionState::Connected:      return "connected";
        case ConnectionState::Disconnected:   return "disconnected";
        case ConnectionState::Closed:         return "closed";
    }
    return "unknown";
}

std::string_view pairchat::session::toString(SessionErrorCode code) {
    switch (code) {
        case SessionErrorCode::UsernameEmpty:       return "username cannot be empty";
        case SessionErrorCode::AlreadyConnected:    return "already connected to a room";
        case SessionErrorCode::HandshakeInProgress: return "another handshake step is in progress";
        case SessionErrorCode::InvalidState:        return "operation not allowed in the current state";
        case SessionErrorCode::EmptyRoomCode:       return "room code cannot be empty";
        case SessionErrorCode::InvalidRoomCode:     return "invalid room code";
        case SessionErrorCode::EmptyAnswerCode:     return "answer code cannot be empty";
        case SessionErrorCode::InvalidAnswerCode:   return "invalid answer code";
        case SessionErrorCode::NotConnected:        return "not connected to any room";
        case SessionErrorCode::EmptyText:           return "message text cannot be empty";
        case SessionErrorCode::MessageTooLong:      return "message text exceeds 1000 characters";
        case SessionErrorCode::EncodingFailed:      return "failed to encode outgoing data";
        case SessionErrorCode::TransportFailure:    return "transport failure";
        case SessionErrorCode::InvalidMessage:      return "invalid message received";
        case SessionErrorCode::SessionClosed:       return "session is closed";
    }
    return "unknown session error";
}

std::string pairchat::session::describe(const SessionError& error) {
    std::string text(toString(error.code));
    if (!error.detail.empty())
        text += ": " + error.detail;

    std::string cause = std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>)
            return {};
        else if constexpr (std::is_same_v<T, rtc::PeerError>)
            return std::string(rtc::toString(value.code)) + (value.message.empty() ? "" : ", " + value.message);
        else
            return std::string(toString(value));
    }, error.cause);

    if (!cause.empty())
        text += " (" + cause + ")";
    return text;
}

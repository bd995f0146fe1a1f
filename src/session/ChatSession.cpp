#include "ChatSession.hpp"

#include <algorithm>
#include <mutex>
#include <spdlog/spdlog.h>

#include "../signaling/DescriptorFormat.hpp"
#include "../signaling/TokenCodec.hpp"

using namespace pairchat::session;
using pairchat::protocol::MessageKind;
using pairchat::signaling::TransportState;

namespace {

constexpr std::size_t kLoggedCodePrefix = 10;

std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
        return {};
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string shortCode(std::string_view code) {
    return std::string(code.substr(0, std::min(code.size(), kLoggedCodePrefix))) + "...";
}

pairchat::rtc::Payload toPayload(std::string_view text) {
    pairchat::rtc::Payload data(text.size());
    std::transform(text.begin(), text.end(), data.begin(), [](char c) { return std::byte(c); });
    return data;
}

SessionError makeError(SessionErrorCode code, std::string detail = {}, ErrorCause cause = {}) {
    return SessionError{code, std::move(detail), std::move(cause)};
}

}

LinkChange pairchat::session::classifyTransportState(TransportState state) {
    switch (state) {
        case TransportState::Connected:
            return LinkChange::Up;
        case TransportState::Disconnected:
        case TransportState::Failed:
        case TransportState::Closed:
            return LinkChange::Down;
        default:
            return LinkChange::Unchanged;
    }
}

auto ChatSession::create(std::string username, std::unique_ptr<rtc::ITransportPeer> peer,
                         dispatch::Dispatcher& dispatcher, SessionConfig config)
    -> std::expected<std::shared_ptr<ChatSession>, SessionError> {
    if (username.empty())
        return std::unexpected(makeError(SessionErrorCode::UsernameEmpty));
    if (!peer)
        return std::unexpected(makeError(SessionErrorCode::TransportFailure, "no transport peer"));

    auto session = std::make_shared<ChatSession>(Token{}, std::move(username), std::move(peer), dispatcher, config);
    session->setCallbacks();
    return session;
}

ChatSession::~ChatSession() {
    peer_->onMessage({});
    peer_->onStateChange({});
    if (auto closed = peer_->close(); !closed)
        spdlog::warn("Error closing transport peer: {}", closed.error().message);
}

void ChatSession::setCallbacks() {
    auto weakSelf = weak_from_this();

    peer_->onMessage([weakSelf](const rtc::Payload& data) {
        if (auto self = weakSelf.lock()) {
            self->handleIncoming(data);
        }
    });

    peer_->onStateChange([weakSelf](TransportState state) {
        if (auto self = weakSelf.lock()) {
            self->handleTransportState(state);
        }
    });
}

template <typename Fn>
void ChatSession::postToDispatcher(std::chrono::milliseconds delay, Fn&& fn) {
    auto weakSelf = weak_from_this();
    dispatcher_.postAfter(delay, [weakSelf, fn = std::forward<Fn>(fn)]() mutable {
        if (auto self = weakSelf.lock()) {
            fn(*self);
        }
    });
}

auto ChatSession::beginHandshake(ConnectionState required) -> std::expected<void, SessionError> {
    std::unique_lock lock(mutex_);
    if (state_ == ConnectionState::Closed)
        return std::unexpected(makeError(SessionErrorCode::SessionClosed));
    if (connected_)
        return std::unexpected(makeError(SessionErrorCode::AlreadyConnected));
    if (handshakeBusy_)
        return std::unexpected(makeError(SessionErrorCode::HandshakeInProgress));
    if (state_ != required)
        return std::unexpected(makeError(SessionErrorCode::InvalidState,
            "session is " + std::string(toString(state_))));
    handshakeBusy_ = true;
    return {};
}

void ChatSession::abortHandshake() {
    std::unique_lock lock(mutex_);
    handshakeBusy_ = false;
}

auto ChatSession::completeHandshake(ConnectionState from, ConnectionState to, const std::string* roomCode)
    -> std::expected<void, SessionError> {
    std::unique_lock lock(mutex_);
    handshakeBusy_ = false;
    if (state_ == ConnectionState::Closed)
        return std::unexpected(makeError(SessionErrorCode::SessionClosed, "disconnected during handshake"));
    // The transport may already have reported the link up.
    if (state_ == from)
        state_ = to;
    if (roomCode)
        roomCode_ = *roomCode;
    return {};
}

auto ChatSession::createRoom(std::stop_token stop) -> std::expected<std::string, SessionError> {
    if (auto begun = beginHandshake(ConnectionState::Idle); !begun)
        return std::unexpected(begun.error());

    auto offer = peer_->createOffer(stop);
    if (!offer) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::TransportFailure, "failed to create offer", offer.error()));
    }

    auto text = signaling::serializeDescriptor(*offer);
    if (!text) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::EncodingFailed, "failed to render offer", text.error()));
    }

    auto code = signaling::encode(*text);
    if (!code) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::EncodingFailed, "failed to encode offer", code.error()));
    }

    if (auto done = completeHandshake(ConnectionState::Idle, ConnectionState::OfferCreated, &*code); !done)
        return std::unexpected(done.error());

    spdlog::info("Created room with code: {}", shortCode(*code));
    return *code;
}

auto ChatSession::joinRoom(std::string_view roomCode, std::stop_token stop) -> std::expected<std::string, SessionError> {
    if (isConnected())
        return std::unexpected(makeError(SessionErrorCode::AlreadyConnected));

    auto code = trim(roomCode);
    if (code.empty())
        return std::unexpected(makeError(SessionErrorCode::EmptyRoomCode));

    if (auto begun = beginHandshake(ConnectionState::Idle); !begun)
        return std::unexpected(begun.error());

    auto text = signaling::decode(code);
    if (!text) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::InvalidRoomCode, {}, text.error()));
    }

    auto offer = signaling::parseDescriptor(*text);
    if (!offer) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::InvalidRoomCode, {}, offer.error()));
    }

    auto answer = peer_->createAnswer(*offer, stop);
    if (!answer) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::TransportFailure, "failed to create answer", answer.error()));
    }

    auto answerText = signaling::serializeDescriptor(*answer);
    if (!answerText) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::EncodingFailed, "failed to render answer", answerText.error()));
    }

    auto answerCode = signaling::encode(*answerText);
    if (!answerCode) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::EncodingFailed, "failed to encode answer", answerCode.error()));
    }

    const std::string joinedCode(code);
    if (auto done = completeHandshake(ConnectionState::Idle, ConnectionState::AwaitingAnswer, &joinedCode); !done)
        return std::unexpected(done.error());

    spdlog::info("Created answer for room. Answer code: {}", shortCode(*answerCode));
    return *answerCode;
}

auto ChatSession::acceptAnswer(std::string_view answerCode) -> std::expected<void, SessionError> {
    auto code = trim(answerCode);
    if (code.empty())
        return std::unexpected(makeError(SessionErrorCode::EmptyAnswerCode));

    if (auto begun = beginHandshake(ConnectionState::OfferCreated); !begun)
        return std::unexpected(begun.error());

    auto text = signaling::decode(code);
    if (!text) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::InvalidAnswerCode, {}, text.error()));
    }

    auto answer = signaling::parseDescriptor(*text);
    if (!answer) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::InvalidAnswerCode, {}, answer.error()));
    }

    if (auto applied = peer_->setRemoteAnswer(*answer); !applied) {
        abortHandshake();
        return std::unexpected(makeError(SessionErrorCode::TransportFailure, "failed to set remote answer", applied.error()));
    }

    if (auto done = completeHandshake(ConnectionState::OfferCreated, ConnectionState::AnswerAccepted, nullptr); !done)
        return std::unexpected(done.error());

    spdlog::info("Accepted answer from peer");
    return {};
}

auto ChatSession::sendMessage(std::string_view text) -> std::expected<void, SessionError> {
    if (!isConnected())
        return std::unexpected(makeError(SessionErrorCode::NotConnected));
    if (text.empty())
        return std::unexpected(makeError(SessionErrorCode::EmptyText));

    auto msg = protocol::newMessage(MessageKind::Chat, username_, std::string(text));
    if (auto valid = protocol::validate(msg); !valid) {
        if (valid.error() == protocol::WireError::BodyTooLong)
            return std::unexpected(makeError(SessionErrorCode::MessageTooLong));
        return std::unexpected(makeError(SessionErrorCode::EncodingFailed, {}, valid.error()));
    }

    auto line = protocol::serialize(msg);
    if (!line)
        return std::unexpected(makeError(SessionErrorCode::EncodingFailed, {}, line.error()));

    if (auto sent = peer_->send(toPayload(*line)); !sent)
        return std::unexpected(makeError(SessionErrorCode::TransportFailure, "failed to send message", sent.error()));

    spdlog::debug("Sent message ({} bytes)", text.size());
    return {};
}

auto ChatSession::disconnect() -> std::expected<void, SessionError> {
    bool wasConnected;
    EventCallback disconnected;
    {
        std::unique_lock lock(mutex_);
        if (state_ == ConnectionState::Closed)
            return {};
        wasConnected = connected_;
        connected_ = false;
        state_ = ConnectionState::Closed;
        roomCode_.clear();
        disconnected = onDisconnected_;
    }

    if (wasConnected) {
        auto line = protocol::serialize(protocol::newMessage(MessageKind::Leave, username_, ""));
        if (!line) {
            spdlog::warn("Failed to encode leave message: {}", protocol::toString(line.error()));
        } else if (auto sent = peer_->send(toPayload(*line)); !sent) {
            spdlog::warn("Failed to send leave message: {}", sent.error().message);
        }
    }

    auto closed = peer_->close();

    if (wasConnected && disconnected)
        dispatcher_.post(std::move(disconnected));

    if (!closed)
        return std::unexpected(makeError(SessionErrorCode::TransportFailure, "failed to close peer", closed.error()));
    spdlog::info("Session closed");
    return {};
}

void ChatSession::handleTransportState(TransportState state) {
    auto change = classifyTransportState(state);
    if (change == LinkChange::Unchanged)
        return;

    bool becameConnected = false;
    bool becameDisconnected = false;
    {
        std::unique_lock lock(mutex_);
        if (state_ == ConnectionState::Closed)
            return;

        const bool wasConnected = connected_;
        connected_ = change == LinkChange::Up;

        // Queued under the lock so concurrent edges reach the dispatcher in
        // the order they were decided.
        if (connected_ && !wasConnected) {
            state_ = ConnectionState::Connected;
            becameConnected = true;
            if (onConnected_)
                dispatcher_.post(onConnected_);
            postToDispatcher(config_.joinGraceDelay, [](ChatSession& self) {
                self.announce(MessageKind::Join);
            });
        } else if (!connected_ && wasConnected) {
            state_ = ConnectionState::Disconnected;
            becameDisconnected = true;
            if (onDisconnected_)
                dispatcher_.post(onDisconnected_);
        } else if (!connected_ && state_ != ConnectionState::Idle && state_ != ConnectionState::Disconnected) {
            spdlog::warn("Connection attempt ended with transport state {}", signaling::toString(state));
            state_ = ConnectionState::Disconnected;
        }
    }

    if (becameConnected)
        spdlog::info("Connected to peer");
    else if (becameDisconnected)
        spdlog::info("Disconnected from peer");
}

void ChatSession::announce(MessageKind kind) {
    if (!isConnected()) {
        spdlog::debug("Skipping {} announcement, link is down", protocol::toString(kind));
        return;
    }

    auto line = protocol::serialize(protocol::newMessage(kind, username_, ""));
    if (!line) {
        spdlog::warn("Failed to encode {} message: {}", protocol::toString(kind), protocol::toString(line.error()));
        return;
    }
    if (auto sent = peer_->send(toPayload(*line)); !sent)
        spdlog::warn("Failed to send {} message: {}", protocol::toString(kind), sent.error().message);
}

void ChatSession::handleIncoming(const rtc::Payload& data) {
    std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
    auto message = protocol::deserialize(text);
    if (!message) {
        spdlog::warn("Failed to parse incoming message: {}", protocol::toString(message.error()));
        ErrorCallback callback;
        {
            std::shared_lock lock(mutex_);
            callback = onError_;
        }
        if (callback) {
            dispatcher_.post([callback, error = makeError(SessionErrorCode::InvalidMessage, {}, message.error())]() {
                callback(error);
            });
        }
        return;
    }

    switch (message->kind) {
        case MessageKind::Join:
            spdlog::info("{} joined the chat", message->sender);
            break;
        case MessageKind::Leave:
            spdlog::info("{} left the chat", message->sender);
            break;
        case MessageKind::Chat:
            spdlog::debug("Received message from {}", message->sender);
            break;
    }

    MessageCallback callback;
    {
        std::shared_lock lock(mutex_);
        callback = onMessage_;
    }
    if (callback) {
        dispatcher_.post([callback, msg = std::move(*message)]() {
            callback(msg);
        });
    }
}

bool ChatSession::isConnected() const {
    std::shared_lock lock(mutex_);
    return connected_;
}

std::string ChatSession::roomCode() const {
    std::shared_lock lock(mutex_);
    return roomCode_;
}

ConnectionState ChatSession::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

std::string ChatSession::connectionStatus() const {
    std::shared_lock lock(mutex_);
    if (connected_)
        return "Connected - ready to chat!";
    switch (state_) {
        case ConnectionState::OfferCreated:
        case ConnectionState::AnswerAccepted:
            return "Room created - waiting for connection...";
        case ConnectionState::AwaitingAnswer:
            return "Answer created - waiting for the host to accept it...";
        case ConnectionState::Disconnected:
            return "Connection lost";
        case ConnectionState::Closed:
            return "Disconnected";
        default:
            return "Not connected";
    }
}

std::string ChatSession::connectionInstructions() const {
    std::shared_lock lock(mutex_);
    if (state_ == ConnectionState::OfferCreated || state_ == ConnectionState::AnswerAccepted) {
        return "Connection Instructions:\n"
               "1. You created a room - share your room code with the other person\n"
               "2. They will join your room and give you an \"answer code\"\n"
               "3. Paste their answer code to complete the connection";
    }
    return "Connection Instructions:\n"
           "1. Get a room code from someone else\n"
           "2. Join the room with their code - you'll get an \"answer code\"\n"
           "3. Send your answer code back to them\n"
           "4. The connection is established once they accept your answer";
}

void ChatSession::onMessage(MessageCallback callback) {
    std::unique_lock lock(mutex_);
    onMessage_ = std::move(callback);
}

void ChatSession::onConnected(EventCallback callback) {
    std::unique_lock lock(mutex_);
    onConnected_ = std::move(callback);
}

void ChatSession::onDisconnected(EventCallback callback) {
    std::unique_lock lock(mutex_);
    onDisconnected_ = std::move(callback);
}

void ChatSession::onError(ErrorCallback callback) {
    std::unique_lock lock(mutex_);
    onError_ = std::move(callback);
}

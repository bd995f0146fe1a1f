#pragma once
#include <expected>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include "SessionTypes.hpp"
#include "../dispatcher/Dispatcher.hpp"
#include "../protocol/ChatMessage.hpp"
#include "../rtc/ITransportPeer.hpp"

namespace pairchat::session {

enum class LinkChange {
    Up,
    Down,
    Unchanged
};

// Connected is the only connected-equivalent state. Disconnected, Failed and
// Closed take the link down. Anything else, including states added later,
// leaves the link as it is.
LinkChange classifyTransportState(signaling::TransportState state);

// Drives the copy/paste handshake over an exclusively owned transport peer and
// turns transport state notifications into edge-triggered connected and
// disconnected events. User callbacks run on the dispatcher thread, never
// under the session lock.
class ChatSession : public std::enable_shared_from_this<ChatSession> {
public:
    using MessageCallback = std::function<void(const protocol::ChatMessage&)>;
    using EventCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const SessionError&)>;

    static auto create(std::string username, std::unique_ptr<rtc::ITransportPeer> peer,
                       dispatch::Dispatcher& dispatcher, SessionConfig config = {})
        -> std::expected<std::shared_ptr<ChatSession>, SessionError>;
    ~ChatSession();

    // Offerer: returns the room code to share.
    auto createRoom(std::stop_token stop = {}) -> std::expected<std::string, SessionError>;
    // Answerer: returns the answer code to send back.
    auto joinRoom(std::string_view roomCode, std::stop_token stop = {}) -> std::expected<std::string, SessionError>;
    // Offerer: completes the handshake with the answer code.
    auto acceptAnswer(std::string_view answerCode) -> std::expected<void, SessionError>;
    auto sendMessage(std::string_view text) -> std::expected<void, SessionError>;
    auto disconnect() -> std::expected<void, SessionError>;

    const std::string& username() const { return username_; }
    bool isConnected() const;
    std::string roomCode() const;
    ConnectionState state() const;
    // One-line status and handshake steps for a front end to show.
    std::string connectionStatus() const;
    std::string connectionInstructions() const;

    void onMessage(MessageCallback callback);
    void onConnected(EventCallback callback);
    void onDisconnected(EventCallback callback);
    void onError(ErrorCallback callback);

private:
    struct Token {
        explicit Token() = default;
    };

public:
    // Reachable only through create().
    ChatSession(Token, std::string username, std::unique_ptr<rtc::ITransportPeer> peer,
                dispatch::Dispatcher& dispatcher, SessionConfig config)
        : username_(std::move(username)), config_(config), peer_(std::move(peer)), dispatcher_(dispatcher) {}

private:

    const std::string username_;
    const SessionConfig config_;
    std::unique_ptr<rtc::ITransportPeer> peer_;
    dispatch::Dispatcher& dispatcher_;

    mutable std::shared_mutex mutex_;
    ConnectionState state_ = ConnectionState::Idle;
    bool connected_ = false;
    bool handshakeBusy_ = false;
    std::string roomCode_;
    MessageCallback onMessage_;
    EventCallback onConnected_;
    EventCallback onDisconnected_;
    ErrorCallback onError_;

    void setCallbacks();
    void handleTransportState(signaling::TransportState state);
    void handleIncoming(const rtc::Payload& data);
    void announce(protocol::MessageKind kind);
    auto beginHandshake(ConnectionState required) -> std::expected<void, SessionError>;
    void abortHandshake();
    auto completeHandshake(ConnectionState from, ConnectionState to, const std::string* roomCode)
        -> std::expected<void, SessionError>;
    template <typename Fn> void postToDispatcher(std::chrono::milliseconds delay, Fn&& fn);
};

}

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <rtc/rtc.hpp>
#include "ITransportPeer.hpp"

namespace pairchat::rtc {

struct PeerConfig {
    std::vector<std::string> iceServers{"stun:stun.l.google.com:19302"};
    std::chrono::milliseconds gatheringTimeout{std::chrono::seconds(10)};
    std::string channelLabel{"chat"};
    // 0 keeps the engine default.
    std::uint16_t portRangeBegin = 0;
    std::uint16_t portRangeEnd = 0;
    std::size_t maxMessageSize = 0;
};

signaling::TransportState toTransportState(::rtc::PeerConnection::State state);

// ITransportPeer backed by a libdatachannel PeerConnection with one ordered,
// reliable data channel. The offerer creates the channel; the answerer
// receives it through onDataChannel once the remote side connects.
class RtcPeer final : public ITransportPeer {
public:
    static auto create(PeerConfig config = {}) -> std::expected<std::unique_ptr<RtcPeer>, PeerError>;
    ~RtcPeer() override;

    auto createOffer(std::stop_token stop) -> std::expected<signaling::SessionDescriptor, PeerError> override;
    auto createAnswer(const signaling::SessionDescriptor& remote, std::stop_token stop)
        -> std::expected<signaling::SessionDescriptor, PeerError> override;
    auto setRemoteAnswer(const signaling::SessionDescriptor& remote) -> std::expected<void, PeerError> override;
    auto setRemoteOffer(const signaling::SessionDescriptor& remote) -> std::expected<void, PeerError> override;
    auto send(const Payload& data) -> std::expected<void, PeerError> override;
    void onMessage(MessageHandler handler) override;
    void onStateChange(StateHandler handler) override;
    auto close() -> std::expected<void, PeerError> override;

private:
    struct Token {
        explicit Token() = default;
    };

public:
    // Reachable only through create().
    RtcPeer(Token, PeerConfig config) : config_(std::move(config)) {}

private:

    PeerConfig config_;
    std::unique_ptr<::rtc::PeerConnection> peerConnection_;
    std::atomic<bool> closed_{false};

    std::mutex mutex_;
    std::shared_ptr<::rtc::DataChannel> dataChannel_;
    MessageHandler messageHandler_;
    StateHandler stateHandler_;

    std::mutex gatherMutex_;
    std::condition_variable_any gatherCv_;

    void start();
    ::rtc::Configuration buildConfiguration() const;
    void attachDataChannel(std::shared_ptr<::rtc::DataChannel> channel);
    void deliverMessage(const Payload& data);
    auto applyRemoteDescription(const signaling::SessionDescriptor& remote) -> std::expected<void, PeerError>;
    auto awaitLocalDescription(std::stop_token stop) -> std::expected<signaling::SessionDescriptor, PeerError>;
};

}

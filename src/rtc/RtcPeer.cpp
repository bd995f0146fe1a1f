#include "RtcPeer.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <spdlog/spdlog.h>

using namespace pairchat::rtc;
using pairchat::signaling::DescriptionType;
using pairchat::signaling::SessionDescriptor;
using pairchat::signaling::TransportState;

TransportState pairchat::rtc::toTransportState(::rtc::PeerConnection::State state) {
    switch (state) {
        case ::rtc::PeerConnection::State::New:          return TransportState::New;
        case ::rtc::PeerConnection::State::Connecting:   return TransportState::Connecting;
        case ::rtc::PeerConnection::State::Connected:    return TransportState::Connected;
        case ::rtc::PeerConnection::State::Disconnected: return TransportState::Disconnected;
        case ::rtc::PeerConnection::State::Failed:       return TransportState::Failed;
        case ::rtc::PeerConnection::State::Closed:       return TransportState::Closed;
    }
    return TransportState::New;
}

auto RtcPeer::create(PeerConfig config) -> std::expected<std::unique_ptr<RtcPeer>, PeerError> {
    auto peer = std::make_unique<RtcPeer>(Token{}, std::move(config));
    try {
        peer->start();
    } catch (const std::exception& e) {
        return std::unexpected(PeerError{PeerErrorCode::EngineFailure, e.what()});
    }
    return peer;
}

::rtc::Configuration RtcPeer::buildConfiguration() const {
    ::rtc::Configuration config;
    for (const auto& url : config_.iceServers)
        config.iceServers.emplace_back(url);
    if (config_.portRangeBegin != 0)
        config.portRangeBegin = config_.portRangeBegin;
    if (config_.portRangeEnd != 0)
        config.portRangeEnd = config_.portRangeEnd;
    if (config_.maxMessageSize != 0)
        config.maxMessageSize = config_.maxMessageSize;
    // Descriptions are produced explicitly by createOffer/createAnswer.
    config.disableAutoNegotiation = true;
    return config;
}

void RtcPeer::start() {
    peerConnection_ = std::make_unique<::rtc::PeerConnection>(buildConfiguration());

    peerConnection_->onStateChange([this](::rtc::PeerConnection::State state) {
        auto transportState = toTransportState(state);
        spdlog::info("Connection state changed: {}", signaling::toString(transportState));

        StateHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = stateHandler_;
        }
        if (handler)
            handler(transportState);
    });

    peerConnection_->onGatheringStateChange([this](::rtc::PeerConnection::GatheringState state) {
        spdlog::debug("Candidate gathering state: {}", static_cast<int>(state));
        if (state == ::rtc::PeerConnection::GatheringState::Complete) {
            std::lock_guard<std::mutex> lock(gatherMutex_);
            gatherCv_.notify_all();
        }
    });
}

RtcPeer::~RtcPeer() {
    if (auto closed = close(); !closed)
        spdlog::warn("Error closing peer: {}", closed.error().message);
    if (peerConnection_)
        peerConnection_->resetCallbacks();
}

void RtcPeer::attachDataChannel(std::shared_ptr<::rtc::DataChannel> channel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dataChannel_ = channel;
    }

    auto label = channel->label();
    channel->onOpen([label]() {
        spdlog::info("Data channel '{}' opened", label);
    });

    channel->onClosed([label]() {
        spdlog::info("Data channel '{}' closed", label);
    });

    channel->onError([label](std::string error) {
        spdlog::warn("Data channel '{}' error: {}", label, error);
    });

    channel->onMessage(
        [this](::rtc::binary data) {
            deliverMessage(data);
        },
        [this](std::string text) {
            Payload data(text.size());
            std::transform(text.begin(), text.end(), data.begin(), [](char c) { return std::byte(c); });
            deliverMessage(data);
        });
}

void RtcPeer::deliverMessage(const Payload& data) {
    spdlog::debug("Received {} bytes", data.size());
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = messageHandler_;
    }
    if (handler)
        handler(data);
}

auto RtcPeer::createOffer(std::stop_token stop) -> std::expected<SessionDescriptor, PeerError> {
    if (closed_)
        return std::unexpected(PeerError{PeerErrorCode::Closed, "peer is closed"});

    try {
        bool hasChannel;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hasChannel = dataChannel_ != nullptr;
        }
        if (!hasChannel)
            attachDataChannel(peerConnection_->createDataChannel(config_.channelLabel));

        peerConnection_->setLocalDescription(::rtc::Description::Type::Offer);
    } catch (const std::exception& e) {
        return std::unexpected(PeerError{PeerErrorCode::NegotiationFailed, e.what()});
    }

    return awaitLocalDescription(stop);
}

auto RtcPeer::createAnswer(const SessionDescriptor& remote, std::stop_token stop) -> std::expected<SessionDescriptor, PeerError> {
    if (auto applied = setRemoteOffer(remote); !applied)
        return std::unexpected(applied.error());

    try {
        peerConnection_->setLocalDescription(::rtc::Description::Type::Answer);
    } catch (const std::exception& e) {
        return std::unexpected(PeerError{PeerErrorCode::NegotiationFailed, e.what()});
    }

    return awaitLocalDescription(stop);
}

auto RtcPeer::setRemoteAnswer(const SessionDescriptor& remote) -> std::expected<void, PeerError> {
    if (remote.type != DescriptionType::Answer)
        return std::unexpected(PeerError{PeerErrorCode::DescriptionTypeMismatch, "expected an answer"});
    return applyRemoteDescription(remote);
}

auto RtcPeer::setRemoteOffer(const SessionDescriptor& remote) -> std::expected<void, PeerError> {
    if (remote.type != DescriptionType::Offer)
        return std::unexpected(PeerError{PeerErrorCode::DescriptionTypeMismatch, "expected an offer"});

    peerConnection_->onDataChannel([this](std::shared_ptr<::rtc::DataChannel> channel) {
        spdlog::info("Remote data channel '{}' received", channel->label());
        attachDataChannel(std::move(channel));
    });

    return applyRemoteDescription(remote);
}

auto RtcPeer::applyRemoteDescription(const SessionDescriptor& remote) -> std::expected<void, PeerError> {
    if (closed_)
        return std::unexpected(PeerError{PeerErrorCode::Closed, "peer is closed"});

    const auto type = remote.type == DescriptionType::Offer
        ? ::rtc::Description::Type::Offer
        : ::rtc::Description::Type::Answer;
    try {
        ::rtc::Description description(remote.sdp, type);
        peerConnection_->setRemoteDescription(std::move(description));
    } catch (const std::invalid_argument& e) {
        return std::unexpected(PeerError{PeerErrorCode::InvalidDescription, e.what()});
    } catch (const std::exception& e) {
        return std::unexpected(PeerError{PeerErrorCode::NegotiationFailed, e.what()});
    }
    return {};
}

auto RtcPeer::awaitLocalDescription(std::stop_token stop) -> std::expected<SessionDescriptor, PeerError> {
    {
        std::unique_lock<std::mutex> lock(gatherMutex_);
        bool complete = gatherCv_.wait_for(lock, stop, config_.gatheringTimeout, [this]() {
            return closed_.load() ||
                   peerConnection_->gatheringState() == ::rtc::PeerConnection::GatheringState::Complete;
        });

        if (closed_)
            return std::unexpected(PeerError{PeerErrorCode::Closed, "peer closed while gathering candidates"});
        if (!complete && stop.stop_requested())
            return std::unexpected(PeerError{PeerErrorCode::Cancelled, "candidate gathering cancelled"});
        if (!complete)
            return std::unexpected(PeerError{PeerErrorCode::GatheringTimeout, "candidate gathering did not complete in time"});
    }

    auto local = peerConnection_->localDescription();
    if (!local)
        return std::unexpected(PeerError{PeerErrorCode::NegotiationFailed, "no local description after gathering"});

    SessionDescriptor desc{
        .type = local->type() == ::rtc::Description::Type::Offer ? DescriptionType::Offer : DescriptionType::Answer,
        .sdp = std::string(*local)
    };
    spdlog::debug("Local {} ready ({} bytes)", signaling::toString(desc.type), desc.sdp.size());
    return desc;
}

auto RtcPeer::send(const Payload& data) -> std::expected<void, PeerError> {
    std::shared_ptr<::rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = dataChannel_;
    }
    if (!channel || !channel->isOpen())
        return std::unexpected(PeerError{PeerErrorCode::ChannelNotOpen, "data channel is not open"});

    try {
        channel->send(::rtc::binary(data.begin(), data.end()));
    } catch (const std::exception& e) {
        return std::unexpected(PeerError{PeerErrorCode::SendFailed, e.what()});
    }
    return {};
}

void RtcPeer::onMessage(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageHandler_ = std::move(handler);
}

void RtcPeer::onStateChange(StateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateHandler_ = std::move(handler);
}

auto RtcPeer::close() -> std::expected<void, PeerError> {
    if (closed_.exchange(true)) return {};

    {
        std::lock_guard<std::mutex> lock(gatherMutex_);
        gatherCv_.notify_all();
    }

    std::shared_ptr<::rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = std::move(dataChannel_);
    }

    try {
        if (channel) {
            channel->close();
            channel->resetCallbacks();
        }
        if (peerConnection_)
            peerConnection_->close();
    } catch (const std::exception& e) {
        return std::unexpected(PeerError{PeerErrorCode::EngineFailure, e.what()});
    }
    return {};
}

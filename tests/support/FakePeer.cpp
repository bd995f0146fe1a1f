#include "FakePeer.hpp"

#include <algorithm>

using namespace pairchat::test;
using pairchat::rtc::PeerError;
using pairchat::rtc::PeerErrorCode;
using pairchat::signaling::DescriptionType;
using pairchat::signaling::SessionDescriptor;
using pairchat::signaling::TransportState;

void FakePeer::pair(FakePeer& offerer, FakePeer& answerer) {
    std::scoped_lock lock(offerer.mutex_, answerer.mutex_);
    offerer.partner_ = &answerer;
    answerer.partner_ = &offerer;
}

FakePeer::~FakePeer() {
    FakePeer* partner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        partner = partner_;
        partner_ = nullptr;
    }
    if (partner) {
        std::lock_guard<std::mutex> lock(partner->mutex_);
        if (partner->partner_ == this)
            partner->partner_ = nullptr;
    }
}

std::optional<PeerError> FakePeer::takeFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        return PeerError{PeerErrorCode::Closed, "peer is closed"};
    auto failure = std::move(pendingFailure_);
    pendingFailure_.reset();
    return failure;
}

auto FakePeer::createOffer(std::stop_token stop) -> std::expected<SessionDescriptor, PeerError> {
    int call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        call = ++createOfferCalls_;
    }
    if (auto failure = takeFailure())
        return std::unexpected(*failure);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        offerPending_ = true;
        latch_.wait(lock, stop, [this]() { return !holdOffers_ || closed_; });
        offerPending_ = false;
        if (closed_)
            return std::unexpected(PeerError{PeerErrorCode::Closed, "peer closed while gathering candidates"});
    }
    if (stop.stop_requested())
        return std::unexpected(PeerError{PeerErrorCode::Cancelled, "candidate gathering cancelled"});
    return SessionDescriptor{DescriptionType::Offer, "v=0\r\no=fake-offer " + std::to_string(call) + "\r\n"};
}

auto FakePeer::createAnswer(const SessionDescriptor& remote, std::stop_token stop) -> std::expected<SessionDescriptor, PeerError> {
    int call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        call = ++createAnswerCalls_;
    }
    if (auto applied = setRemoteOffer(remote); !applied)
        return std::unexpected(applied.error());
    if (stop.stop_requested())
        return std::unexpected(PeerError{PeerErrorCode::Cancelled, "candidate gathering cancelled"});
    return SessionDescriptor{DescriptionType::Answer, "v=0\r\no=fake-answer " + std::to_string(call) + "\r\n"};
}

auto FakePeer::setRemoteAnswer(const SessionDescriptor& remote) -> std::expected<void, PeerError> {
    FakePeer* partner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++setRemoteAnswerCalls_;
        partner = partner_;
    }
    if (auto failure = takeFailure())
        return std::unexpected(*failure);
    if (remote.type != DescriptionType::Answer)
        return std::unexpected(PeerError{PeerErrorCode::DescriptionTypeMismatch, "expected an answer"});
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_ = remote;
    }

    if (partner) {
        simulateState(TransportState::Connecting);
        partner->simulateState(TransportState::Connecting);
        simulateState(TransportState::Connected);
        partner->simulateState(TransportState::Connected);
    }
    return {};
}

auto FakePeer::setRemoteOffer(const SessionDescriptor& remote) -> std::expected<void, PeerError> {
    if (auto failure = takeFailure())
        return std::unexpected(*failure);
    if (remote.type != DescriptionType::Offer)
        return std::unexpected(PeerError{PeerErrorCode::DescriptionTypeMismatch, "expected an offer"});

    std::lock_guard<std::mutex> lock(mutex_);
    remote_ = remote;
    return {};
}

auto FakePeer::send(const rtc::Payload& data) -> std::expected<void, PeerError> {
    FakePeer* partner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pendingFailure_) {
            auto failure = std::move(*pendingFailure_);
            pendingFailure_.reset();
            return std::unexpected(failure);
        }
        if (!channelOpen_ || closed_)
            return std::unexpected(PeerError{PeerErrorCode::ChannelNotOpen, "data channel is not open"});

        std::string text(data.size(), '\0');
        std::transform(data.begin(), data.end(), text.begin(), [](std::byte b) { return static_cast<char>(b); });
        sent_.push_back(std::move(text));
        partner = partner_;
    }

    if (partner)
        partner->deliver(data);
    return {};
}

void FakePeer::deliver(const rtc::Payload& data) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        handler = messageHandler_;
    }
    if (handler)
        handler(data);
}

void FakePeer::onMessage(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageHandler_ = std::move(handler);
}

void FakePeer::onStateChange(StateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateHandler_ = std::move(handler);
}

auto FakePeer::close() -> std::expected<void, PeerError> {
    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closeCalls_;
        if (closed_)
            return {};
        closed_ = true;
        channelOpen_ = false;
        handler = stateHandler_;
    }
    latch_.notify_all();
    if (handler)
        handler(TransportState::Closed);
    return {};
}

void FakePeer::simulateState(TransportState state) {
    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state == TransportState::Connected)
            channelOpen_ = true;
        else if (state == TransportState::Disconnected || state == TransportState::Failed ||
                 state == TransportState::Closed)
            channelOpen_ = false;
        handler = stateHandler_;
    }
    if (handler)
        handler(state);
}

void FakePeer::simulateMessage(const std::string& data) {
    rtc::Payload payload(data.size());
    std::transform(data.begin(), data.end(), payload.begin(), [](char c) { return std::byte(c); });
    deliver(payload);
}

void FakePeer::setChannelOpen(bool open) {
    std::lock_guard<std::mutex> lock(mutex_);
    channelOpen_ = open;
}

void FakePeer::failNextCall(PeerError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    pendingFailure_ = std::move(error);
}

void FakePeer::holdOffers() {
    std::lock_guard<std::mutex> lock(mutex_);
    holdOffers_ = true;
}

void FakePeer::releaseOffers() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        holdOffers_ = false;
    }
    latch_.notify_all();
}

bool FakePeer::offerPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return offerPending_;
}

std::vector<std::string> FakePeer::sentMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

std::optional<SessionDescriptor> FakePeer::remoteDescription() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_;
}

int FakePeer::createOfferCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return createOfferCalls_;
}

int FakePeer::createAnswerCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return createAnswerCalls_;
}

int FakePeer::setRemoteAnswerCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return setRemoteAnswerCalls_;
}

int FakePeer::closeCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeCalls_;
}

bool FakePeer::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <google/protobuf/stubs/common.h>
#include <spdlog/spdlog.h>

#include "dispatcher/Dispatcher.hpp"
#include "log/Logging.hpp"
#include "rtc/RtcPeer.hpp"
#include "session/ChatSession.hpp"

// Connects two in-process sessions over the real transport engine, exchanges
// one message and disconnects.
int main(int argc, char** argv) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    const std::string text = argc > 1 ? argv[1] : "hello from the host";

    pairchat::log::init();

    // Outlive the dispatcher and the sessions whose callbacks fulfil them.
    std::promise<void> hostConnected;
    std::promise<std::string> received;

    pairchat::dispatch::Dispatcher dispatcher;
    dispatcher.start();

    // Host candidates are enough for two peers on one machine.
    pairchat::rtc::PeerConfig peerConfig;
    peerConfig.iceServers.clear();

    auto hostPeer = pairchat::rtc::RtcPeer::create(peerConfig);
    auto guestPeer = pairchat::rtc::RtcPeer::create(peerConfig);
    if (!hostPeer || !guestPeer) {
        std::cerr << "Failed to create transport peers\n";
        return 1;
    }

    auto host = pairchat::session::ChatSession::create("host", std::move(*hostPeer), dispatcher);
    auto guest = pairchat::session::ChatSession::create("guest", std::move(*guestPeer), dispatcher);
    if (!host || !guest) {
        std::cerr << "Failed to create sessions\n";
        return 1;
    }

    (*host)->onConnected([&hostConnected]() { hostConnected.set_value(); });
    (*guest)->onMessage([&received, &text](const pairchat::protocol::ChatMessage& msg) {
        if (msg.kind == pairchat::protocol::MessageKind::Chat && msg.body == text)
            received.set_value(msg.sender + ": " + msg.body);
    });

    auto roomCode = (*host)->createRoom();
    if (!roomCode) {
        std::cerr << pairchat::session::describe(roomCode.error()) << "\n";
        return 1;
    }
    std::cout << "Room code (" << roomCode->size() << " chars): " << *roomCode << "\n";

    auto answerCode = (*guest)->joinRoom(*roomCode);
    if (!answerCode) {
        std::cerr << pairchat::session::describe(answerCode.error()) << "\n";
        return 1;
    }
    std::cout << "Answer code (" << answerCode->size() << " chars): " << *answerCode << "\n";

    if (auto accepted = (*host)->acceptAnswer(*answerCode); !accepted) {
        std::cerr << pairchat::session::describe(accepted.error()) << "\n";
        return 1;
    }

    if (hostConnected.get_future().wait_for(std::chrono::seconds(15)) != std::future_status::ready) {
        std::cerr << "Peers did not connect\n";
        return 1;
    }

    // Give the data channel time to open on both sides.
    auto delivered = received.get_future();
    bool sent = false;
    for (int attempt = 0; attempt < 50 && !sent; ++attempt) {
        auto result = (*host)->sendMessage(text);
        if (result) {
            sent = true;
        } else {
            spdlog::debug("Send not ready yet: {}", pairchat::session::describe(result.error()));
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    if (!sent || delivered.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        std::cerr << "Message was not delivered\n";
        return 1;
    }
    std::cout << "Guest received " << delivered.get() << std::endl;

    if (auto closed = (*host)->disconnect(); !closed)
        spdlog::warn("Host disconnect: {}", pairchat::session::describe(closed.error()));
    if (auto closed = (*guest)->disconnect(); !closed)
        spdlog::warn("Guest disconnect: {}", pairchat::session::describe(closed.error()));

    dispatcher.stop();
    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}

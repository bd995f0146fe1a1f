#include "ChatMessage.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <limits>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace pairchat::protocol;

namespace {

// Keeps kind, sender, body, timestamp in that order on the wire.
nlohmann::ordered_json toRecord(const ChatMessage& msg) {
    return nlohmann::ordered_json{
        {"kind", std::string(toString(msg.kind))},
        {"sender", msg.sender},
        {"body", msg.body},
        {"timestamp", msg.timestamp}
    };
}

// Absent and null fields read as empty.
auto readString(const nlohmann::json& record, const char* key) -> std::expected<std::string, WireError> {
    auto it = record.find(key);
    if (it == record.end() || it->is_null())
        return std::string{};
    if (!it->is_string())
        return std::unexpected(WireError::MalformedPayload);
    return it->get<std::string>();
}

auto readTimestamp(const nlohmann::json& record) -> std::expected<std::int64_t, WireError> {
    auto it = record.find("timestamp");
    if (it == record.end() || it->is_null())
        return std::int64_t{0};

    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return std::unexpected(WireError::MalformedPayload);
        return static_cast<std::int64_t>(value);
    }
    if (it->is_number_integer())
        return it->get<std::int64_t>();

    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        std::int64_t value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc() || end != text.data() + text.size())
            return std::unexpected(WireError::MalformedPayload);
        return value;
    }
    return std::unexpected(WireError::MalformedPayload);
}

}

std::string_view pairchat::protocol::toString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Chat:  return "chat";
        case MessageKind::Join:  return "join";
        case MessageKind::Leave: return "leave";
    }
    return "unknown";
}

std::string_view pairchat::protocol::toString(WireError error) {
    switch (error) {
        case WireError::MalformedPayload:  return "payload is not a valid message record";
        case WireError::MissingKind:       return "message kind is required";
        case WireError::MissingSender:     return "message sender is required";
        case WireError::UnknownKind:       return "message kind is not chat, join or leave";
        case WireError::BodyTooLong:       return "message body exceeds 1000 characters";
        case WireError::NegativeTimestamp: return "message timestamp is negative";
        case WireError::EncodingFailed:    return "message could not be encoded";
    }
    return "unknown wire error";
}

std::optional<MessageKind> pairchat::protocol::parseKind(std::string_view text) {
    for (auto kind : {MessageKind::Chat, MessageKind::Join, MessageKind::Leave}) {
        if (text == toString(kind))
            return kind;
    }
    return std::nullopt;
}

std::size_t pairchat::protocol::bodyLength(std::string_view body) {
    return static_cast<std::size_t>(std::count_if(body.begin(), body.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

ChatMessage pairchat::protocol::newMessage(MessageKind kind, std::string sender, std::string body) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return ChatMessage{
        .kind = kind,
        .sender = std::move(sender),
        .body = std::move(body),
        .timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now).count()
    };
}

auto pairchat::protocol::validate(const ChatMessage& msg) -> std::expected<void, WireError> {
    if (msg.sender.empty())
        return std::unexpected(WireError::MissingSender);
    if (bodyLength(msg.body) > kMaxBodyLength)
        return std::unexpected(WireError::BodyTooLong);
    if (msg.timestamp < 0)
        return std::unexpected(WireError::NegativeTimestamp);
    return {};
}

bool pairchat::protocol::isValid(const ChatMessage& msg) {
    return validate(msg).has_value();
}

auto pairchat::protocol::serialize(const ChatMessage& msg) -> std::expected<std::string, WireError> {
    std::string line;
    try {
        line = toRecord(msg).dump();
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to encode {} message: {}", toString(msg.kind), e.what());
        return std::unexpected(WireError::EncodingFailed);
    }
    line.push_back('\n');
    return line;
}

auto pairchat::protocol::deserialize(std::string_view data) -> std::expected<ChatMessage, WireError> {
    if (data.ends_with('\n')) {
        data.remove_suffix(1);
        if (data.ends_with('\r'))
            data.remove_suffix(1);
    }

    auto record = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (record.is_discarded() || !record.is_object())
        return std::unexpected(WireError::MalformedPayload);

    auto kindText = readString(record, "kind");
    auto sender = readString(record, "sender");
    auto body = readString(record, "body");
    auto timestamp = readTimestamp(record);
    if (!kindText || !sender || !body || !timestamp)
        return std::unexpected(WireError::MalformedPayload);

    if (kindText->empty())
        return std::unexpected(WireError::MissingKind);
    if (sender->empty())
        return std::unexpected(WireError::MissingSender);

    auto kind = parseKind(*kindText);
    if (!kind)
        return std::unexpected(WireError::UnknownKind);

    ChatMessage msg{
        .kind = *kind,
        .sender = std::move(*sender),
        .body = std::move(*body),
        .timestamp = *timestamp
    };
    if (auto valid = validate(msg); !valid)
        return std::unexpected(valid.error());
    return msg;
}

std::string pairchat::protocol::describe(const ChatMessage& msg) {
    return toRecord(msg).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

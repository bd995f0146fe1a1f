#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace pairchat::protocol {

// Bodies are counted in Unicode code points.
inline constexpr std::size_t kMaxBodyLength = 1000;

enum class MessageKind {
    Chat,
    Join,
    Leave
};

struct ChatMessage {
    MessageKind kind;
    std::string sender;
    std::string body;
    std::int64_t timestamp;

    bool operator==(const ChatMessage&) const = default;
};

enum class WireError {
    MalformedPayload,
    MissingKind,
    MissingSender,
    UnknownKind,
    BodyTooLong,
    NegativeTimestamp,
    EncodingFailed
};

std::string_view toString(MessageKind kind);
std::string_view toString(WireError error);
std::optional<MessageKind> parseKind(std::string_view text);

std::size_t bodyLength(std::string_view body);

// Field rules shared by inbound records and outgoing chat text: sender
// present, body within kMaxBodyLength, timestamp not negative.
auto validate(const ChatMessage& msg) -> std::expected<void, WireError>;
bool isValid(const ChatMessage& msg);

// Stamps the current wall-clock time. Local messages are not validated.
ChatMessage newMessage(MessageKind kind, std::string sender, std::string body);

// One record per line: the result always ends with '\n'.
auto serialize(const ChatMessage& msg) -> std::expected<std::string, WireError>;

// Strips one trailing line separator, parses and validates a remote record.
// The timestamp may arrive as a JSON number or as a decimal string.
auto deserialize(std::string_view data) -> std::expected<ChatMessage, WireError>;

// The record text without its line terminator, for logs.
std::string describe(const ChatMessage& msg);

}

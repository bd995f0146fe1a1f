#include <gtest/gtest.h>
#include "protocol/ChatMessage.hpp"

#include <chrono>
#include <string>

namespace pairchat::protocol::test {

namespace {

std::string record(const std::string& fields) {
    return "{" + fields + "}\n";
}

}

TEST(ChatMessageTest, NewMessageStampsCurrentTime) {
    const auto before = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto msg = newMessage(MessageKind::Chat, "alice", "hi");
    const auto after = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    EXPECT_EQ(msg.kind, MessageKind::Chat);
    EXPECT_EQ(msg.sender, "alice");
    EXPECT_EQ(msg.body, "hi");
    EXPECT_GE(msg.timestamp, before);
    EXPECT_LE(msg.timestamp, after);
}

TEST(ChatMessageTest, NewMessageDoesNotValidate) {
    auto msg = newMessage(MessageKind::Join, "", std::string(2000, 'x'));
    EXPECT_EQ(msg.sender, "");
    EXPECT_EQ(msg.body.size(), 2000u);
}

TEST(ChatMessageTest, SerializeProducesOneTerminatedLine) {
    ChatMessage msg{MessageKind::Chat, "alice", "hello\nworld", 1700000000000};
    auto line = serialize(msg);
    ASSERT_TRUE(line.has_value());
    ASSERT_FALSE(line->empty());
    EXPECT_EQ(line->back(), '\n');
    EXPECT_EQ(line->find('\n'), line->size() - 1);
    EXPECT_NE(line->find(R"("kind":"chat")"), std::string::npos);
    EXPECT_NE(line->find(R"("sender":"alice")"), std::string::npos);
    EXPECT_NE(line->find(R"("body":"hello\nworld")"), std::string::npos);
    EXPECT_NE(line->find("timestamp"), std::string::npos);
}

TEST(ChatMessageTest, SerializeWritesTimestampAsNumber) {
    auto line = serialize(ChatMessage{MessageKind::Chat, "a", "hi", 1700000000000});
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "{\"kind\":\"chat\",\"sender\":\"a\",\"body\":\"hi\",\"timestamp\":1700000000000}\n");
    EXPECT_EQ(line->find(R"("timestamp":")"), std::string::npos);
}

TEST(ChatMessageTest, DeserializeAcceptsQuotedTimestamp) {
    auto parsed = deserialize(record(R"("kind":"chat","sender":"x","body":"hi","timestamp":"1700000000000")"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->timestamp, 1700000000000);

    EXPECT_EQ(deserialize(record(R"("kind":"chat","sender":"x","timestamp":"-1")")).error(),
              WireError::NegativeTimestamp);
}

TEST(ChatMessageTest, SerializeRejectsInvalidUtf8) {
    auto line = serialize(ChatMessage{MessageKind::Chat, "bad\xff", "hi", 1});
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error(), WireError::EncodingFailed);
}

TEST(ChatMessageTest, RoundTripsEveryKind) {
    for (auto kind : {MessageKind::Chat, MessageKind::Join, MessageKind::Leave}) {
        ChatMessage msg{kind, "bob", kind == MessageKind::Chat ? "ça va? 👋" : "", 1700000000123};
        auto line = serialize(msg);
        ASSERT_TRUE(line.has_value());
        auto parsed = deserialize(*line);
        ASSERT_TRUE(parsed.has_value()) << toString(parsed.error());
        EXPECT_EQ(*parsed, msg);
    }
}

TEST(ChatMessageTest, RoundTripsBodyAtLimit) {
    ChatMessage msg{MessageKind::Chat, "bob", std::string(kMaxBodyLength, 'x'), 0};
    auto parsed = deserialize(*serialize(msg));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, msg);
}

TEST(ChatMessageTest, DeserializeAcceptsRecordWithoutTerminator) {
    auto parsed = deserialize(R"({"kind":"join","sender":"carol","body":"","timestamp":5})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->kind, MessageKind::Join);
    EXPECT_EQ(parsed->sender, "carol");
    EXPECT_EQ(parsed->timestamp, 5);
}

TEST(ChatMessageTest, DeserializeAcceptsCrLfTerminator) {
    auto parsed = deserialize("{\"kind\":\"chat\",\"sender\":\"carol\",\"body\":\"x\",\"timestamp\":5}\r\n");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->body, "x");
}

TEST(ChatMessageTest, DeserializeIgnoresUnknownFields) {
    auto parsed = deserialize(record(R"("kind":"chat","sender":"dave","body":"hi","timestamp":1,"color":"red")"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->body, "hi");
}

TEST(ChatMessageTest, MissingBodyAndTimestampDefaultToEmptyAndZero) {
    auto parsed = deserialize(record(R"("kind":"leave","sender":"dave")"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->body, "");
    EXPECT_EQ(parsed->timestamp, 0);
}

TEST(ChatMessageTest, RejectsMalformedPayload) {
    EXPECT_EQ(deserialize("not json\n").error(), WireError::MalformedPayload);
    EXPECT_EQ(deserialize("").error(), WireError::MalformedPayload);
    EXPECT_EQ(deserialize(record(R"("kind":"chat","sender":"x","timestamp":"soon")")).error(),
              WireError::MalformedPayload);
    EXPECT_EQ(deserialize(R"({"kind":"chat","sender":"x")").error(), WireError::MalformedPayload);
}

TEST(ChatMessageTest, RejectsFieldsOfTheWrongType) {
    EXPECT_EQ(deserialize(record(R"("kind":1,"sender":"x")")).error(), WireError::MalformedPayload);
    EXPECT_EQ(deserialize(record(R"("kind":"chat","sender":"x","body":[])")).error(), WireError::MalformedPayload);
    EXPECT_EQ(deserialize(record(R"("kind":"chat","sender":"x","timestamp":1.5)")).error(), WireError::MalformedPayload);
    EXPECT_EQ(deserialize("[1,2,3]\n").error(), WireError::MalformedPayload);
}

TEST(ChatMessageTest, RejectsMissingKind) {
    EXPECT_EQ(deserialize(record(R"("sender":"x","body":"hi","timestamp":1)")).error(), WireError::MissingKind);
    EXPECT_EQ(deserialize(record(R"("kind":"","sender":"x")")).error(), WireError::MissingKind);
}

TEST(ChatMessageTest, RejectsMissingSender) {
    EXPECT_EQ(deserialize(record(R"("kind":"chat","body":"hi","timestamp":1)")).error(), WireError::MissingSender);
    EXPECT_EQ(deserialize(record(R"("kind":"chat","sender":"")")).error(), WireError::MissingSender);
}

TEST(ChatMessageTest, RejectsUnknownKind) {
    EXPECT_EQ(deserialize(record(R"("kind":"invalid","sender":"x","timestamp":1)")).error(), WireError::UnknownKind);
}

TEST(ChatMessageTest, RejectsBodyOverLimit) {
    std::string body(kMaxBodyLength + 1, 'x');
    auto line = record(R"("kind":"chat","sender":"x","timestamp":1,"body":")" + body + "\"");
    EXPECT_EQ(deserialize(line).error(), WireError::BodyTooLong);
}

TEST(ChatMessageTest, CountsBodyInCharactersNotBytes) {
    std::string body;
    for (std::size_t i = 0; i < kMaxBodyLength; ++i)
        body += "é";
    EXPECT_EQ(bodyLength(body), kMaxBodyLength);

    auto parsed = deserialize(record(R"("kind":"chat","sender":"x","timestamp":1,"body":")" + body + "\""));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->body, body);
}

TEST(ChatMessageTest, ValidatesTimestampSign) {
    EXPECT_EQ(deserialize(record(R"("kind":"chat","sender":"x","timestamp":-1)")).error(),
              WireError::NegativeTimestamp);

    auto parsed = deserialize(record(R"("kind":"chat","sender":"x","timestamp":0)"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->timestamp, 0);
}

TEST(ChatMessageTest, ValidateAppliesFieldRules) {
    EXPECT_TRUE(isValid(ChatMessage{MessageKind::Chat, "x", "hi", 0}));
    EXPECT_EQ(validate(ChatMessage{MessageKind::Chat, "", "hi", 0}).error(), WireError::MissingSender);
    EXPECT_EQ(validate(ChatMessage{MessageKind::Chat, "x", std::string(kMaxBodyLength + 1, 'x'), 0}).error(),
              WireError::BodyTooLong);
    EXPECT_EQ(validate(ChatMessage{MessageKind::Leave, "x", "", -5}).error(), WireError::NegativeTimestamp);
    EXPECT_FALSE(isValid(ChatMessage{MessageKind::Join, "x", "", -5}));
}

TEST(ChatMessageTest, DescribeIsTheRecordWithoutTerminator) {
    ChatMessage msg{MessageKind::Join, "eve", "", 42};
    EXPECT_EQ(describe(msg) + "\n", *serialize(msg));
}

TEST(ChatMessageTest, KindNamesAreStable) {
    EXPECT_EQ(toString(MessageKind::Chat), "chat");
    EXPECT_EQ(toString(MessageKind::Join), "join");
    EXPECT_EQ(toString(MessageKind::Leave), "leave");
    EXPECT_EQ(parseKind("leave"), MessageKind::Leave);
    EXPECT_FALSE(parseKind("Chat").has_value());
}

}

#include "network/framing.hpp"
#include "network/protocol.hpp"

#include <string>

#include <gtest/gtest.h>

namespace memkv::network {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Unwrap a parse result that is expected to be a Command.
static Command expect_command(std::variant<Command, ErrorResp> result) {
    EXPECT_TRUE(std::holds_alternative<Command>(result))
        << "Expected Command but got ErrorResp: "
        << (std::holds_alternative<ErrorResp>(result)
                ? std::get<ErrorResp>(result).message
                : "");
    return std::get<Command>(result);
}

// Unwrap a parse result that is expected to be an ErrorResp.
static ErrorResp expect_error(std::variant<Command, ErrorResp> result) {
    EXPECT_TRUE(std::holds_alternative<ErrorResp>(result))
        << "Expected ErrorResp but got a Command";
    return std::get<ErrorResp>(result);
}

// ── parse_command: set ────────────────────────────────────────────────────────

TEST(ParseCommand, SetKeyValue) {
    auto cmd = expect_command(parse_command("set a 1"));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).key, "a");
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "1");
}

TEST(ParseCommand, SetValueMayContainSpaces) {
    auto cmd = expect_command(parse_command("set msg hello big world"));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).key, "msg");
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "hello big world");
}

TEST(ParseCommand, SetWithTrailingNewlineAndCR) {
    auto cmd = expect_command(parse_command("set k v\r\n"));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "v");
}

TEST(ParseCommand, SetTrailingWhitespaceIsTrimmed) {
    auto cmd = expect_command(parse_command("set k value   \t"));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "value");
}

TEST(ParseCommand, SetMissingValueIsParseError) {
    auto err = expect_error(parse_command("set onlykey"));
    EXPECT_EQ(err.message.rfind("parse error", 0), 0u) << err.message;
}

TEST(ParseCommand, SetMissingKeyAndValueIsParseError) {
    auto err = expect_error(parse_command("set"));
    EXPECT_EQ(err.message.rfind("parse error", 0), 0u) << err.message;
}

TEST(ParseCommand, SetValueAtLimitIsAccepted) {
    auto cmd = expect_command(parse_command("set k 12345", 5));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "12345");
}

TEST(ParseCommand, SetValueOverLimitIsRejected) {
    auto err = expect_error(parse_command("set k 123456", 5));
    EXPECT_EQ(err.message, "value is too long, max allowed length is 5 bytes");
}

// A GET of the largest accepted value must still fit in one frame.
TEST(ParseCommand, DefaultValueLimitLeavesRoomForFoundPrefix) {
    EXPECT_EQ(kMaxValueSize, 4294967295ull - 7);
    EXPECT_EQ(kMaxValueSize + kFoundPrefix.size(), frame::kMaxPayloadSize);
    EXPECT_EQ(format_response(ValueResp{"v"}).size(), kFoundPrefix.size() + 1);
}

TEST(ParseCommand, DefaultLimitMessageNamesReducedLimit) {
    auto err = expect_error(parse_command("set k 12", 1));
    EXPECT_EQ(err.message, "value is too long, max allowed length is 1 bytes");
    EXPECT_EQ(std::to_string(kMaxValueSize), "4294967288");
}

// ── parse_command: get ────────────────────────────────────────────────────────

TEST(ParseCommand, GetKey) {
    auto cmd = expect_command(parse_command("get mykey"));
    ASSERT_TRUE(std::holds_alternative<GetCmd>(cmd));
    EXPECT_EQ(std::get<GetCmd>(cmd).key, "mykey");
}

TEST(ParseCommand, GetKeyIsWholeRemainder) {
    auto cmd = expect_command(parse_command("get my key"));
    ASSERT_TRUE(std::holds_alternative<GetCmd>(cmd));
    EXPECT_EQ(std::get<GetCmd>(cmd).key, "my key");
}

TEST(ParseCommand, GetMissingKeyIsParseError) {
    auto err = expect_error(parse_command("get"));
    EXPECT_EQ(err.message.rfind("parse error", 0), 0u) << err.message;
}

TEST(ParseCommand, GetWithOnlyTrailingSpaceIsParseError) {
    auto err = expect_error(parse_command("get   \n"));
    EXPECT_EQ(err.message.rfind("parse error", 0), 0u) << err.message;
}

// ── parse_command: del ────────────────────────────────────────────────────────

TEST(ParseCommand, DelKey) {
    auto cmd = expect_command(parse_command("del a"));
    ASSERT_TRUE(std::holds_alternative<DelCmd>(cmd));
    EXPECT_EQ(std::get<DelCmd>(cmd).key, "a");
}

TEST(ParseCommand, DelMissingKeyIsParseError) {
    auto err = expect_error(parse_command("del"));
    EXPECT_EQ(err.message.rfind("parse error", 0), 0u) << err.message;
}

// ── parse_command: unknown ────────────────────────────────────────────────────

TEST(ParseCommand, UnknownCommandWithArgument) {
    auto err = expect_error(parse_command("frobnicate x"));
    EXPECT_EQ(err.message, "unknown command 'frobnicate'");
}

TEST(ParseCommand, UnknownCommandWithoutArgument) {
    auto err = expect_error(parse_command("frobnicate"));
    EXPECT_EQ(err.message, "unknown command 'frobnicate'");
}

TEST(ParseCommand, CommandTokensAreCaseSensitive) {
    auto err = expect_error(parse_command("SET a 1"));
    EXPECT_EQ(err.message, "unknown command 'SET'");
}

TEST(ParseCommand, EmptyLineIsUnknownCommand) {
    auto err = expect_error(parse_command("\n"));
    EXPECT_EQ(err.message, "unknown command ''");
}

// ── format_response ───────────────────────────────────────────────────────────

TEST(FormatResponse, Ok) {
    EXPECT_EQ(format_response(OkResp{}), "ok");
}

TEST(FormatResponse, Found) {
    EXPECT_EQ(format_response(ValueResp{"1"}), "found: 1");
}

TEST(FormatResponse, FoundEmptyValue) {
    EXPECT_EQ(format_response(ValueResp{""}), "found: ");
}

TEST(FormatResponse, NotFound) {
    EXPECT_EQ(format_response(NotFoundResp{}), "not found");
}

TEST(FormatResponse, ErrorIsMessageVerbatim) {
    EXPECT_EQ(format_response(ErrorResp{"unknown command 'x'"}), "unknown command 'x'");
}

} // namespace memkv::network

#include <gtest/gtest.h>
#include "minikv/protocol.hpp"

using namespace minikv;

namespace {

Frame command(std::initializer_list<const char*> parts) {
    std::vector<Frame> items;
    for (const char* part : parts)
        items.push_back(Frame::bulk(part));
    return Frame::array(std::move(items));
}

CommandError::Kind error_kind(const Frame& frame) {
    try {
        Protocol::parse(frame);
    } catch (const CommandError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected CommandError for " << frame;
    return CommandError::Kind::NotArray;
}

} // namespace

// Set

TEST(ProtocolTest, SetValidCommand) {
    Command result = Protocol::parse(command({"SET", "key", "value"}));
    Set* set_cmd = std::get_if<Set>(&result);
    ASSERT_TRUE(set_cmd);
    EXPECT_EQ(set_cmd->key, "key");
    EXPECT_EQ(set_cmd->value, "value");
}

TEST(ProtocolTest, SetValidCaseInsensitive) {
    Command result = Protocol::parse(command({"sEt", "kEy", "ValUE"}));
    Set* set_cmd = std::get_if<Set>(&result);
    ASSERT_TRUE(set_cmd);
    EXPECT_EQ(set_cmd->key, "kEy");
    EXPECT_EQ(set_cmd->value, "ValUE");
}

TEST(ProtocolTest, SetBinaryValue) {
    std::string value{"a\r\n\0b", 5};
    Frame frame = Frame::array({ Frame::bulk("SET"), Frame::bulk("key"), Frame::bulk(value) });

    Command result = Protocol::parse(frame);
    Set* set_cmd = std::get_if<Set>(&result);
    ASSERT_TRUE(set_cmd);
    EXPECT_EQ(set_cmd->value, value);
}

TEST(ProtocolTest, SetLargeValue) {
    std::string large_value(10000, 'A');
    Frame frame = Frame::array({ Frame::bulk("SET"), Frame::bulk("key"), Frame::bulk(large_value) });

    Command result = Protocol::parse(frame);
    Set* set_cmd = std::get_if<Set>(&result);

    ASSERT_TRUE(set_cmd);
    EXPECT_EQ(set_cmd->value.size(), 10000u);
}

TEST(ProtocolTest, SetMissingParameters) {
    EXPECT_EQ(error_kind(command({"SET"})), CommandError::Kind::Arity);
    EXPECT_EQ(error_kind(command({"SET", "k"})), CommandError::Kind::Arity);
}

TEST(ProtocolTest, SetTooManyParameters) {
    EXPECT_EQ(error_kind(command({"SET", "key", "value", "extra"})), CommandError::Kind::Arity);
}


// Get

TEST(ProtocolTest, GetValidCommand) {
    Command result = Protocol::parse(command({"GET", "key"}));
    Get* get_cmd = std::get_if<Get>(&result);
    ASSERT_TRUE(get_cmd);
    EXPECT_EQ(get_cmd->key, "key");
}

TEST(ProtocolTest, GetValidCaseInsensitive) {
    Command result = Protocol::parse(command({"geT", "key"}));
    Get* get_cmd = std::get_if<Get>(&result);
    ASSERT_TRUE(get_cmd);
    EXPECT_EQ(get_cmd->key, "key");
}

TEST(ProtocolTest, GetAcceptsSimpleStrings) {
    Command result = Protocol::parse(Frame::array({ Frame::simple("GET"), Frame::simple("key") }));
    Get* get_cmd = std::get_if<Get>(&result);
    ASSERT_TRUE(get_cmd);
    EXPECT_EQ(get_cmd->key, "key");
}

TEST(ProtocolTest, GetMissingParameters) {
    EXPECT_EQ(error_kind(command({"GET"})), CommandError::Kind::Arity);
}

TEST(ProtocolTest, GetTooManyParameters) {
    EXPECT_EQ(error_kind(command({"GET", "key", "extra"})), CommandError::Kind::Arity);
}


// Other

TEST(ProtocolTest, UnknownCommandIsNotAnError) {
    Command result = Protocol::parse(command({"FLUSH", "all"}));
    Unknown* unknown = std::get_if<Unknown>(&result);
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->name, "FLUSH");
}

TEST(ProtocolTest, RejectNonArrayFrames) {
    EXPECT_EQ(error_kind(Frame::bulk("GET key")), CommandError::Kind::NotArray);
    EXPECT_EQ(error_kind(Frame::simple("PING")), CommandError::Kind::NotArray);
    EXPECT_EQ(error_kind(Frame::integer(1)), CommandError::Kind::NotArray);
    EXPECT_EQ(error_kind(Frame::null()), CommandError::Kind::NotArray);
}

TEST(ProtocolTest, RejectEmptyArray) {
    EXPECT_EQ(error_kind(Frame::array({})), CommandError::Kind::Arity);
}

TEST(ProtocolTest, RejectNonTextElements) {
    EXPECT_EQ(error_kind(Frame::array({ Frame::integer(1), Frame::bulk("key") })), CommandError::Kind::WrongType);
    EXPECT_EQ(error_kind(Frame::array({ Frame::bulk("GET"), Frame::null() })), CommandError::Kind::WrongType);
    EXPECT_EQ(error_kind(Frame::array({ Frame::bulk("SET"), Frame::bulk("k"), Frame::array({}) })),
              CommandError::Kind::WrongType);
}

TEST(ProtocolTest, KeysAreCaseSensitive) {
    Command result1 = Protocol::parse(command({"GET", "key"}));
    Command result2 = Protocol::parse(command({"GET", "KEY"}));

    Get* cmd1 = std::get_if<Get>(&result1);
    Get* cmd2 = std::get_if<Get>(&result2);
    ASSERT_TRUE(cmd1 && cmd2);

    EXPECT_NE(cmd1->key, cmd2->key); // "key" != "KEY"
}

TEST(ProtocolTest, ToFrameBuildsBulkArrays) {
    EXPECT_EQ(Protocol::to_frame(Get{"k"}), command({"GET", "k"}));
    EXPECT_EQ(Protocol::to_frame(Set{"k", "v"}), command({"SET", "k", "v"}));
    EXPECT_EQ(Protocol::to_frame(Unknown{"PING"}), command({"PING"}));
}

TEST(ProtocolTest, ToFrameParsesBack) {
    Command result = Protocol::parse(Protocol::to_frame(Set{"key", "value"}));
    Set* set_cmd = std::get_if<Set>(&result);
    ASSERT_TRUE(set_cmd);
    EXPECT_EQ(set_cmd->key, "key");
    EXPECT_EQ(set_cmd->value, "value");
}

TEST(ProtocolTest, FormatOk) {
    EXPECT_EQ(Protocol::format_ok().encode(), "+OK\r\n");
}

TEST(ProtocolTest, FormatError) {
    EXPECT_EQ(Protocol::format_error("msg").encode(), "-ERR msg\r\n");
}

TEST(ProtocolTest, FormatErrorStripsLineBreaks) {
    EXPECT_EQ(Protocol::format_error("bad\r\nname").encode(), "-ERR bad  name\r\n");
}

TEST(ProtocolTest, FormatValue) {
    EXPECT_EQ(Protocol::format_value("msg").encode(), "$3\r\nmsg\r\n");
}

TEST(ProtocolTest, FormatNull) {
    EXPECT_EQ(Protocol::format_null().encode(), "$-1\r\n");
}

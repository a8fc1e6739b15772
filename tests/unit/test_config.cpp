#include <gtest/gtest.h>
#include "minikv/config.hpp"
#include <vector>

using namespace minikv;

namespace {

ServerConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "minikv-server");
    return parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace


TEST(ConfigTest, Defaults) {
    ServerConfig config = parse({});
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.port, 6379);
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.max_buffer_size, 2u * 1024 * 1024 + 1024);
    EXPECT_FALSE(config.show_help);
}

TEST(ConfigTest, SeparateValues) {
    ServerConfig config = parse({"--bind", "0.0.0.0", "--port", "7000", "--log-level", "debug"});
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST(ConfigTest, InlineValues) {
    ServerConfig config = parse({"--port=0", "--max-buffer=4096", "--log-level=WARN"});
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.max_buffer_size, 4096u);
    EXPECT_EQ(config.log_level, LogLevel::Warn);
}

TEST(ConfigTest, Help) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

TEST(ConfigTest, RejectUnknownOption) {
    EXPECT_THROW(parse({"--verbose"}), ConfigError);
    EXPECT_THROW(parse({"6379"}), ConfigError);
}

TEST(ConfigTest, RejectMissingValue) {
    EXPECT_THROW(parse({"--port"}), ConfigError);
}

TEST(ConfigTest, RejectBadPort) {
    EXPECT_THROW(parse({"--port", "abc"}), ConfigError);
    EXPECT_THROW(parse({"--port", "65536"}), ConfigError);
    EXPECT_THROW(parse({"--port", "-1"}), ConfigError);
}

TEST(ConfigTest, RejectTinyBuffer) {
    EXPECT_THROW(parse({"--max-buffer", "8"}), ConfigError);
}

TEST(ConfigTest, LogLevelNames) {
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_THROW(parse_log_level("loud"), ConfigError);
}

TEST(ConfigTest, UsageMentionsEveryFlag) {
    std::string text = usage("minikv-server");
    for (const char* flag : {"--bind", "--port", "--log-level", "--max-buffer", "--help"})
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
}

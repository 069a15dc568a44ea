#include "hxfer/config.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using namespace hxfer;
using namespace hxfer::test;

TEST(ConfigTest, DefaultsWhenEmpty) {
    Config cfg;
    SessionOptions o = cfg.session_options();
    EXPECT_EQ(o.chunk_size, DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(o.limits.max_chunk_size, 16u << 20);
    EXPECT_EQ(o.limits.max_file_size, 1ull << 40);
    EXPECT_EQ(o.limits.max_name_len, 255);
    EXPECT_FALSE(o.require_signature);
    EXPECT_EQ(cfg.log_level(), LogLevel::Info);
    EXPECT_EQ(cfg.log_file(), "");
}

TEST(ConfigTest, ParsesCommentsAndWhitespace) {
    Config cfg = Config::parse(
        "# transfer settings\n"
        "\n"
        "  chunk_size = 4096  \n"
        "max_file_size=1048576\n"
        "require_signature = Yes\n"
        "log_level = debug\n"
        "log_file = /tmp/hxfer.log\n");
    SessionOptions o = cfg.session_options();
    EXPECT_EQ(o.chunk_size, 4096u);
    EXPECT_EQ(o.limits.max_file_size, 1048576u);
    EXPECT_TRUE(o.require_signature);
    EXPECT_EQ(cfg.log_level(), LogLevel::Debug);
    EXPECT_EQ(cfg.log_file(), "/tmp/hxfer.log");
    EXPECT_TRUE(cfg.has("chunk_size"));
    EXPECT_FALSE(cfg.has("port"));
}

TEST(ConfigTest, LoadsFromFile) {
    TempDir dir;
    const std::string text = "chunk_size = 1024\nmax_chunk_size = 2048\n";
    write_file(dir.file("hxfer.conf"), std::vector<uint8_t>(text.begin(), text.end()));
    SessionOptions o = Config::load_file(dir.file("hxfer.conf")).session_options();
    EXPECT_EQ(o.chunk_size, 1024u);
    EXPECT_EQ(o.limits.max_chunk_size, 2048u);
    EXPECT_THROW(Config::load_file(dir.file("missing.conf")), std::runtime_error);
}

TEST(ConfigTest, RejectsMalformedLines) {
    EXPECT_THROW(Config::parse("chunk_size 4096\n"), std::invalid_argument);
    EXPECT_THROW(Config::parse(" = 1\n"), std::invalid_argument);
}

TEST(ConfigTest, RejectsBadValues) {
    Config cfg;
    cfg.set("chunk_size", "-5");
    EXPECT_THROW(cfg.session_options(), std::invalid_argument);
    cfg.set("chunk_size", "0");
    EXPECT_THROW(cfg.session_options(), std::invalid_argument);
    cfg.set("chunk_size", "99999999999");
    EXPECT_THROW(cfg.session_options(), std::invalid_argument);
    cfg.set("chunk_size", "1048576");
    cfg.set("max_chunk_size", "65536");
    EXPECT_THROW(cfg.session_options(), std::invalid_argument);
    cfg.set("max_chunk_size", "2097152");
    EXPECT_NO_THROW(cfg.session_options());
    cfg.set("max_name_len", "70000");
    EXPECT_THROW(cfg.session_options(), std::invalid_argument);
    cfg.set("max_name_len", "255");
    cfg.set("require_signature", "maybe");
    EXPECT_THROW(cfg.session_options(), std::invalid_argument);
}

TEST(ConfigTest, IoTimeout) {
    Config cfg;
    EXPECT_EQ(cfg.io_timeout_ms(), 30000);
    cfg.set("io_timeout_ms", "0");
    EXPECT_EQ(cfg.io_timeout_ms(), 0);
    cfg.set("io_timeout_ms", "2500");
    EXPECT_EQ(cfg.io_timeout_ms(), 2500);
    cfg.set("io_timeout_ms", "4294967296");
    EXPECT_THROW(cfg.io_timeout_ms(), std::invalid_argument);
    cfg.set("io_timeout_ms", "2147483648");
    EXPECT_THROW(cfg.io_timeout_ms(), std::invalid_argument);
}

TEST(ConfigTest, LogLevels) {
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::Error);
    EXPECT_THROW(parse_log_level("verbose"), std::invalid_argument);
}

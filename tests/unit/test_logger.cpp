/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger and the log sinks.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace adaptive_pool;

namespace {

/// Sink whose lines outlive the Logger that owns it.
class SharedSink : public ILogSink {
public:
    explicit SharedSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

size_t count_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

}  // namespace

TEST(LogLevelTest, ParseKnownLevels) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(*parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("error"), LogLevel::Error);
}

TEST(LogLevelTest, ParseUnknownLevel) {
    auto result = parse_log_level("loud");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST(JsonEscapeTest, EscapesQuotesAndControlCharacters) {
    EXPECT_EQ(json_escape(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
}

TEST(LoggerTest, WritesStructuredLine) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<SharedSink>(lines), LogLevel::Debug);

    logger.info("scaler", "Scaled up to 3 units");

    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines.front();
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"scaler")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"Scaled up to 3 units")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<SharedSink>(lines), LogLevel::Warn);

    logger.debug("dispatcher", "hidden");
    logger.info("dispatcher", "hidden");
    logger.warn("dispatcher", "shown");
    logger.error("dispatcher", "shown");

    EXPECT_EQ(lines.size(), 2u);
    EXPECT_FALSE(logger.enabled(LogLevel::Info));
    EXPECT_TRUE(logger.enabled(LogLevel::Error));
}

TEST(LoggerTest, SetLevelAtRuntime) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<SharedSink>(lines), LogLevel::Error);

    logger.info("supervisor", "hidden");
    logger.set_level(LogLevel::Debug);
    logger.debug("supervisor", "shown");

    EXPECT_EQ(lines.size(), 1u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, EscapesMessageText) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<SharedSink>(lines));

    logger.info("demo", "quote \" inside");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines.front().find(R"(quote \" inside)"), std::string::npos);
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ap_test_sink";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndAppends) {
    {
        JsonFileSink sink(temp_dir_, "pool");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), temp_dir_ / "pool.ndjson");
    }
    EXPECT_EQ(count_lines(temp_dir_ / "pool.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAndKeepsBoundedGenerations) {
    {
        JsonFileSink sink(temp_dir_, "pool", 1, 3);
        sink.set_max_file_size_bytes(32);
        for (int i = 0; i < 20; ++i) {
            sink.write(R"({"event":"line","n":)" + std::to_string(i) + "}");
        }
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "pool.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "pool.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "pool.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "pool.3.ndjson"));
}

TEST(MemorySinkTest, KeepsLinesInOrder) {
    MemorySink sink;
    sink.write("first");
    sink.write("second");
    ASSERT_EQ(sink.lines().size(), 2u);
    EXPECT_EQ(sink.lines()[0], "first");
    EXPECT_EQ(sink.lines()[1], "second");
}

#include <atomic>
#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#include "deepresearch/json/json_bridge.h"
#include "deepresearch/logging/log_formatter.h"
#include "deepresearch/logging/log_sink.h"
#include "deepresearch/logging/logger.h"

using namespace deepresearch::logging;

// Test sink that captures messages
class CapturingSink : public LogSink {
 public:
  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(msg);
  }

  void flush() override { flushed_ = true; }

  std::vector<LogMessage> getMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  bool flushed() const { return flushed_; }

 private:
  std::mutex mutex_;
  std::vector<LogMessage> messages_;
  std::atomic<bool> flushed_{false};
};

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { sink_ = std::make_shared<CapturingSink>(); }

  std::shared_ptr<CapturingSink> sink_;
};

TEST_F(LoggerTest, BasicLogging) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.info("Test message");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].level, LogLevel::Info);
  EXPECT_EQ(messages[0].message, "Test message");
  EXPECT_EQ(messages[0].logger_name, "test");
}

TEST_F(LoggerTest, FormatsArguments) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.info("Processed {} requests for {}", 3, "deep-research");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "Processed 3 requests for deep-research");
}

TEST_F(LoggerTest, LevelFiltering) {
  Logger logger("test", LogLevel::Warning);
  logger.setSink(sink_);

  logger.debug("Debug message");
  logger.info("Info message");
  logger.warning("Warning message");
  logger.error("Error message");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].level, LogLevel::Warning);
  EXPECT_EQ(messages[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, OffSuppressesEverything) {
  Logger logger("test", LogLevel::Off);
  logger.setSink(sink_);

  logger.error("Error message");
  logger.log(LogLevel::Emergency, __FILE__, __LINE__, __FUNCTION__, "x");

  EXPECT_TRUE(sink_->getMessages().empty());
  EXPECT_FALSE(logger.shouldLog(LogLevel::Off));
}

TEST_F(LoggerTest, SourceLocationIsRecorded) {
  Logger logger("test", LogLevel::Debug);
  logger.setSink(sink_);

  logger.log(LogLevel::Debug, "file.cc", 42, "fn", "value={}", 7);

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_STREQ(messages[0].file, "file.cc");
  EXPECT_EQ(messages[0].line, 42);
  EXPECT_STREQ(messages[0].function, "fn");
  EXPECT_EQ(messages[0].message, "value=7");
}

TEST_F(LoggerTest, SetLevelAtRuntime) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.debug("hidden");
  logger.setLevel(LogLevel::Debug);
  logger.debug("shown");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "shown");
}

TEST_F(LoggerTest, FlushReachesSink) {
  Logger logger("test");
  logger.setSink(sink_);
  logger.flush();
  EXPECT_TRUE(sink_->flushed());
}

TEST_F(LoggerTest, NoSinkIsHarmless) {
  Logger logger("test");
  EXPECT_NO_THROW(logger.error("nowhere"));
}

TEST(FormatterTest, DefaultFormatterIncludesLevelLoggerAndLocation) {
  LogMessage msg;
  msg.level = LogLevel::Warning;
  msg.logger_name = "server";
  msg.file = "research_server.cc";
  msg.line = 12;
  msg.function = "handleRequest";
  msg.message = "Unknown prompt: x";

  auto line = DefaultFormatter().format(msg);
  EXPECT_NE(line.find("[WARNING] [server] "), std::string::npos);
  EXPECT_NE(line.find("[research_server.cc:12 handleRequest()] "),
            std::string::npos);
  EXPECT_EQ(line.substr(line.size() - 17), "Unknown prompt: x");
}

TEST(FormatterTest, JsonFormatterEmitsOneObject) {
  LogMessage msg;
  msg.level = LogLevel::Info;
  msg.logger_name = "research";
  msg.message = "Note added";

  auto text = JsonFormatter().format(msg);
  EXPECT_EQ(text.find('\n'), std::string::npos);
  auto parsed = deepresearch::json::JsonValue::parse(text);
  EXPECT_EQ(parsed["level"].getString(), "INFO");
  EXPECT_EQ(parsed["logger"].getString(), "research");
  EXPECT_EQ(parsed["message"].getString(), "Note added");
  EXPECT_FALSE(parsed.contains("file"));
}

TEST(FormatterTest, CreateFormatterFollowsLogFormat) {
  LogMessage msg;
  msg.logger_name = "x";
  msg.message = "m";

  auto json_text = createFormatter(LogFormat::Json)->format(msg);
  EXPECT_TRUE(deepresearch::json::JsonValue::parse(json_text).isObject());
  auto plain = createFormatter(LogFormat::Text)->format(msg);
  EXPECT_EQ(plain.front(), '[');
}

TEST(LogLevelTest, ParsesNamesInEitherCase) {
  EXPECT_EQ(parseLogLevel("debug").value(), LogLevel::Debug);
  EXPECT_EQ(parseLogLevel("WARNING").value(), LogLevel::Warning);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(LogLevelTest, ParsesLogFormats) {
  EXPECT_EQ(parseLogFormat("json").value(), LogFormat::Json);
  EXPECT_EQ(parseLogFormat("text").value(), LogFormat::Text);
  EXPECT_FALSE(parseLogFormat("xml").has_value());
  EXPECT_STREQ(logFormatToString(LogFormat::Json), "json");
}

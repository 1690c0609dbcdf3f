#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "deepresearch/config/server_config.h"

using namespace deepresearch;
using namespace deepresearch::config;

namespace {

class TempConfigFile {
 public:
  explicit TempConfigFile(const std::string& contents) {
    char tmpl[] = "/tmp/deepresearch_config_XXXXXX";
    int fd = mkstemp(tmpl);
    EXPECT_GE(fd, 0);
    close(fd);
    path_ = tmpl;
    std::ofstream out(path_);
    out << contents;
  }

  ~TempConfigFile() { std::remove(path_.c_str()); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace

TEST(ServerConfigTest, DefaultsAreValid) {
  ServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.server_name, "deep-research-server");
  EXPECT_EQ(config.server_version, "0.1.0");
  EXPECT_TRUE(config.require_initialize);
  EXPECT_TRUE(config.supportsProtocolVersion("2024-11-05"));
  EXPECT_FALSE(config.supportsProtocolVersion("1999-01-01"));
}

TEST(ServerConfigTest, FromJsonKeepsDefaultsForAbsentKeys) {
  auto config = ServerConfig::fromJson(json::JsonValue::parse(
      R"({"server_name": "custom", "log_level": "debug"})"));

  EXPECT_EQ(config.server_name, "custom");
  EXPECT_EQ(config.log_level, logging::LogLevel::Debug);
  EXPECT_EQ(config.server_version, "0.1.0");
  EXPECT_EQ(config.max_frame_bytes, 4u * 1024 * 1024);
}

TEST(ServerConfigTest, FromJsonReadsEveryField) {
  auto config = ServerConfig::fromJson(json::JsonValue::parse(R"({
    "server_name": "s",
    "server_version": "9.9.9",
    "protocol_version": "2024-11-05",
    "supported_protocol_versions": ["2024-11-05"],
    "log_level": "warning",
    "log_format": "json",
    "require_initialize": false,
    "max_frame_bytes": 1024
  })"));

  EXPECT_EQ(config.server_version, "9.9.9");
  EXPECT_EQ(config.protocol_version, "2024-11-05");
  EXPECT_EQ(config.supported_protocol_versions.size(), 1u);
  EXPECT_EQ(config.log_level, logging::LogLevel::Warning);
  EXPECT_EQ(config.log_format, logging::LogFormat::Json);
  EXPECT_FALSE(config.require_initialize);
  EXPECT_EQ(config.max_frame_bytes, 1024u);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, TypeErrorNamesTheField) {
  try {
    ServerConfig::fromJson(
        json::JsonValue::parse(R"({"require_initialize": "yes"})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "require_initialize");
    EXPECT_NE(std::string(e.what()).find("Type error"), std::string::npos);
  }
}

TEST(ServerConfigTest, RejectsUnknownLogLevel) {
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"log_level": "chatty"})")),
               ConfigValidationError);
}

TEST(ServerConfigTest, RejectsUnknownLogFormat) {
  try {
    ServerConfig::fromJson(json::JsonValue::parse(R"({"log_format": "xml"})"));
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "log_format");
  }
  EXPECT_EQ(ServerConfig().log_format, logging::LogFormat::Text);
}

TEST(ServerConfigTest, RejectsNonPositiveFrameLimit) {
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"max_frame_bytes": 0})")),
               ConfigValidationError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"max_frame_bytes": 1.5})")),
               ConfigValidationError);
}

TEST(ServerConfigTest, RejectsNonObjectRoot) {
  EXPECT_THROW(ServerConfig::fromJson(json::JsonValue::parse("[]")),
               ConfigValidationError);
}

TEST(ServerConfigTest, ValidateRejectsUnsupportedDefaultProtocol) {
  ServerConfig config;
  config.protocol_version = "2000-01-01";
  try {
    config.validate();
    FAIL() << "Expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "protocol_version");
  }
}

TEST(ServerConfigTest, ValidateRejectsEmptyName) {
  ServerConfig config;
  config.server_name.clear();
  EXPECT_THROW(config.validate(), ConfigValidationError);
}

TEST(ServerConfigTest, ToJsonRoundTripsThroughFromJson) {
  ServerConfig config;
  config.server_name = "round";
  config.log_level = logging::LogLevel::Error;
  config.log_format = logging::LogFormat::Json;

  auto back = ServerConfig::fromJson(config.toJson());
  EXPECT_EQ(back.server_name, "round");
  EXPECT_EQ(back.log_level, logging::LogLevel::Error);
  EXPECT_EQ(back.log_format, logging::LogFormat::Json);
  EXPECT_EQ(back.supported_protocol_versions,
            config.supported_protocol_versions);
}

TEST(ServerConfigTest, LoadFromFile) {
  TempConfigFile file(R"({"server_name": "from-file"})");
  auto config = ServerConfig::loadFromFile(file.path());
  EXPECT_EQ(config.server_name, "from-file");
}

TEST(ServerConfigTest, LoadFromMissingFile) {
  EXPECT_THROW(ServerConfig::loadFromFile("/nonexistent/deepresearch.json"),
               ConfigParseError);
}

TEST(ServerConfigTest, LoadFromMalformedFile) {
  TempConfigFile file("{ not json");
  try {
    ServerConfig::loadFromFile(file.path());
    FAIL() << "Expected ConfigParseError";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.file(), file.path());
  }
}

TEST(ServerConfigTest, LoadFromFileValidates) {
  TempConfigFile file(R"({"protocol_version": "2000-01-01"})");
  EXPECT_THROW(ServerConfig::loadFromFile(file.path()),
               ConfigValidationError);
}

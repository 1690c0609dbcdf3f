#define DEEPRESEARCH_LOG_COMPONENT "config"

#include "deepresearch/config/server_config.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "deepresearch/logging/log_macros.h"

namespace deepresearch {
namespace config {

namespace {

template <typename Getter>
auto readField(const json::JsonValue& j, const std::string& key, Getter get)
    -> decltype(get(j)) {
  try {
    return get(j[key]);
  } catch (const json::JsonException& e) {
    throw ConfigValidationError(key, "Type error: " + std::string(e.what()));
  }
}

bool present(const json::JsonValue& j, const std::string& key) {
  return j.contains(key) && !j[key].isNull();
}

}  // namespace

void ServerConfig::validate() const {
  if (server_name.empty()) {
    throw ConfigValidationError("server_name", "Server name cannot be empty");
  }
  if (server_version.empty()) {
    throw ConfigValidationError("server_version",
                                "Server version cannot be empty");
  }
  if (supported_protocol_versions.empty()) {
    throw ConfigValidationError("supported_protocol_versions",
                                "At least one protocol version is required");
  }
  for (const auto& version : supported_protocol_versions) {
    if (version.empty()) {
      throw ConfigValidationError("supported_protocol_versions",
                                  "Protocol versions cannot be empty");
    }
  }
  if (!supportsProtocolVersion(protocol_version)) {
    throw ConfigValidationError(
        "protocol_version",
        "Protocol version '" + protocol_version + "' is not supported");
  }
  if (max_frame_bytes == 0) {
    throw ConfigValidationError("max_frame_bytes",
                                "Frame limit must be positive");
  }
}

bool ServerConfig::supportsProtocolVersion(const std::string& version) const {
  return std::find(supported_protocol_versions.begin(),
                   supported_protocol_versions.end(),
                   version) != supported_protocol_versions.end();
}

json::JsonValue ServerConfig::toJson() const {
  json::JsonArrayBuilder versions;
  for (const auto& version : supported_protocol_versions) {
    versions.add(version);
  }

  json::JsonObjectBuilder builder;
  builder.add("server_name", server_name);
  builder.add("server_version", server_version);
  builder.add("protocol_version", protocol_version);
  builder.add("supported_protocol_versions", versions.build());
  builder.add("log_level", logging::logLevelToString(log_level));
  builder.add("log_format", logging::logFormatToString(log_format));
  builder.add("require_initialize", require_initialize);
  builder.add("max_frame_bytes", static_cast<int64_t>(max_frame_bytes));
  return builder.build();
}

ServerConfig ServerConfig::fromJson(const json::JsonValue& j) {
  if (!j.isObject()) {
    throw ConfigValidationError("<root>", "Configuration must be an object");
  }

  ServerConfig config;
  auto getString = [](const json::JsonValue& v) { return v.getString(); };

  if (present(j, "server_name")) {
    config.server_name = readField(j, "server_name", getString);
  }
  if (present(j, "server_version")) {
    config.server_version = readField(j, "server_version", getString);
  }
  if (present(j, "protocol_version")) {
    config.protocol_version = readField(j, "protocol_version", getString);
  }
  if (present(j, "supported_protocol_versions")) {
    config.supported_protocol_versions = readField(
        j, "supported_protocol_versions", [](const json::JsonValue& v) {
          if (!v.isArray()) {
            throw json::JsonException("Expected array, got " +
                                      v.toString());
          }
          std::vector<std::string> versions;
          for (size_t i = 0; i < v.size(); ++i) {
            versions.push_back(v[i].getString());
          }
          return versions;
        });
  }
  if (present(j, "log_level")) {
    auto name = readField(j, "log_level", getString);
    auto level = logging::parseLogLevel(name);
    if (!level.has_value()) {
      throw ConfigValidationError("log_level", "Unknown log level '" + name +
                                                   "'");
    }
    config.log_level = level.value();
  }
  if (present(j, "log_format")) {
    auto name = readField(j, "log_format", getString);
    auto format = logging::parseLogFormat(name);
    if (!format.has_value()) {
      throw ConfigValidationError("log_format", "Unknown log format '" +
                                                    name + "'");
    }
    config.log_format = format.value();
  }
  if (present(j, "require_initialize")) {
    config.require_initialize = readField(
        j, "require_initialize",
        [](const json::JsonValue& v) { return v.getBool(); });
  }
  if (present(j, "max_frame_bytes")) {
    auto limit = readField(j, "max_frame_bytes", [](const json::JsonValue& v) {
      if (!v.isInteger()) {
        throw json::JsonException("Expected integer, got " + v.toString());
      }
      return v.getInt64();
    });
    if (limit <= 0) {
      throw ConfigValidationError("max_frame_bytes",
                                  "Frame limit must be positive");
    }
    config.max_frame_bytes = static_cast<size_t>(limit);
  }

  return config;
}

ServerConfig ServerConfig::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigParseError("Cannot open file", path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  json::JsonValue j;
  try {
    j = json::JsonValue::parse(buffer.str());
  } catch (const json::JsonException& e) {
    throw ConfigParseError(e.what(), path);
  }

  auto config = fromJson(j);
  config.validate();
  DEEPRESEARCH_LOG(Debug, "Loaded configuration from {}", path);
  return config;
}

}  // namespace config
}  // namespace deepresearch

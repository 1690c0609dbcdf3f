/**
 * @file server_config.h
 * @brief Runtime configuration for the research server
 */

#ifndef DEEPRESEARCH_CONFIG_SERVER_CONFIG_H
#define DEEPRESEARCH_CONFIG_SERVER_CONFIG_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "deepresearch/json/json_bridge.h"
#include "deepresearch/logging/log_level.h"

namespace deepresearch {
namespace config {

/**
 * @brief A configuration value failed validation
 */
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error("Configuration validation failed for field '" +
                           field + "': " + reason),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string field_;
  std::string reason_;
};

/**
 * @brief A configuration file could not be read or is not valid JSON
 */
class ConfigParseError : public std::runtime_error {
 public:
  ConfigParseError(const std::string& message, const std::string& file)
      : std::runtime_error("Configuration parse error in " + file + ": " +
                           message),
        file_(file) {}

  const std::string& file() const { return file_; }

 private:
  std::string file_;
};

/**
 * @brief Server identity, protocol negotiation and framing limits
 *
 * The core only ever receives a ServerConfig value. Reading files and
 * command line arguments is left to the executable.
 */
struct ServerConfig {
  /// Name reported in the handshake serverInfo
  std::string server_name = "deep-research-server";

  /// Version reported in the handshake serverInfo
  std::string server_version = "0.1.0";

  /// Version answered when the client asks for one we do not speak
  std::string protocol_version = "2025-06-18";

  /// Versions echoed back when requested by the client
  std::vector<std::string> supported_protocol_versions = {
      "2024-11-05", "2025-03-26", "2025-06-18"};

  logging::LogLevel log_level = logging::LogLevel::Info;

  /// "text" lines or one JSON object per record
  logging::LogFormat log_format = logging::LogFormat::Text;

  /// Reject requests other than initialize/ping before the handshake
  bool require_initialize = true;

  /// Longest accepted frame, excluding the newline
  size_t max_frame_bytes = 4 * 1024 * 1024;

  /**
   * @brief Validate the configuration
   * @throws ConfigValidationError if validation fails
   */
  void validate() const;

  bool supportsProtocolVersion(const std::string& version) const;

  json::JsonValue toJson() const;

  /**
   * @brief Create from JSON; absent keys keep their defaults
   * @throws ConfigValidationError on a key of the wrong type
   */
  static ServerConfig fromJson(const json::JsonValue& j);

  /**
   * @brief Read, parse and validate a JSON configuration file
   * @throws ConfigParseError if the file cannot be read or parsed
   * @throws ConfigValidationError if a value is invalid
   */
  static ServerConfig loadFromFile(const std::string& path);
};

}  // namespace config
}  // namespace deepresearch

#endif  // DEEPRESEARCH_CONFIG_SERVER_CONFIG_H

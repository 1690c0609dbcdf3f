#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "deepresearch/logging/logger.h"

namespace deepresearch {
namespace logging {

/**
 * Process-wide registry of named loggers.
 *
 * Works without any setup: the default sink writes to stderr at Info.
 * Every logger created through the registry shares the current default
 * sink; replacing the sink or the global level applies to all of them.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  // Overrides the global level for one named logger
  void setLoggerLevel(const std::string& name, LogLevel level);

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setDefaultSink(std::shared_ptr<LogSink> sink);

  // Swaps in a fresh stderr sink writing records in the given format
  void setDefaultFormat(LogFormat format);
  std::shared_ptr<LogSink> getDefaultSink() const;

  bool shouldLog(const std::string& logger_name, LogLevel level);

  std::vector<std::string> getLoggerNames() const;

  // Restores the zero-configuration state; loggers already handed out keep
  // working and are re-attached to the fresh sink
  void reset();

 private:
  LoggerRegistry();

  void initializeDefaults();
  LogLevel effectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<std::string, LogLevel> level_overrides_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace deepresearch

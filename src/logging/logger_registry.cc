#include "deepresearch/logging/logger_registry.h"

namespace deepresearch {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() { initializeDefaults(); }

void LoggerRegistry::initializeDefaults() {
  global_level_ = LogLevel::Info;
  level_overrides_.clear();

  default_sink_ = std::make_shared<StdioSink>();
  default_logger_ = std::make_shared<Logger>("default", global_level_);
  default_logger_->setSink(default_sink_);

  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name, effectiveLevelLocked(name));
  logger->setSink(default_sink_);
  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setLoggerLevel(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_overrides_[name] = level;

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    it->second->setLevel(level);
  }
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;

  for (auto& [name, logger] : loggers_) {
    if (level_overrides_.count(name) == 0) {
      logger->setLevel(level);
    }
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& [name, logger] : loggers_) {
    logger->setSink(default_sink_);
  }
}

void LoggerRegistry::setDefaultFormat(LogFormat format) {
  auto sink = std::make_shared<StdioSink>();
  sink->setFormatter(createFormatter(format));
  setDefaultSink(std::move(sink));
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

bool LoggerRegistry::shouldLog(const std::string& logger_name,
                               LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(logger_name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  return level != LogLevel::Off && level >= effectiveLevelLocked(logger_name);
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& [name, logger] : loggers_) {
    names.push_back(name);
  }
  return names;
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto loggers = loggers_;
  initializeDefaults();
  for (auto& [name, logger] : loggers) {
    logger->setLevel(global_level_);
    logger->setSink(default_sink_);
    if (name != "default") {
      loggers_[name] = logger;
    }
  }
}

LogLevel LoggerRegistry::effectiveLevelLocked(const std::string& name) const {
  auto it = level_overrides_.find(name);
  if (it != level_overrides_.end()) {
    return it->second;
  }
  return global_level_;
}

}  // namespace logging
}  // namespace deepresearch

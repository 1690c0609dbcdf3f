#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "deepresearch/logging/log_level.h"
#include "deepresearch/logging/log_message.h"
#include "deepresearch/logging/log_sink.h"

namespace deepresearch {
namespace logging {

/**
 * Named, level-filtered logger writing synchronously to a shared sink.
 *
 * Messages are formatted with fmt only after the level check passes, so a
 * disabled level costs one atomic load.
 */
class Logger {
 public:
  explicit Logger(const std::string& name, LogLevel level = LogLevel::Info)
      : effective_level_(level), name_(name) {}

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    logFormatted(LogLevel::Debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    logFormatted(LogLevel::Info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    logFormatted(LogLevel::Warning, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    logFormatted(LogLevel::Error, fmt, std::forward<Args>(args)...);
  }

  // Direct log with source location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
      msg.logger_name = name_;
      msg.file = file;
      msg.line = line;
      msg.function = function;
      logMessage(std::move(msg));
    }
  }

  // Pre-built record; the logger fills in its own name when unset
  void logMessage(LogMessage msg) {
    if (!shouldLog(msg.level)) {
      return;
    }
    if (msg.logger_name.empty()) {
      msg.logger_name = name_;
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off &&
           level >= effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 private:
  template <typename... Args>
  void logFormatted(LogLevel level, const char* fmt, Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
      logMessage(std::move(msg));
    }
  }

  std::atomic<LogLevel> effective_level_;
  std::string name_;
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace deepresearch

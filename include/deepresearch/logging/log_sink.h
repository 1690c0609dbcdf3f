#pragma once

#include <iostream>
#include <memory>
#include <mutex>

#include "deepresearch/logging/log_formatter.h"
#include "deepresearch/logging/log_message.h"

namespace deepresearch {
namespace logging {

// Base sink interface
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Writes to stderr. Standard output carries protocol frames, so no sink
// ever targets it.
class StdioSink : public LogSink {
 public:
  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << formatter_->format(msg) << '\n';
  }

  void flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
  }

 private:
  std::mutex mutex_;
};

}  // namespace logging
}  // namespace deepresearch

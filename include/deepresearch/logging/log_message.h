#pragma once

#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>

#include "deepresearch/logging/log_level.h"

namespace deepresearch {
namespace logging {

// A single log record as handed to sinks and formatters
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;
  std::string logger_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

}  // namespace logging
}  // namespace deepresearch

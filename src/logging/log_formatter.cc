#include "deepresearch/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "deepresearch/json/json_bridge.h"

namespace deepresearch {
namespace logging {

static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static std::string threadIdString(const std::thread::id& id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << '[' << formatTimestamp(msg.timestamp) << "] ";
  oss << '[' << logLevelToString(msg.level) << "] ";

  oss << '[' << msg.logger_name << "] ";

  if (msg.file && msg.line > 0) {
    oss << '[' << msg.file << ':' << msg.line;
    if (msg.function) {
      oss << " " << msg.function << "()";
    }
    oss << "] ";
  }

  oss << msg.message;
  return oss.str();
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  json::JsonObjectBuilder builder;
  builder.add("timestamp", formatTimestamp(msg.timestamp));
  builder.add("level", logLevelToString(msg.level));
  builder.add("logger", msg.logger_name);
  builder.add("thread", threadIdString(msg.thread_id));

  if (msg.process_id > 0) {
    builder.add("pid", static_cast<int64_t>(msg.process_id));
  }
  if (msg.file) {
    builder.add("file", msg.file);
    builder.add("line", msg.line);
    if (msg.function) {
      builder.add("function", msg.function);
    }
  }
  builder.add("message", msg.message);
  return builder.build().toString();
}

std::unique_ptr<Formatter> createFormatter(LogFormat format) {
  if (format == LogFormat::Json) {
    return std::make_unique<JsonFormatter>();
  }
  return std::make_unique<DefaultFormatter>();
}

}  // namespace logging
}  // namespace deepresearch

#pragma once

#include <memory>
#include <string>

#include "deepresearch/logging/log_message.h"

namespace deepresearch {
namespace logging {

// Base formatter interface
class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// Human-readable single line with level, logger and location
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per record for structured collection
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

std::unique_ptr<Formatter> createFormatter(LogFormat format);

}  // namespace logging
}  // namespace deepresearch

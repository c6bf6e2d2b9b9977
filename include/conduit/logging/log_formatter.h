#pragma once

#include <string>

#include "conduit/logging/log_message.h"

namespace conduit {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [time] [level] [T:thread] [component] [logger] [file:line] [trace] message
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line, keys in sorted order
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace conduit

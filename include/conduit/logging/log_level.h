#pragma once

#include <strings.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace conduit {
namespace logging {

// RFC-5424 severities, least severe first
enum class LogLevel : uint8_t {
  Debug,
  Info,
  Notice,
  Warning,
  Error,
  Critical,
  Alert,
  Emergency,
  Off
};

// Each subsystem logs under its own component so levels can be tuned
// separately, e.g. Parser at Debug while everything else stays at Info.
enum class Component {
  Root,
  Client,
  Request,
  Pipeline,
  Parser,
  Transport,
  Event,
  Config,
  Count
};

enum class SinkType { File, Stdio, Null, External };

namespace detail {

constexpr const char* kLevelNames[] = {"DEBUG",    "INFO",  "NOTICE",
                                       "WARNING",  "ERROR", "CRITICAL",
                                       "ALERT",    "EMERGENCY", "OFF"};

constexpr const char* kComponentNames[] = {"Root",   "Client",    "Request",
                                           "Pipeline", "Parser", "Transport",
                                           "Event",  "Config"};

}  // namespace detail

inline const char* logLevelToString(LogLevel level) {
  const auto index = static_cast<size_t>(level);
  return index < sizeof(detail::kLevelNames) / sizeof(detail::kLevelNames[0])
             ? detail::kLevelNames[index]
             : "UNKNOWN";
}

// Case-insensitive; anything unrecognised maps to Info
inline LogLevel stringToLogLevel(const std::string& str) {
  for (size_t i = 0; i <= static_cast<size_t>(LogLevel::Off); ++i) {
    if (strcasecmp(str.c_str(), detail::kLevelNames[i]) == 0) {
      return static_cast<LogLevel>(i);
    }
  }
  return LogLevel::Info;
}

inline const char* componentToString(Component component) {
  const auto index = static_cast<size_t>(component);
  return index < static_cast<size_t>(Component::Count)
             ? detail::kComponentNames[index]
             : "Unknown";
}

}  // namespace logging
}  // namespace conduit

#pragma once

#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "conduit/logging/logger.h"

namespace conduit {
namespace logging {

// Glob pattern ("pipeline.*") mapped to a level
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob);
};

class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  // Loggers share the registry sink unless given their own
  LoggerSharedPtr getOrCreateLogger(const std::string& name);
  LoggerSharedPtr getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setComponentLevel(Component component, LogLevel level);

  void setPattern(const std::string& pattern, LogLevel level);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  // Pattern first, then component prefix, then global
  LogLevel getEffectiveLevel(const std::string& name);

  // Replaces the sink on every registered logger
  void setSink(std::shared_ptr<LogSink> sink);

  std::vector<std::string> getLoggerNames() const;

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;
  void refreshLevelsLocked();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, LoggerSharedPtr> loggers_;
  std::unordered_map<Component, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  LoggerSharedPtr default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component),
        logger_(LoggerRegistry::instance().getOrCreateLogger(
            LoggerRegistry::getComponentPath(component, name))) {}

  template <typename... Args>
  void log(LogLevel level, const char* fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      logger_->logWithComponent(level, component_, fmt,
                                std::forward<Args>(args)...);
    }
  }

 private:
  Component component_;
  LoggerSharedPtr logger_;
};

}  // namespace logging
}  // namespace conduit

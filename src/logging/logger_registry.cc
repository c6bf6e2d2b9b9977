#include "conduit/logging/logger_registry.h"

namespace conduit {
namespace logging {

std::string LogPattern::globToRegex(const std::string& glob) {
  static const std::string kRegexSpecials = ".+()[]{}^$|\\";
  std::string regex;
  regex.reserve(glob.size() * 2);
  for (char c : glob) {
    if (c == '*') {
      regex += ".*";
    } else if (c == '?') {
      regex += '.';
    } else {
      if (kRegexSpecials.find(c) != std::string::npos) {
        regex += '\\';
      }
      regex += c;
    }
  }
  return regex;
}

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() {
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_ = std::make_shared<Logger>("default");
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);
  loggers_["default"] = default_logger_;
}

LoggerSharedPtr LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

LoggerSharedPtr LoggerRegistry::getOrCreateLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  refreshLevelsLocked();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[component] = level;
  refreshLevelsLocked();
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);
  refreshLevelsLocked();
}

void LoggerRegistry::refreshLevelsLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  LogLevel effective;
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    effective = it->second->getLevel();
  } else {
    effective = getEffectiveLevelLocked(name);
  }
  return effective != LogLevel::Off && level >= effective;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  // Most recently added pattern wins
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }

  // "Pipeline.conn-1" falls under Component::Pipeline
  const std::string prefix = name.substr(0, name.find('.'));
  for (const auto& entry : component_levels_) {
    if (prefix == componentToString(entry.first)) {
      return entry.second;
    }
  }
  return global_level_;
}

void LoggerRegistry::setSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

std::string LoggerRegistry::getComponentPath(Component comp,
                                             const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

}  // namespace logging
}  // namespace conduit

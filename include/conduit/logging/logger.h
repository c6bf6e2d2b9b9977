#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "conduit/logging/log_level.h"
#include "conduit/logging/log_message.h"
#include "conduit/logging/log_sink.h"

namespace conduit {
namespace logging {

/**
 * Named, synchronous logger writing to a single sink.
 *
 * The level check is a relaxed atomic load, so a disabled statement costs
 * nothing beyond it; arguments are only formatted once it passed. The sink
 * is written under a mutex, which keeps lines from different threads whole.
 */
class Logger {
 public:
  explicit Logger(const std::string& name) : name_(name) {}

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    emitAt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    emitAt(LogLevel::Info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    emitAt(LogLevel::Warning, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    emitAt(LogLevel::Error, fmt, std::forward<Args>(args)...);
  }

  // Correlation ids, metadata and source location come from |ctx|
  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      const char* fmt,
                      Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    emit(ctx.toLogMessage(level, render(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args>
  void logWithComponent(LogLevel level,
                        Component component,
                        const char* fmt,
                        Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg = record(level, render(fmt, std::forward<Args>(args)...));
    msg.component = component;
    emit(std::move(msg));
  }

  // Entry point of CONDUIT_LOG
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg = record(level, render(fmt, std::forward<Args>(args)...));
    msg.file = file;
    msg.line = line;
    msg.function = function;
    emit(std::move(msg));
  }

  bool shouldLog(LogLevel level) const {
    const LogLevel threshold = level_.load(std::memory_order_relaxed);
    return threshold != LogLevel::Off && level >= threshold;
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }
  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
  }
  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 private:
  template <typename... Args>
  static std::string render(const char* fmt, Args&&... args) {
    return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
  }

  template <typename... Args>
  void emitAt(LogLevel level, const char* fmt, Args&&... args) {
    if (shouldLog(level)) {
      emit(record(level, render(fmt, std::forward<Args>(args)...)));
    }
  }

  static LogMessage record(LogLevel level, std::string text) {
    LogMessage msg;
    msg.level = level;
    msg.message = std::move(text);
    return msg;
  }

  void emit(LogMessage msg) {
    msg.logger_name = name_;
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  const std::string name_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  mutable std::mutex mutex_;
  std::shared_ptr<LogSink> sink_;
};

using LoggerSharedPtr = std::shared_ptr<Logger>;

}  // namespace logging
}  // namespace conduit

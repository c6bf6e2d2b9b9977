#pragma once

#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "conduit/logging/log_formatter.h"
#include "conduit/logging/log_message.h"

namespace conduit {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;
  virtual SinkType type() const = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Writes to stdout or stderr through stdio, one line per record
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr)
      : stream_(target == Stdout ? stdout : stderr) {}

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::Stdio; }

 private:
  std::FILE* stream_;
  std::mutex mutex_;
};

// Appends to a single file; flushes on every Error or higher
class FileSink : public LogSink {
 public:
  explicit FileSink(const std::string& filename);
  ~FileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::File; }

  bool isOpen() const { return file_.is_open(); }

 private:
  std::string filename_;
  std::ofstream file_;
  std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Forwards formatted lines to an embedding application
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback) : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override {
    if (callback_) {
      callback_(msg.level, msg.logger_name, formatter_->format(msg));
    }
  }

  void flush() override {}
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createFileSink(const std::string& filename);
  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true);
  static std::unique_ptr<LogSink> createNullSink();
  static std::unique_ptr<LogSink> createExternalSink(
      ExternalSink::LogCallback callback);
};

}  // namespace logging
}  // namespace conduit

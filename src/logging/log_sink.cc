#include "conduit/logging/log_sink.h"

#include <fmt/format.h>

namespace conduit {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  const std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  fmt::print(stream_, "{}\n", line);
  if (msg.level >= LogLevel::Error) {
    std::fflush(stream_);
  }
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::fflush(stream_);
}

FileSink::FileSink(const std::string& filename) : filename_(filename) {
  file_.open(filename_, std::ios::out | std::ios::app);
}

FileSink::~FileSink() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void FileSink::log(const LogMessage& msg) {
  std::string formatted = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return;
  }
  file_ << formatted << '\n';
  if (msg.level >= LogLevel::Error) {
    file_.flush();
  }
}

void FileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

std::unique_ptr<LogSink> SinkFactory::createFileSink(
    const std::string& filename) {
  return std::make_unique<FileSink>(filename);
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

std::unique_ptr<LogSink> SinkFactory::createExternalSink(
    ExternalSink::LogCallback callback) {
  return std::make_unique<ExternalSink>(std::move(callback));
}

}  // namespace logging
}  // namespace conduit

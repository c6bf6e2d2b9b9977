#pragma once

#include <unistd.h>

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <utility>

#include "conduit/logging/log_level.h"

namespace conduit {
namespace logging {

// One log record as handed to a sink
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::string logger_name;

  std::chrono::system_clock::time_point timestamp{
      std::chrono::system_clock::now()};
  pid_t process_id{getpid()};
  std::thread::id thread_id{std::this_thread::get_id()};

  Component component{Component::Root};
  std::string component_name;

  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  // Empty when unknown
  std::string trace_id;
  std::string request_id;
  std::string connection_id;

  std::map<std::string, std::string> key_values;
};

/**
 * Correlation data for one request, passed explicitly to
 * CONDUIT_LOG_WITH_CONTEXT. Requests build one from their trace ids and the
 * id of the connection carrying them.
 */
class LogContext {
 public:
  std::string trace_id;
  std::string request_id;
  std::string connection_id;

  Component component{Component::Root};
  std::string component_name;

  std::map<std::string, std::string> metadata;

  void setLocation(const char* file, int line, const char* function) {
    file_ = file;
    line_ = line;
    function_ = function;
  }

  // Ids set in |other| replace ours; metadata keys are merged
  void merge(const LogContext& other) {
    if (!other.trace_id.empty()) {
      trace_id = other.trace_id;
    }
    if (!other.request_id.empty()) {
      request_id = other.request_id;
    }
    if (!other.connection_id.empty()) {
      connection_id = other.connection_id;
    }
    for (const auto& entry : other.metadata) {
      metadata[entry.first] = entry.second;
    }
  }

  LogMessage toLogMessage(LogLevel level, std::string text) const {
    LogMessage msg;
    msg.level = level;
    msg.message = std::move(text);
    msg.component = component;
    msg.component_name = component_name;
    msg.file = file_;
    msg.line = line_;
    msg.function = function_;
    msg.trace_id = trace_id;
    msg.request_id = request_id;
    msg.connection_id = connection_id;
    msg.key_values = metadata;
    return msg;
  }

 private:
  const char* file_{nullptr};
  int line_{0};
  const char* function_{nullptr};
};

}  // namespace logging
}  // namespace conduit

#include "conduit/logging/log_formatter.h"

#include <ctime>
#include <iterator>
#include <sstream>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace conduit {
namespace logging {

namespace {

// Local time with millisecond precision
std::string timestampString(std::chrono::system_clock::time_point tp) {
  const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          tp.time_since_epoch())
                          .count() %
                      1000;
  std::tm local{};
  localtime_r(&secs, &local);
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local, millis);
}

std::string threadIdString(std::thread::id id) {
  std::ostringstream out;
  out << id;
  return out.str();
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);

  fmt::format_to(out, "[{}] [{}] [T:{}] ", timestampString(msg.timestamp),
                 logLevelToString(msg.level), threadIdString(msg.thread_id));

  if (msg.component != Component::Root) {
    if (msg.component_name.empty()) {
      fmt::format_to(out, "[{}] ", componentToString(msg.component));
    } else {
      fmt::format_to(out, "[{}.{}] ", componentToString(msg.component),
                     msg.component_name);
    }
  }
  fmt::format_to(out, "[{}] ", msg.logger_name);

  if (msg.file && msg.line > 0) {
    if (msg.function) {
      fmt::format_to(out, "[{}:{} {}()] ", msg.file, msg.line, msg.function);
    } else {
      fmt::format_to(out, "[{}:{}] ", msg.file, msg.line);
    }
  }

  if (!msg.trace_id.empty()) {
    fmt::format_to(out, "[trace:{}] ", msg.trace_id);
  }
  if (!msg.request_id.empty()) {
    fmt::format_to(out, "[req:{}] ", msg.request_id);
  }
  if (!msg.connection_id.empty()) {
    fmt::format_to(out, "[conn:{}] ", msg.connection_id);
  }

  fmt::format_to(out, "{}", msg.message);

  if (!msg.key_values.empty()) {
    const char* sep = " {";
    for (const auto& kv : msg.key_values) {
      fmt::format_to(out, "{}{}={}", sep, kv.first, kv.second);
      sep = ", ";
    }
    fmt::format_to(out, "}}");
  }

  return fmt::to_string(buf);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json line = {
      {"timestamp", timestampString(msg.timestamp)},
      {"level", logLevelToString(msg.level)},
      {"logger", msg.logger_name},
      {"thread", threadIdString(msg.thread_id)},
      {"message", msg.message},
  };

  if (msg.process_id > 0) {
    line["pid"] = msg.process_id;
  }
  if (msg.component != Component::Root) {
    line["component"] = componentToString(msg.component);
    if (!msg.component_name.empty()) {
      line["component_name"] = msg.component_name;
    }
  }
  if (msg.file) {
    line["file"] = msg.file;
    line["line"] = msg.line;
    if (msg.function) {
      line["function"] = msg.function;
    }
  }
  if (!msg.trace_id.empty()) {
    line["trace_id"] = msg.trace_id;
  }
  if (!msg.request_id.empty()) {
    line["request_id"] = msg.request_id;
  }
  if (!msg.connection_id.empty()) {
    line["connection_id"] = msg.connection_id;
  }
  if (!msg.key_values.empty()) {
    line["data"] = msg.key_values;
  }

  // Invalid UTF-8 in a message must not turn a log call into a throw
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace conduit

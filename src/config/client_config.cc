#include "conduit/config/client_config.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

#include "conduit/logging/logger_registry.h"

#define CONDUIT_LOG_COMPONENT "Config"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace config {

namespace {

Error fieldError(const std::string& field, const std::string& message) {
  return invalidArgumentError("config field '" + field + "': " + message);
}

Result<uint64_t> readUnsigned(const nlohmann::json& j,
                              const std::string& field,
                              uint64_t max) {
  if (!j.is_number_integer()) {
    return makeError<uint64_t>(fieldError(field, "expected an integer"));
  }
  if (j.is_number_unsigned()) {
    uint64_t value = j.get<uint64_t>();
    if (value > max) {
      return makeError<uint64_t>(fieldError(field, "value out of range"));
    }
    return makeSuccess<uint64_t>(std::move(value));
  }
  int64_t value = j.get<int64_t>();
  if (value < 0 || static_cast<uint64_t>(value) > max) {
    return makeError<uint64_t>(fieldError(field, "value out of range"));
  }
  return makeSuccess<uint64_t>(static_cast<uint64_t>(value));
}

Result<logging::LogLevel> readLogLevel(const nlohmann::json& j) {
  if (!j.is_string()) {
    return makeError<logging::LogLevel>(
        fieldError("log_level", "expected a string"));
  }
  std::string name = j.get<std::string>();
  std::string upper;
  for (char c : name) {
    upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  logging::LogLevel level = logging::stringToLogLevel(upper);
  if (upper != logging::logLevelToString(level)) {
    return makeError<logging::LogLevel>(
        fieldError("log_level", "unknown level '" + name + "'"));
  }
  return makeSuccess<logging::LogLevel>(std::move(level));
}

}  // namespace

Result<std::chrono::milliseconds> Duration::parse(const std::string& str) {
  static const std::regex pattern("^([0-9]+)(ms|s|m|h)$");
  std::smatch match;

  if (!std::regex_match(str, match, pattern)) {
    CONDUIT_LOG(Debug, "invalid duration '{}'", str);
    return makeError<std::chrono::milliseconds>(invalidArgumentError(
        "Invalid duration format '" + str +
        "'. Expected <number><unit> where unit is ms, s, m or h"));
  }

  const std::string digits = match[1].str();
  const std::string unit = match[2].str();

  int64_t multiplier = 1;
  if (unit == "s") {
    multiplier = 1000;
  } else if (unit == "m") {
    multiplier = 60 * 1000;
  } else if (unit == "h") {
    multiplier = 60 * 60 * 1000;
  }

  const int64_t max_count = std::numeric_limits<int64_t>::max() / multiplier;
  int64_t value = 0;
  for (char c : digits) {
    int digit = c - '0';
    if (value > (max_count - digit) / 10) {
      return makeError<std::chrono::milliseconds>(
          invalidArgumentError("Duration value too large: " + str));
    }
    value = value * 10 + digit;
  }

  return makeSuccess(std::chrono::milliseconds(value * multiplier));
}

Result<std::chrono::milliseconds> Duration::parse(const nlohmann::json& value) {
  if (value.is_string()) {
    return parse(value.get<std::string>());
  }

  const int64_t max_ms = std::numeric_limits<int64_t>::max();

  if (value.is_number_unsigned()) {
    const uint64_t ms = value.get<uint64_t>();
    if (ms > static_cast<uint64_t>(max_ms)) {
      return makeError<std::chrono::milliseconds>(
          invalidArgumentError("Duration value too large: " + value.dump()));
    }
    return makeSuccess(std::chrono::milliseconds(static_cast<int64_t>(ms)));
  }

  if (value.is_number_integer()) {
    const int64_t ms = value.get<int64_t>();
    if (ms < 0) {
      return makeError<std::chrono::milliseconds>(
          invalidArgumentError("Duration values must be non-negative"));
    }
    return makeSuccess(std::chrono::milliseconds(ms));
  }

  if (value.is_number_float()) {
    const double ms = value.get<double>();
    if (!std::isfinite(ms) || ms != std::floor(ms)) {
      return makeError<std::chrono::milliseconds>(invalidArgumentError(
          "Duration must be a whole number of milliseconds: " +
          value.dump()));
    }
    if (ms < 0) {
      return makeError<std::chrono::milliseconds>(
          invalidArgumentError("Duration values must be non-negative"));
    }
    // 2^63 is exact as a double; anything at or above it overflows int64
    if (ms >= static_cast<double>(max_ms)) {
      return makeError<std::chrono::milliseconds>(
          invalidArgumentError("Duration value too large: " + value.dump()));
    }
    return makeSuccess(std::chrono::milliseconds(static_cast<int64_t>(ms)));
  }

  return makeError<std::chrono::milliseconds>(invalidArgumentError(
      "Invalid duration value type: expected string or number"));
}

std::string Duration::toString(std::chrono::milliseconds duration) {
  auto ms = duration.count();

  if (ms == 0)
    return "0ms";
  if (ms % (60 * 60 * 1000) == 0)
    return std::to_string(ms / (60 * 60 * 1000)) + "h";
  if (ms % (60 * 1000) == 0)
    return std::to_string(ms / (60 * 1000)) + "m";
  if (ms % 1000 == 0)
    return std::to_string(ms / 1000) + "s";
  return std::to_string(ms) + "ms";
}

bool Duration::isValid(const std::string& str) {
  static const std::regex pattern("^[0-9]+(ms|s|m|h)$");
  return std::regex_match(str, pattern);
}

Result<Origin> parseOrigin(const std::string& url) {
  static const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    return makeError<Origin>(
        notSupportedError("only http:// origins are supported: " + url));
  }

  std::string authority = url.substr(scheme.size());
  if (!authority.empty() && authority.back() == '/') {
    authority.pop_back();
  }
  if (authority.empty() ||
      authority.find_first_of("/?#@") != std::string::npos) {
    return makeError<Origin>(invalidArgumentError("invalid origin: " + url));
  }

  Origin origin;
  std::string port;
  if (authority[0] == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos || close == 1) {
      return makeError<Origin>(invalidArgumentError("invalid origin: " + url));
    }
    origin.host = authority.substr(1, close - 1);
    std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':') {
        return makeError<Origin>(
            invalidArgumentError("invalid origin: " + url));
      }
      port = rest.substr(1);
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      origin.host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
    } else {
      origin.host = authority;
    }
    if (origin.host.empty()) {
      return makeError<Origin>(invalidArgumentError("invalid origin: " + url));
    }
  }

  if (!port.empty()) {
    uint32_t value = 0;
    for (char c : port) {
      if (!std::isdigit(static_cast<unsigned char>(c)) || value > 65535) {
        return makeError<Origin>(
            invalidArgumentError("invalid port in origin: " + url));
      }
      value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value == 0 || value > 65535 || port.size() > 5) {
      return makeError<Origin>(
          invalidArgumentError("invalid port in origin: " + url));
    }
    origin.port = static_cast<uint16_t>(value);
  }

  return makeSuccess(std::move(origin));
}

Result<ClientConfig> parseClientConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    return makeError<ClientConfig>(
        invalidArgumentError("client config must be a JSON object"));
  }

  ClientConfig config;

  if (j.contains("origin")) {
    if (j.contains("host") || j.contains("port")) {
      return makeError<ClientConfig>(
          fieldError("origin", "cannot be combined with host or port"));
    }
    if (!j["origin"].is_string()) {
      return makeError<ClientConfig>(
          fieldError("origin", "expected a string"));
    }
    auto origin = parseOrigin(j["origin"].get<std::string>());
    if (isError(origin)) {
      return makeError<ClientConfig>(
          fieldError("origin", errorOf(origin).message));
    }
    config.host = get<Origin>(origin).host;
    config.port = get<Origin>(origin).port;
  } else {
    if (j.contains("host")) {
      if (!j["host"].is_string() || j["host"].get<std::string>().empty()) {
        return makeError<ClientConfig>(
            fieldError("host", "expected a non-empty string"));
      }
      config.host = j["host"].get<std::string>();
    }
    if (j.contains("port")) {
      auto port = readUnsigned(j["port"], "port", 65535);
      if (isError(port)) {
        return makeError<ClientConfig>(errorOf(port));
      }
      if (get<uint64_t>(port) == 0) {
        return makeError<ClientConfig>(fieldError("port", "must be positive"));
      }
      config.port = static_cast<uint16_t>(get<uint64_t>(port));
    }
  }

  if (j.contains("request_timeout")) {
    auto timeout = Duration::parse(j["request_timeout"]);
    if (isError(timeout)) {
      return makeError<ClientConfig>(
          fieldError("request_timeout", errorOf(timeout).message));
    }
    config.request_timeout = get<std::chrono::milliseconds>(timeout);
  }

  if (j.contains("max_in_flight")) {
    auto max_in_flight = readUnsigned(j["max_in_flight"], "max_in_flight",
                                      std::numeric_limits<uint32_t>::max());
    if (isError(max_in_flight)) {
      return makeError<ClientConfig>(errorOf(max_in_flight));
    }
    if (get<uint64_t>(max_in_flight) != 1) {
      return makeError<ClientConfig>(
          fieldError("max_in_flight", "only 1 is supported"));
    }
    config.max_in_flight = 1;
  }

  if (j.contains("read_chunk_size")) {
    auto chunk = readUnsigned(j["read_chunk_size"], "read_chunk_size",
                              std::numeric_limits<uint32_t>::max());
    if (isError(chunk)) {
      return makeError<ClientConfig>(errorOf(chunk));
    }
    if (get<uint64_t>(chunk) == 0) {
      return makeError<ClientConfig>(
          fieldError("read_chunk_size", "must be positive"));
    }
    config.read_chunk_size = static_cast<size_t>(get<uint64_t>(chunk));
  }

  if (j.contains("log_level")) {
    auto level = readLogLevel(j["log_level"]);
    if (isError(level)) {
      return makeError<ClientConfig>(errorOf(level));
    }
    config.log_level = get<logging::LogLevel>(level);
  }

  static const char* const kKnownKeys[] = {
      "origin",        "host",            "port",     "request_timeout",
      "max_in_flight", "read_chunk_size", "log_level"};
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool known = false;
    for (const char* key : kKnownKeys) {
      if (it.key() == key) {
        known = true;
        break;
      }
    }
    if (!known) {
      CONDUIT_LOG(Warning, "ignoring unknown config key '{}'", it.key());
    }
  }

  CONDUIT_LOG(Debug, "client config: {}:{} timeout={} chunk={}", config.host,
              config.port, Duration::toString(config.request_timeout),
              config.read_chunk_size);
  return makeSuccess(std::move(config));
}

Result<ClientConfig> loadClientConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return makeError<ClientConfig>(
        invalidArgumentError("cannot open config file: " + path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error& e) {
    CONDUIT_LOG(Error, "failed to parse {}: {}", path, e.what());
    return makeError<ClientConfig>(invalidArgumentError(
        "invalid JSON in " + path + ": " + std::string(e.what())));
  }

  auto result = parseClientConfig(j);
  if (isError(result)) {
    return makeError<ClientConfig>(
        invalidArgumentError(path + ": " + errorOf(result).message));
  }
  return result;
}

void applyLogLevel(const ClientConfig& config) {
  logging::LoggerRegistry::instance().setGlobalLevel(config.log_level);
}

}  // namespace config
}  // namespace conduit

#ifndef CONDUIT_CONFIG_CLIENT_CONFIG_H
#define CONDUIT_CONFIG_CLIENT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "conduit/core/result.h"
#include "conduit/logging/log_level.h"

namespace conduit {
namespace config {

// Duration values: a bare number is milliseconds, strings carry a unit
// (10ms, 5s, 2m, 1h)
class Duration {
 public:
  static Result<std::chrono::milliseconds> parse(const std::string& str);
  static Result<std::chrono::milliseconds> parse(const nlohmann::json& value);

  static std::string toString(std::chrono::milliseconds duration);

  static bool isValid(const std::string& str);
};

struct Origin {
  std::string host;
  uint16_t port{80};
};

// Accepts http://host[:port][/]; anything after the authority is rejected
Result<Origin> parseOrigin(const std::string& url);

struct ClientConfig {
  std::string host{"localhost"};
  uint16_t port{80};
  // Applied to requests that do not set their own timeout; 0 disables
  std::chrono::milliseconds request_timeout{0};
  size_t max_in_flight{1};
  size_t read_chunk_size{16384};
  logging::LogLevel log_level{logging::LogLevel::Info};
};

/**
 * Reads a client configuration object.
 *
 * Recognized keys: origin (or host and port), request_timeout,
 * max_in_flight, read_chunk_size, log_level. Unknown keys are logged and
 * ignored. Errors are InvalidArgument and name the offending field.
 */
Result<ClientConfig> parseClientConfig(const nlohmann::json& j);

Result<ClientConfig> loadClientConfigFile(const std::string& path);

// Sets the global level on the logger registry
void applyLogLevel(const ClientConfig& config);

}  // namespace config
}  // namespace conduit

#endif  // CONDUIT_CONFIG_CLIENT_CONFIG_H

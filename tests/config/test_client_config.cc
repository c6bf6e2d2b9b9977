#include <cstdio>
#include <fstream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "conduit/config/client_config.h"
#include "conduit/logging/log_sink.h"
#include "conduit/logging/logger_registry.h"

namespace conduit {
namespace config {
namespace {

using std::chrono::milliseconds;
using nlohmann::json;

class RecordingSink : public logging::LogSink {
 public:
  void log(const logging::LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(msg);
  }

  void flush() override {}
  logging::SinkType type() const override { return logging::SinkType::Null; }

  bool hasMessage(logging::LogLevel level, const std::string& substr) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& msg : messages_) {
      if (msg.level == level && msg.message.find(substr) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

 private:
  std::mutex mutex_;
  std::vector<logging::LogMessage> messages_;
};

milliseconds parseMs(const std::string& text) {
  auto result = Duration::parse(text);
  EXPECT_TRUE(isSuccess(result)) << text;
  return isSuccess(result) ? get<milliseconds>(result) : milliseconds(-1);
}

class ClientConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& registry = logging::LoggerRegistry::instance();
    saved_level_ = registry.getGlobalLevel();
    logger_ = registry.getOrCreateLogger("Config");
    saved_sink_ = logger_->getSink();
    sink_ = std::make_shared<RecordingSink>();
    logger_->setSink(sink_);
  }

  void TearDown() override {
    logger_->setSink(saved_sink_);
    logging::LoggerRegistry::instance().setGlobalLevel(saved_level_);
  }

  std::string writeFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
  }

  logging::LogLevel saved_level_;
  logging::LoggerSharedPtr logger_;
  std::shared_ptr<logging::LogSink> saved_sink_;
  std::shared_ptr<RecordingSink> sink_;
};

// ============================================================================
// Duration
// ============================================================================

TEST_F(ClientConfigTest, DurationUnits) {
  EXPECT_EQ(milliseconds(250), parseMs("250ms"));
  EXPECT_EQ(milliseconds(5000), parseMs("5s"));
  EXPECT_EQ(milliseconds(120000), parseMs("2m"));
  EXPECT_EQ(milliseconds(3600000), parseMs("1h"));
  EXPECT_EQ(milliseconds(0), parseMs("0s"));
}

TEST_F(ClientConfigTest, DurationRejectsMalformed) {
  for (const char* input : {"", "10", "s", "1.5s", "-1s", "10 s", "10sec",
                            "10S", "1d"}) {
    auto result = Duration::parse(std::string(input));
    ASSERT_TRUE(isError(result)) << input;
    EXPECT_EQ(ErrorCode::InvalidArgument, errorOf(result).code);
    EXPECT_FALSE(Duration::isValid(input)) << input;
  }
}

TEST_F(ClientConfigTest, DurationOverflow) {
  auto result = Duration::parse(std::string("99999999999999999999h"));
  ASSERT_TRUE(isError(result));
  EXPECT_NE(std::string::npos, errorOf(result).message.find("too large"));
}

TEST_F(ClientConfigTest, DurationFromJson) {
  EXPECT_EQ(milliseconds(1500),
            get<milliseconds>(Duration::parse(json(1500))));
  EXPECT_EQ(milliseconds(30000),
            get<milliseconds>(Duration::parse(json("30s"))));
  EXPECT_TRUE(isError(Duration::parse(json(-5))));
  EXPECT_TRUE(isError(Duration::parse(json(true))));
  EXPECT_TRUE(isError(Duration::parse(json::array())));
}

TEST_F(ClientConfigTest, DurationFromJsonRejectsUnrepresentableNumbers) {
  EXPECT_EQ(milliseconds(2000),
            get<milliseconds>(Duration::parse(json(2000.0))));
  EXPECT_EQ(milliseconds(std::numeric_limits<int64_t>::max()),
            get<milliseconds>(Duration::parse(
                json(std::numeric_limits<int64_t>::max()))));

  EXPECT_TRUE(isError(Duration::parse(json(1e30))));
  EXPECT_TRUE(isError(Duration::parse(json(9.3e18))));
  EXPECT_TRUE(isError(Duration::parse(json(-1e30))));
  EXPECT_TRUE(isError(Duration::parse(json(1.5))));
  EXPECT_TRUE(isError(Duration::parse(
      json(static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1))));

  auto config = parseClientConfig(json{{"request_timeout", 1e30}});
  ASSERT_TRUE(isError(config));
  EXPECT_EQ(ErrorCode::InvalidArgument, errorOf(config).code);
}

TEST_F(ClientConfigTest, DurationToString) {
  EXPECT_EQ("0ms", Duration::toString(milliseconds(0)));
  EXPECT_EQ("250ms", Duration::toString(milliseconds(250)));
  EXPECT_EQ("5s", Duration::toString(milliseconds(5000)));
  EXPECT_EQ("2m", Duration::toString(milliseconds(120000)));
  EXPECT_EQ("1h", Duration::toString(milliseconds(3600000)));
  EXPECT_EQ("1500ms", Duration::toString(milliseconds(1500)));
}

// ============================================================================
// Origin
// ============================================================================

TEST_F(ClientConfigTest, OriginHostOnly) {
  auto origin = parseOrigin("http://example.com");
  ASSERT_TRUE(isSuccess(origin));
  EXPECT_EQ("example.com", get<Origin>(origin).host);
  EXPECT_EQ(80, get<Origin>(origin).port);
}

TEST_F(ClientConfigTest, OriginWithPortAndSlash) {
  auto origin = parseOrigin("http://127.0.0.1:8080/");
  ASSERT_TRUE(isSuccess(origin));
  EXPECT_EQ("127.0.0.1", get<Origin>(origin).host);
  EXPECT_EQ(8080, get<Origin>(origin).port);
}

TEST_F(ClientConfigTest, OriginIpv6) {
  auto origin = parseOrigin("http://[::1]:3000");
  ASSERT_TRUE(isSuccess(origin));
  EXPECT_EQ("::1", get<Origin>(origin).host);
  EXPECT_EQ(3000, get<Origin>(origin).port);

  auto bare = parseOrigin("http://[fe80::1]");
  ASSERT_TRUE(isSuccess(bare));
  EXPECT_EQ("fe80::1", get<Origin>(bare).host);
  EXPECT_EQ(80, get<Origin>(bare).port);
}

TEST_F(ClientConfigTest, OriginRejectsOtherSchemes) {
  auto result = parseOrigin("https://example.com");
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(ErrorCode::NotSupported, errorOf(result).code);
}

TEST_F(ClientConfigTest, OriginRejectsMalformed) {
  for (const char* url :
       {"http://", "http://host/path", "http://host?q=1", "http://user@host",
        "http://host:0", "http://host:65536", "http://host:80a", "http://:80",
        "http://[::1", "http://[]:80", "http://[::1]x"}) {
    auto result = parseOrigin(url);
    ASSERT_TRUE(isError(result)) << url;
    EXPECT_EQ(ErrorCode::InvalidArgument, errorOf(result).code) << url;
  }
}

// ============================================================================
// ClientConfig
// ============================================================================

TEST_F(ClientConfigTest, Defaults) {
  auto result = parseClientConfig(json::object());
  ASSERT_TRUE(isSuccess(result));
  const auto& config = get<ClientConfig>(result);
  EXPECT_EQ("localhost", config.host);
  EXPECT_EQ(80, config.port);
  EXPECT_EQ(milliseconds(0), config.request_timeout);
  EXPECT_EQ(1u, config.max_in_flight);
  EXPECT_EQ(16384u, config.read_chunk_size);
  EXPECT_EQ(logging::LogLevel::Info, config.log_level);
}

TEST_F(ClientConfigTest, FullConfig) {
  json j = {{"host", "api.internal"},   {"port", 8081},
            {"request_timeout", "30s"}, {"max_in_flight", 1},
            {"read_chunk_size", 4096},  {"log_level", "debug"}};
  auto result = parseClientConfig(j);
  ASSERT_TRUE(isSuccess(result));
  const auto& config = get<ClientConfig>(result);
  EXPECT_EQ("api.internal", config.host);
  EXPECT_EQ(8081, config.port);
  EXPECT_EQ(milliseconds(30000), config.request_timeout);
  EXPECT_EQ(4096u, config.read_chunk_size);
  EXPECT_EQ(logging::LogLevel::Debug, config.log_level);
}

TEST_F(ClientConfigTest, OriginKey) {
  auto result = parseClientConfig({{"origin", "http://svc:9000"}});
  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ("svc", get<ClientConfig>(result).host);
  EXPECT_EQ(9000, get<ClientConfig>(result).port);
}

TEST_F(ClientConfigTest, OriginConflictsWithHost) {
  auto result =
      parseClientConfig({{"origin", "http://svc:9000"}, {"host", "other"}});
  ASSERT_TRUE(isError(result));
  EXPECT_NE(std::string::npos, errorOf(result).message.find("'origin'"));
}

TEST_F(ClientConfigTest, NumericTimeoutIsMilliseconds) {
  auto result = parseClientConfig({{"request_timeout", 750}});
  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(milliseconds(750), get<ClientConfig>(result).request_timeout);
}

TEST_F(ClientConfigTest, FieldErrorsNameTheField) {
  struct Case {
    json input;
    const char* field;
  };
  std::vector<Case> cases = {
      {{{"host", ""}}, "'host'"},
      {{{"host", 42}}, "'host'"},
      {{{"port", 0}}, "'port'"},
      {{{"port", 70000}}, "'port'"},
      {{{"port", "80"}}, "'port'"},
      {{{"port", -1}}, "'port'"},
      {{{"request_timeout", "soon"}}, "'request_timeout'"},
      {{{"max_in_flight", 2}}, "'max_in_flight'"},
      {{{"read_chunk_size", 0}}, "'read_chunk_size'"},
      {{{"log_level", "verbose"}}, "'log_level'"},
      {{{"log_level", 3}}, "'log_level'"},
      {{{"origin", "ftp://x"}}, "'origin'"},
  };
  for (const auto& c : cases) {
    auto result = parseClientConfig(c.input);
    ASSERT_TRUE(isError(result)) << c.input.dump();
    EXPECT_EQ(ErrorCode::InvalidArgument, errorOf(result).code);
    EXPECT_NE(std::string::npos, errorOf(result).message.find(c.field))
        << errorOf(result).message;
  }
}

TEST_F(ClientConfigTest, NonObjectRejected) {
  EXPECT_TRUE(isError(parseClientConfig(json::array())));
  EXPECT_TRUE(isError(parseClientConfig(json("http://x"))));
}

TEST_F(ClientConfigTest, LogLevelIsCaseInsensitive) {
  auto result = parseClientConfig({{"log_level", "Warning"}});
  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(logging::LogLevel::Warning, get<ClientConfig>(result).log_level);
}

TEST_F(ClientConfigTest, UnknownKeysAreLogged) {
  auto result = parseClientConfig({{"host", "h"}, {"pipelining", 4}});
  ASSERT_TRUE(isSuccess(result));
  EXPECT_TRUE(sink_->hasMessage(logging::LogLevel::Warning, "pipelining"));
}

TEST_F(ClientConfigTest, LoadFile) {
  std::string path = writeFile(
      "conduit_client_config.json",
      R"({"origin": "http://localhost:8080", "request_timeout": "2s"})");
  auto result = loadClientConfigFile(path);
  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(8080, get<ClientConfig>(result).port);
  EXPECT_EQ(milliseconds(2000), get<ClientConfig>(result).request_timeout);
  std::remove(path.c_str());
}

TEST_F(ClientConfigTest, LoadFileMissing) {
  auto result = loadClientConfigFile(::testing::TempDir() +
                                     "conduit_does_not_exist.json");
  ASSERT_TRUE(isError(result));
  EXPECT_NE(std::string::npos, errorOf(result).message.find("cannot open"));
}

TEST_F(ClientConfigTest, LoadFileInvalidJson) {
  std::string path = writeFile("conduit_bad_config.json", "{\"port\": ");
  auto result = loadClientConfigFile(path);
  ASSERT_TRUE(isError(result));
  EXPECT_NE(std::string::npos, errorOf(result).message.find("invalid JSON"));
  EXPECT_TRUE(sink_->hasMessage(logging::LogLevel::Error, path));
  std::remove(path.c_str());
}

TEST_F(ClientConfigTest, LoadFileInvalidFieldMentionsPath) {
  std::string path = writeFile("conduit_bad_field.json", R"({"port": 0})");
  auto result = loadClientConfigFile(path);
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(0u, errorOf(result).message.find(path));
  std::remove(path.c_str());
}

TEST_F(ClientConfigTest, ApplyLogLevel) {
  ClientConfig config;
  config.log_level = logging::LogLevel::Error;
  applyLogLevel(config);
  EXPECT_EQ(logging::LogLevel::Error,
            logging::LoggerRegistry::instance().getGlobalLevel());
}

}  // namespace
}  // namespace config
}  // namespace conduit

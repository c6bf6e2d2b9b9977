#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "conduit/client/client.h"
#include "conduit/client/subscribable.h"
#include "conduit/config/client_config.h"
#include "conduit/event/event_loop.h"
#include "../mocks/transport_mocks.h"

namespace conduit {
namespace client {
namespace {

using test::FakeNetwork;

class ClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto factory = event::createLibeventDispatcherFactory();
    dispatcher_ = factory->createDispatcher("client-test");
    network_ = std::make_unique<FakeNetwork>(*dispatcher_);
    config_.host = "example.test";
  }

  void TearDown() override {
    client_.reset();
    test::runPending(*dispatcher_);
  }

  void createClient() {
    client_ = std::make_unique<Client>(*dispatcher_, config_,
                                       network_->factory());
  }

  bool runUntil(const std::function<bool()>& condition) {
    return test::runUntil(*dispatcher_, condition);
  }

  std::unique_ptr<event::Dispatcher> dispatcher_;
  std::unique_ptr<FakeNetwork> network_;
  config::ClientConfig config_;
  std::unique_ptr<Client> client_;
};

struct Outcome {
  int calls{0};
  optional<Error> error;
  optional<StartResponse> response;
  std::string body;
  bool completed{false};
  optional<Error> body_error;
};

StartCallback record(std::shared_ptr<Outcome> outcome) {
  return [outcome](const optional<Error>& err,
                   optional<StartResponse> response) -> DeliverySink {
    ++outcome->calls;
    outcome->error = err;
    outcome->response = std::move(response);
    if (err) {
      return nullptr;
    }
    return [outcome](const optional<Error>& sink_err,
                     const std::string* chunk) {
      if (chunk) {
        outcome->body += *chunk;
      } else if (sink_err) {
        outcome->body_error = sink_err;
      } else {
        outcome->completed = true;
      }
    };
  };
}

RequestDescriptor describe(const std::string& method, const std::string& path) {
  RequestDescriptor descriptor;
  descriptor.method = method;
  descriptor.path = path;
  return descriptor;
}

TEST_F(ClientTest, ConnectsOnConstruction) {
  createClient();
  EXPECT_EQ(1u, network_->count());
  EXPECT_EQ(1, network_->last().connect_calls);
  ASSERT_TRUE(runUntil([this] { return client_->connected(); }));
  EXPECT_FALSE(client_->closed());
  EXPECT_EQ(0, client_->connectionId().find("conn-"));
}

TEST_F(ClientTest, ConnectionIdsAreDistinct) {
  createClient();
  Client other(*dispatcher_, config_, network_->factory());
  EXPECT_NE(client_->connectionId(), other.connectionId());
}

TEST_F(ClientTest, HostnameCarriesNonDefaultPort) {
  createClient();
  EXPECT_EQ("example.test", client_->hostname());

  config::ClientConfig with_port = config_;
  with_port.port = 8080;
  Client ported(*dispatcher_, with_port, network_->factory());
  EXPECT_EQ("example.test:8080", ported.hostname());
  EXPECT_EQ("example.test", ported.target().hostname);

  config::ClientConfig ipv6 = config_;
  ipv6.host = "::1";
  ipv6.port = 8080;
  Client bracketed(*dispatcher_, ipv6, network_->factory());
  EXPECT_EQ("[::1]:8080", bracketed.hostname());
  EXPECT_EQ("::1", bracketed.target().hostname);
}

TEST_F(ClientTest, RoundTrip) {
  createClient();
  auto outcome = std::make_shared<Outcome>();
  auto descriptor = describe("GET", "/index");
  descriptor.opaque = std::make_shared<int>(7);
  descriptor.trace.request_id = "req-1";
  auto submitted = client_->submit(std::move(descriptor), record(outcome));
  ASSERT_TRUE(isSuccess(submitted));
  EXPECT_EQ(0, outcome->calls);
  EXPECT_EQ(1u, client_->pending());

  auto& endpoint = network_->last();
  ASSERT_TRUE(runUntil([&endpoint] { return !endpoint.written.empty(); }));
  EXPECT_EQ(
      "GET /index HTTP/1.1\r\nhost: example.test\r\n"
      "connection: keep-alive\r\n\r\n",
      endpoint.written);
  EXPECT_EQ(1u, client_->running());

  endpoint.deliver(
      "HTTP/1.1 200 OK\r\nX-Tag: a\r\nX-Tag: b\r\nContent-Length: 5\r\n\r\n"
      "hello");

  ASSERT_EQ(1, outcome->calls);
  ASSERT_TRUE(outcome->response.has_value());
  EXPECT_EQ(200, outcome->response->status_code);
  auto* tags = outcome->response->headers.find("X-Tag");
  ASSERT_NE(nullptr, tags);
  auto* list = get_if<std::vector<std::string>>(tags);
  ASSERT_NE(nullptr, list);
  EXPECT_EQ(2u, list->size());
  EXPECT_EQ(7, *std::static_pointer_cast<int>(outcome->response->opaque));
  EXPECT_EQ("req-1", outcome->response->trace.request_id);
  EXPECT_EQ("hello", outcome->body);
  EXPECT_TRUE(outcome->completed);
  EXPECT_EQ(0u, client_->running());
}

TEST_F(ClientTest, InvalidRequestRejectedSynchronously) {
  createClient();
  auto outcome = std::make_shared<Outcome>();
  auto result = client_->submit(describe("CONNECT", "/"),
                                record(outcome));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(ErrorCode::NotSupported, errorOf(result).code);
  EXPECT_EQ(0u, client_->pending());

  test::runPending(*dispatcher_);
  EXPECT_EQ(0, outcome->calls);
  EXPECT_TRUE(network_->last().written.empty());

  result = client_->submit(describe("GET", ""), record(outcome));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(ErrorCode::InvalidArgument, errorOf(result).code);
}

TEST_F(ClientTest, DefaultTimeoutAppliesToRequests) {
  config_.request_timeout = std::chrono::milliseconds(20);
  createClient();
  auto outcome = std::make_shared<Outcome>();
  ASSERT_TRUE(isSuccess(client_->submit(describe("GET", "/"),
                                        record(outcome))));
  ASSERT_TRUE(runUntil([&outcome] { return outcome->calls > 0; }));
  ASSERT_TRUE(outcome->error.has_value());
  EXPECT_EQ(ErrorCode::RequestTimeout, outcome->error->code);
}

TEST_F(ClientTest, RequestTimeoutOverridesDefault) {
  config_.request_timeout = std::chrono::milliseconds(20);
  createClient();
  auto outcome = std::make_shared<Outcome>();
  auto descriptor = describe("GET", "/");
  descriptor.timeout = 0;
  ASSERT_TRUE(isSuccess(client_->submit(std::move(descriptor),
                                        record(outcome))));

  auto& endpoint = network_->last();
  ASSERT_TRUE(runUntil([&endpoint] { return !endpoint.written.empty(); }));
  // Well past the default, still waiting
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  test::runPending(*dispatcher_);
  EXPECT_EQ(0, outcome->calls);

  endpoint.deliver("HTTP/1.1 204 No Content\r\n\r\n");
  EXPECT_EQ(1, outcome->calls);
  EXPECT_TRUE(outcome->completed);
}

TEST_F(ClientTest, AbortSignal) {
  createClient();
  auto signal = std::make_shared<AbortController>();
  auto outcome = std::make_shared<Outcome>();
  auto descriptor = describe("GET", "/");
  descriptor.signal = signal;
  ASSERT_TRUE(isSuccess(client_->submit(std::move(descriptor),
                                        record(outcome))));
  EXPECT_EQ(1u, signal->listenerCount());

  signal->abort();
  ASSERT_EQ(1, outcome->calls);
  EXPECT_EQ(ErrorCode::RequestAborted, outcome->error->code);
  EXPECT_EQ(0u, signal->listenerCount());
}

TEST_F(ClientTest, CloseFailsOutstandingAndLaterRequests) {
  createClient();
  auto first = std::make_shared<Outcome>();
  auto second = std::make_shared<Outcome>();
  ASSERT_TRUE(isSuccess(client_->submit(describe("GET", "/1"),
                                        record(first))));
  ASSERT_TRUE(isSuccess(client_->submit(describe("GET", "/2"),
                                        record(second))));

  client_->close();
  EXPECT_TRUE(client_->closed());
  EXPECT_EQ(ErrorCode::ConnectionClosed, first->error->code);
  EXPECT_EQ(ErrorCode::ConnectionClosed, second->error->code);

  auto late = std::make_shared<Outcome>();
  ASSERT_TRUE(isSuccess(client_->submit(describe("GET", "/3"),
                                        record(late))));
  EXPECT_EQ(0, late->calls);
  ASSERT_TRUE(runUntil([&late] { return late->calls > 0; }));
  EXPECT_EQ(ErrorCode::ConnectionClosed, late->error->code);
}

TEST_F(ClientTest, DestructionFailsOutstanding) {
  createClient();
  auto outcome = std::make_shared<Outcome>();
  ASSERT_TRUE(isSuccess(client_->submit(describe("GET", "/"),
                                        record(outcome))));
  client_.reset();
  ASSERT_EQ(1, outcome->calls);
  EXPECT_EQ(ErrorCode::ConnectionClosed, outcome->error->code);
}

TEST_F(ClientTest, RejectsPipeliningConfig) {
  config_.max_in_flight = 4;
  EXPECT_THROW(createClient(), std::invalid_argument);
}

}  // namespace
}  // namespace client
}  // namespace conduit

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "conduit/client/client.h"
#include "conduit/config/client_config.h"
#include "conduit/event/event_loop.h"
#include "conduit/network/tcp_transport.h"
#include "../mocks/transport_mocks.h"

namespace conduit {
namespace network {
namespace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

/**
 * Non-blocking loopback listener polled from the test thread, so the
 * dispatcher and the server interleave on one thread.
 */
class LoopbackServer {
 public:
  LoopbackServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    EXPECT_EQ(0, ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr),
                        sizeof(addr)));
    EXPECT_EQ(0, ::listen(listen_fd_, 8));
    setNonBlocking(listen_fd_);

    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~LoopbackServer() {
    for (int fd : connections_) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
    ::close(listen_fd_);
  }

  uint16_t port() const { return port_; }
  size_t accepted() const { return connections_.size(); }

  // Accepts any pending connection; true when one was accepted
  bool pollAccept() {
    int fd = ::accept(listen_fd_, nullptr, nullptr);
    if (fd < 0) {
      return false;
    }
    setNonBlocking(fd);
    connections_.push_back(fd);
    received_.emplace_back();
    return true;
  }

  // Drains what connection |index| sent so far
  const std::string& received(size_t index) {
    char buffer[4096];
    ssize_t n;
    while ((n = ::recv(connections_[index], buffer, sizeof(buffer), 0)) > 0) {
      received_[index].append(buffer, static_cast<size_t>(n));
    }
    return received_[index];
  }

  void send(size_t index, const std::string& data) {
    ASSERT_EQ(static_cast<ssize_t>(data.size()),
              ::send(connections_[index], data.data(), data.size(),
                     MSG_NOSIGNAL));
  }

  void closeConnection(size_t index) {
    ::close(connections_[index]);
    connections_[index] = -1;
  }

 private:
  static void setNonBlocking(int fd) {
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
  }

  int listen_fd_{-1};
  uint16_t port_{0};
  std::vector<int> connections_;
  std::vector<std::string> received_;
};

// A loopback port with nothing listening on it
uint16_t unusedPort() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
  ::close(fd);
  return ntohs(addr.sin_port);
}

ResolvedAddress loopbackAddress(uint16_t port) {
  ResolvedAddress entry;
  std::memset(&entry.address, 0, sizeof(entry.address));
  auto* addr = reinterpret_cast<sockaddr_in*>(&entry.address);
  addr->sin_family = AF_INET;
  addr->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr->sin_port = htons(port);
  entry.length = sizeof(sockaddr_in);
  return entry;
}

// Resolver answering every lookup with |ports| on 127.0.0.1, in order
Resolver fixedResolver(std::vector<uint16_t> ports) {
  return [ports](const std::string&, uint16_t) -> Result<AddressList> {
    AddressList addresses;
    for (uint16_t port : ports) {
      addresses.push_back(loopbackAddress(port));
    }
    return makeSuccess(std::move(addresses));
  };
}

class TcpTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto factory = event::createLibeventDispatcherFactory();
    dispatcher_ = factory->createDispatcher("tcp-test");
  }

  void TearDown() override {
    transport_.reset();
    test::runPending(*dispatcher_);
  }

  bool runUntil(const std::function<bool()>& condition) {
    return test::runUntil(*dispatcher_, condition);
  }

  std::unique_ptr<event::Dispatcher> dispatcher_;
  std::unique_ptr<TcpTransport> transport_;
};

TEST_F(TcpTransportTest, ConnectWriteRead) {
  LoopbackServer server;
  NiceMock<test::MockTransportCallbacks> callbacks;
  bool connected = false;
  std::string inbound;
  bool eof = false;

  transport_ = std::make_unique<TcpTransport>(*dispatcher_, "127.0.0.1",
                                              server.port());
  EXPECT_CALL(callbacks, onTransportConnected()).WillOnce(Invoke([&]() {
    connected = true;
  }));
  EXPECT_CALL(callbacks, onTransportError(_)).Times(0);
  ON_CALL(callbacks, onTransportReadable()).WillByDefault(Invoke([&]() {
    while (true) {
      auto result = transport_->read(inbound, 3);
      if (!result.ok()) {
        EXPECT_TRUE(result.wouldBlock());
        return;
      }
      if (*result == 0) {
        eof = true;
        return;
      }
    }
  }));
  transport_->setCallbacks(callbacks);
  EXPECT_EQ("127.0.0.1", transport_->hostname());

  transport_->connect();
  EXPECT_TRUE(transport_->isOpen());
  // Written before the handshake finishes; flushed once connected
  transport_->write("ping");

  ASSERT_TRUE(runUntil([&] {
    server.pollAccept();
    return server.accepted() == 1;
  }));
  ASSERT_TRUE(runUntil([&] { return connected; }));
  EXPECT_TRUE(transport_->connected());
  ASSERT_TRUE(runUntil([&] { return server.received(0) == "ping"; }));

  server.send(0, "pong and more");
  ASSERT_TRUE(runUntil([&] { return inbound == "pong and more"; }));

  server.closeConnection(0);
  ASSERT_TRUE(runUntil([&] { return eof; }));

  transport_->close();
  EXPECT_FALSE(transport_->isOpen());
  EXPECT_FALSE(transport_->connected());
}

TEST_F(TcpTransportTest, ConnectRefused) {
  NiceMock<test::MockTransportCallbacks> callbacks;
  optional<Error> error;
  EXPECT_CALL(callbacks, onTransportConnected()).Times(0);
  EXPECT_CALL(callbacks, onTransportError(_))
      .WillOnce(Invoke([&](const Error& err) { error = err; }));

  transport_ = std::make_unique<TcpTransport>(*dispatcher_, "127.0.0.1",
                                              unusedPort());
  transport_->setCallbacks(callbacks);
  transport_->connect();

  ASSERT_TRUE(runUntil([&] { return error.has_value(); }));
  EXPECT_EQ(ErrorCode::Socket, error->code);
  EXPECT_NE(std::string::npos, error->message.find("connect() failed"));
  EXPECT_FALSE(transport_->isOpen());
}

TEST_F(TcpTransportTest, RefusedAddressFallsBackToNext) {
  LoopbackServer server;
  NiceMock<test::MockTransportCallbacks> callbacks;
  bool connected = false;
  EXPECT_CALL(callbacks, onTransportConnected()).WillOnce(Invoke([&]() {
    connected = true;
  }));
  EXPECT_CALL(callbacks, onTransportError(_)).Times(0);

  transport_ = std::make_unique<TcpTransport>(
      *dispatcher_, "dual.test", server.port(),
      fixedResolver({unusedPort(), server.port()}));
  transport_->setCallbacks(callbacks);
  transport_->connect();
  EXPECT_TRUE(transport_->isOpen());
  // Kept across the failed first attempt
  transport_->write("hello");

  ASSERT_TRUE(runUntil([&] {
    server.pollAccept();
    return connected && server.accepted() == 1;
  }));
  ASSERT_TRUE(runUntil([&] { return server.received(0) == "hello"; }));
}

TEST_F(TcpTransportTest, EveryAddressRefusedReportsOneError) {
  NiceMock<test::MockTransportCallbacks> callbacks;
  int errors = 0;
  optional<Error> error;
  EXPECT_CALL(callbacks, onTransportConnected()).Times(0);
  EXPECT_CALL(callbacks, onTransportError(_))
      .WillRepeatedly(Invoke([&](const Error& err) {
        ++errors;
        error = err;
      }));

  transport_ = std::make_unique<TcpTransport>(
      *dispatcher_, "dual.test", 80,
      fixedResolver({unusedPort(), unusedPort()}));
  transport_->setCallbacks(callbacks);
  transport_->connect();

  ASSERT_TRUE(runUntil([&] { return error.has_value(); }));
  test::runPending(*dispatcher_);
  EXPECT_EQ(1, errors);
  EXPECT_EQ(ErrorCode::Socket, error->code);
  EXPECT_NE(std::string::npos, error->message.find("connect() failed"));
  EXPECT_FALSE(transport_->isOpen());
}

TEST_F(TcpTransportTest, ResolverFailureIsReportedAsync) {
  NiceMock<test::MockTransportCallbacks> callbacks;
  optional<Error> error;
  EXPECT_CALL(callbacks, onTransportError(_))
      .WillOnce(Invoke([&](const Error& err) { error = err; }));

  transport_ = std::make_unique<TcpTransport>(
      *dispatcher_, "nowhere.test", 80,
      [](const std::string& host, uint16_t) -> Result<AddressList> {
        return makeError<AddressList>(
            socketError("Failed to resolve " + host + ": unknown host"));
      });
  transport_->setCallbacks(callbacks);
  transport_->connect();
  EXPECT_FALSE(error.has_value());

  ASSERT_TRUE(runUntil([&] { return error.has_value(); }));
  EXPECT_EQ("Failed to resolve nowhere.test: unknown host", error->message);
}

TEST_F(TcpTransportTest, CloseSuppressesPendingError) {
  NiceMock<test::MockTransportCallbacks> callbacks;
  EXPECT_CALL(callbacks, onTransportError(_)).Times(0);

  transport_ =
      std::make_unique<TcpTransport>(*dispatcher_, "127.0.0.1", unusedPort());
  transport_->setCallbacks(callbacks);
  transport_->connect();
  transport_->close();
  test::runPending(*dispatcher_);
}

TEST_F(TcpTransportTest, ReadAfterCloseFails) {
  transport_ =
      std::make_unique<TcpTransport>(*dispatcher_, "127.0.0.1", unusedPort());
  std::string buffer;
  auto result = transport_->read(buffer, 16);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(EBADF, result.error_code());
}

// ============================================================================
// Client over loopback
// ============================================================================

class LoopbackClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto factory = event::createLibeventDispatcherFactory();
    dispatcher_ = factory->createDispatcher("loopback-client");
    config_.host = "127.0.0.1";
    config_.port = server_.port();
  }

  void TearDown() override {
    client_.reset();
    test::runPending(*dispatcher_);
  }

  bool runUntil(const std::function<bool()>& condition) {
    return test::runUntil(*dispatcher_, condition);
  }

  bool waitForRequest(size_t connection, const std::string& expected) {
    return runUntil([this, connection, &expected] {
      server_.pollAccept();
      return server_.accepted() > connection &&
             server_.received(connection) == expected;
    });
  }

  struct Outcome {
    optional<Error> error;
    uint16_t status{0};
    std::string body;
    bool completed{false};
    optional<Error> body_error;
    bool done() const { return error || completed || body_error; }
  };

  std::shared_ptr<Outcome> submitGet(const std::string& path) {
    auto outcome = std::make_shared<Outcome>();
    client::RequestDescriptor descriptor;
    descriptor.method = "GET";
    descriptor.path = path;
    auto result = client_->submit(
        std::move(descriptor),
        [outcome](const optional<Error>& err,
                  optional<client::StartResponse> response)
            -> client::DeliverySink {
          if (err) {
            outcome->error = err;
            return nullptr;
          }
          outcome->status = response->status_code;
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
        });
    EXPECT_TRUE(isSuccess(result));
    return outcome;
  }

  std::string expectedHead(const std::string& path) {
    return "GET " + path + " HTTP/1.1\r\nhost: 127.0.0.1:" +
           std::to_string(server_.port()) +
           "\r\nconnection: keep-alive\r\n\r\n";
  }

  LoopbackServer server_;
  std::unique_ptr<event::Dispatcher> dispatcher_;
  config::ClientConfig config_;
  std::unique_ptr<client::Client> client_;
};

TEST_F(LoopbackClientTest, KeepAliveExchanges) {
  client_ = std::make_unique<client::Client>(*dispatcher_, config_);
  auto first = submitGet("/first");
  auto second = submitGet("/second");

  ASSERT_TRUE(waitForRequest(0, expectedHead("/first")));
  server_.send(0,
               "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
               "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
  ASSERT_TRUE(runUntil([&first] { return first->done(); }));
  EXPECT_TRUE(first->completed);
  EXPECT_EQ(200, first->status);
  EXPECT_EQ("hello world", first->body);

  ASSERT_TRUE(waitForRequest(0, expectedHead("/first") +
                                    expectedHead("/second")));
  server_.send(0, "HTTP/1.1 404 Not Found\r\nContent-Length: 4\r\n\r\nnope");
  ASSERT_TRUE(runUntil([&second] { return second->done(); }));
  EXPECT_TRUE(second->completed);
  EXPECT_EQ(404, second->status);
  EXPECT_EQ("nope", second->body);
  EXPECT_EQ(1u, server_.accepted());
}

TEST_F(LoopbackClientTest, ServerCloseLeadsToReconnect) {
  client_ = std::make_unique<client::Client>(*dispatcher_, config_);
  auto first = submitGet("/1");
  ASSERT_TRUE(waitForRequest(0, expectedHead("/1")));
  server_.send(0, "HTTP/1.1 200 OK\r\nConnection: close\r\n\r\nbye");
  server_.closeConnection(0);

  ASSERT_TRUE(runUntil([&first] { return first->done(); }));
  EXPECT_TRUE(first->completed);
  EXPECT_EQ("bye", first->body);

  auto second = submitGet("/2");
  ASSERT_TRUE(waitForRequest(1, expectedHead("/2")));
  server_.send(1, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
  ASSERT_TRUE(runUntil([&second] { return second->done(); }));
  EXPECT_TRUE(second->completed);
  EXPECT_EQ(2u, server_.accepted());
}

TEST_F(LoopbackClientTest, ConnectionRefusedFailsRequest) {
  config_.port = unusedPort();
  client_ = std::make_unique<client::Client>(*dispatcher_, config_);
  auto outcome = submitGet("/");
  ASSERT_TRUE(runUntil([&outcome] { return outcome->done(); }));
  ASSERT_TRUE(outcome->error.has_value());
  EXPECT_EQ(ErrorCode::Socket, outcome->error->code);
}

}  // namespace
}  // namespace network
}  // namespace conduit

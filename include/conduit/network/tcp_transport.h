#ifndef CONDUIT_NETWORK_TCP_TRANSPORT_H
#define CONDUIT_NETWORK_TCP_TRANSPORT_H

#include <sys/socket.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "conduit/core/result.h"
#include "conduit/event/event_loop.h"
#include "conduit/network/transport.h"

namespace conduit {
namespace network {

struct ResolvedAddress {
  sockaddr_storage address;
  socklen_t length;
};

using AddressList = std::vector<ResolvedAddress>;
using Resolver =
    std::function<Result<AddressList>(const std::string& host, uint16_t port)>;

// getaddrinfo() lookup for stream sockets, in resolver order
Result<AddressList> resolveAddresses(const std::string& host, uint16_t port);

/**
 * Non-blocking TCP client socket driven by an edge-triggered file event.
 *
 * connect() tries each resolved address in turn and only reports an error
 * once the last one failed, so "localhost" still reaches an IPv4-only
 * server when ::1 comes first.
 */
class TcpTransport : public Transport {
 public:
  TcpTransport(event::Dispatcher& dispatcher,
               const std::string& host,
               uint16_t port,
               Resolver resolver = resolveAddresses);
  ~TcpTransport() override;

  // Transport
  void setCallbacks(TransportCallbacks& callbacks) override {
    callbacks_ = &callbacks;
  }
  void connect() override;
  IoCallResult read(std::string& buffer, size_t max_length) override;
  void write(const std::string& data) override;
  void resumeReading() override;
  void close() override;
  bool isOpen() const override { return fd_ >= 0 || connecting_; }
  bool connected() const override { return connected_; }
  const std::string& hostname() const override { return host_; }

  size_t bufferedBytes() const { return write_buffer_.size(); }

 private:
  void onFileEvent(uint32_t events);
  void onConnectComplete();
  void connectNextAddress();
  void closeSocket();
  void flushWriteBuffer();
  void scheduleError(const std::string& message);
  void raiseError(const std::string& message);

  event::Dispatcher& dispatcher_;
  std::string host_;
  uint16_t port_;
  Resolver resolver_;
  AddressList addresses_;
  size_t next_address_{0};
  std::string last_connect_error_;
  event::SchedulableCallbackPtr retry_cb_;
  int fd_{-1};
  event::FileEventPtr file_event_;
  TransportCallbacks* callbacks_{nullptr};

  bool connecting_{false};
  bool connected_{false};
  optional<std::string> deferred_error_;
  event::SchedulableCallbackPtr error_cb_;
  std::string write_buffer_;
};

TransportFactory createTcpTransportFactory(event::Dispatcher& dispatcher,
                                           const std::string& host,
                                           uint16_t port);

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_TCP_TRANSPORT_H

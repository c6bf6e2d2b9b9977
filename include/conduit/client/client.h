#ifndef CONDUIT_CLIENT_CLIENT_H
#define CONDUIT_CLIENT_CLIENT_H

#include <atomic>
#include <memory>
#include <string>

#include "conduit/client/connection_pipeline.h"
#include "conduit/client/request.h"
#include "conduit/config/client_config.h"
#include "conduit/core/result.h"
#include "conduit/event/event_loop.h"
#include "conduit/network/transport.h"

namespace conduit {
namespace client {

/**
 * HTTP/1.1 client bound to one origin.
 *
 * Owns one connection pipeline. Must be created, used and destroyed on the
 * dispatcher thread.
 */
class Client {
 public:
  // Connects over TCP to config.host:config.port
  Client(event::Dispatcher& dispatcher, const config::ClientConfig& config);

  // Uses the given factory for every connection the client opens
  Client(event::Dispatcher& dispatcher,
         const config::ClientConfig& config,
         network::TransportFactory transport_factory);

  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * Validates and queues a request.
   *
   * Returns the validation error synchronously; the descriptor is then
   * never queued and the callback never fires. On success the callback
   * fires exactly once, from the dispatcher, never from inside submit.
   */
  VoidResult submit(RequestDescriptor descriptor, StartCallback callback);

  // Fails everything outstanding with ConnectionClosed; later submissions
  // fail the same way
  void close();

  size_t pending() const { return pipeline_->pending(); }
  size_t running() const { return pipeline_->running(); }
  bool connected() const { return pipeline_->connected(); }
  bool closed() const { return pipeline_->state() == PipelineState::Closed; }

  // Value used for synthesized host headers: host, plus :port when not 80
  const std::string& hostname() const { return target_.host_header; }
  const RequestTarget& target() const { return target_; }
  const std::string& connectionId() const { return pipeline_->connectionId(); }
  const config::ClientConfig& config() const { return config_; }

 private:
  static std::string nextConnectionId();

  event::Dispatcher& dispatcher_;
  config::ClientConfig config_;
  RequestTarget target_;
  ConnectionPipelinePtr pipeline_;
};

using ClientPtr = std::unique_ptr<Client>;

}  // namespace client
}  // namespace conduit

#endif  // CONDUIT_CLIENT_CLIENT_H
